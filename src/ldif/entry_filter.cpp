/**
 * @file entry_filter.cpp
 * @brief Attribute and entry filtering implementation
 */

#include "ldiftap/ldif/entry_filter.h"
#include "ldiftap/utils/string_utils.h"
#include <algorithm>

namespace ldiftap {
namespace ldif {

namespace {

std::set<std::string> foldSet(const std::vector<std::string>& names) {
    std::set<std::string> result;
    for (const auto& name : names) {
        std::string folded = utils::toLower(utils::trim(name));
        if (!folded.empty()) {
            result.insert(folded);
        }
    }
    return result;
}

} // anonymous namespace

const std::vector<std::string>& defaultOperationalAttributes() {
    static const std::vector<std::string> names = {
        "createtimestamp",
        "creatorsname",
        "modifytimestamp",
        "modifiersname",
        "structuralobjectclass",
        "governingstructurerule",
        "entrydn",
        "entryuuid",
        "entrycsn",
        "contextcsn",
        "pwdchangedtime",
        "pwdaccountlockedtime",
        "pwdfailuretime",
        "pwdhistory",
        "pwdgraceusetime",
    };
    return names;
}

EntryFilter::EntryFilter(const FilterConfig& config)
    : operationalAttributes_(foldSet(config.operationalAttributes)),
      includeOperationalAttributes_(config.includeOperationalAttributes) {
    if (config.baseDnFilter) {
        std::string folded = utils::toLower(utils::trim(*config.baseDnFilter));
        if (!folded.empty()) {
            baseDnFilter_ = folded;
        }
    }
    if (config.objectClassFilter) {
        objectClassFilter_ = foldSet(*config.objectClassFilter);
    }
    if (config.attributeFilter) {
        // An empty allow-list does not filter
        attributeFilter_ = foldSet(*config.attributeFilter);
        hasAttributeFilter_ = !attributeFilter_.empty();
    }
    if (config.excludeAttributes) {
        excludeAttributes_ = foldSet(*config.excludeAttributes);
    }
}

bool EntryFilter::acceptsAttribute(const std::string& name) const {
    if (hasAttributeFilter_ && attributeFilter_.count(name) == 0) {
        return false;
    }
    if (excludeAttributes_.count(name) > 0) {
        return false;
    }
    if (!includeOperationalAttributes_ && operationalAttributes_.count(name) > 0) {
        return false;
    }
    return true;
}

bool EntryFilter::acceptsEntry(const LdifEntry& entry) const {
    if (entry.dn.empty()) {
        return false;
    }
    if (baseDnFilter_ && !matchesBaseDn(entry.dn)) {
        return false;
    }
    if (!objectClassFilter_.empty() && !matchesObjectClass(entry.objectClass)) {
        return false;
    }
    return true;
}

void EntryFilter::finalize(LdifEntry& entry) const {
    entry.attributes.normalize();
}

bool EntryFilter::matchesBaseDn(const std::string& dn) const {
    return utils::endsWithIgnoreCase(dn, *baseDnFilter_);
}

bool EntryFilter::matchesObjectClass(const std::vector<std::string>& objectClasses) const {
    return std::any_of(objectClasses.begin(), objectClasses.end(),
                       [this](const std::string& oc) {
                           return objectClassFilter_.count(utils::toLower(utils::trim(oc))) > 0;
                       });
}

} // namespace ldif
} // namespace ldiftap
