/**
 * @file entry_filter.h
 * @brief Attribute and entry filtering applied while assembling entries
 */

#pragma once

#include "ldiftap/ldif/ldif_entry.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ldiftap {
namespace ldif {

/**
 * @brief Operational attributes suppressed unless explicitly included
 */
const std::vector<std::string>& defaultOperationalAttributes();

/**
 * @brief Parser-facing filter and strictness settings
 */
struct FilterConfig {
    std::optional<std::string> baseDnFilter;                   // DN suffix, case-insensitive
    std::optional<std::vector<std::string>> objectClassFilter; // OR-matched
    std::optional<std::vector<std::string>> attributeFilter;   // Allow-list
    std::optional<std::vector<std::string>> excludeAttributes; // Deny-list
    std::vector<std::string> operationalAttributes = defaultOperationalAttributes();
    bool includeOperationalAttributes = false;
    bool strictParsing = true;
    std::string encoding = "utf-8";
};

/**
 * @brief Applies FilterConfig to attribute values and whole entries
 *
 * Name lists are case-folded once at construction; callers pass
 * lower-case attribute names.
 */
class EntryFilter {
public:
    explicit EntryFilter(const FilterConfig& config);

    /**
     * @brief Decide whether a value of this attribute is stored
     *
     * Allow-list, deny-list and operational checks are independent;
     * any one of them rejecting the name discards the value.
     */
    bool acceptsAttribute(const std::string& name) const;

    /**
     * @brief Decide whether a finalized entry is yielded
     *
     * Entries with an empty DN are never accepted.
     */
    bool acceptsEntry(const LdifEntry& entry) const;

    /**
     * @brief Normalize a finalized entry (single-element lists to scalars)
     */
    void finalize(LdifEntry& entry) const;

private:
    bool matchesBaseDn(const std::string& dn) const;
    bool matchesObjectClass(const std::vector<std::string>& objectClasses) const;

    std::optional<std::string> baseDnFilter_;
    std::set<std::string> objectClassFilter_;
    bool hasAttributeFilter_ = false;
    std::set<std::string> attributeFilter_;
    std::set<std::string> excludeAttributes_;
    std::set<std::string> operationalAttributes_;
    bool includeOperationalAttributes_ = false;
};

} // namespace ldif
} // namespace ldiftap
