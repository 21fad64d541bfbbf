/**
 * @file ldif_entry.cpp
 * @brief LDIF entry record implementation
 */

#include "ldiftap/ldif/ldif_entry.h"
#include "ldiftap/utils/string_utils.h"
#include <utility>

namespace ldiftap {
namespace ldif {

namespace {

Json::Value textValue(const std::string& value) {
    if (utils::isValidUtf8(value)) {
        return Json::Value(value);
    }
    return Json::Value(utils::toBase64(value));
}

} // anonymous namespace

void AttributeMap::add(const std::string& name, std::string value) {
    auto it = values_.find(name);
    if (it != values_.end()) {
        it->second.append(std::move(value));
        return;
    }
    values_.emplace(name, AttributeValue(std::move(value)));
    order_.push_back(name);
}

bool AttributeMap::contains(const std::string& name) const {
    return values_.find(name) != values_.end();
}

const AttributeValue* AttributeMap::find(const std::string& name) const {
    auto it = values_.find(name);
    return it != values_.end() ? &it->second : nullptr;
}

AttributeValue* AttributeMap::find(const std::string& name) {
    auto it = values_.find(name);
    return it != values_.end() ? &it->second : nullptr;
}

void AttributeMap::normalize() {
    for (auto& [name, value] : values_) {
        value.normalize();
    }
}

Json::Value LdifEntry::toJson() const {
    Json::Value record;
    record["dn"] = textValue(dn);

    Json::Value attrs(Json::objectValue);
    for (const auto& name : attributes.names()) {
        const AttributeValue* value = attributes.find(name);
        if (value->isMulti()) {
            Json::Value list(Json::arrayValue);
            for (const auto& item : value->values()) {
                list.append(textValue(item));
            }
            attrs[name] = list;
        } else {
            attrs[name] = textValue(value->first());
        }
    }
    record["attributes"] = attrs;

    Json::Value classes(Json::arrayValue);
    for (const auto& oc : objectClass) {
        classes.append(textValue(oc));
    }
    record["object_class"] = classes;

    record["change_type"] = changeType ? textValue(*changeType) : Json::Value(Json::nullValue);
    record["source_file"] = sourceFile;
    record["line_number"] = lineNumber;
    record["entry_size"] = static_cast<Json::UInt64>(entrySize);

    return record;
}

} // namespace ldif
} // namespace ldiftap
