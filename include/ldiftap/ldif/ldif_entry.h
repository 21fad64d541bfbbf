/**
 * @file ldif_entry.h
 * @brief LDIF entry record produced by the parser
 */

#pragma once

#include "ldiftap/ldif/attribute_value.h"
#include <json/json.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ldiftap {
namespace ldif {

/**
 * @brief Insertion-ordered mapping from lower-case attribute name to value
 */
class AttributeMap {
public:
    /**
     * @brief Store a value; a repeated name appends (promotes to list)
     */
    void add(const std::string& name, std::string value);

    bool contains(const std::string& name) const;

    /**
     * @return Pointer to the stored value, nullptr if absent
     */
    const AttributeValue* find(const std::string& name) const;
    AttributeValue* find(const std::string& name);

    /**
     * @brief Attribute names in first-seen order
     */
    const std::vector<std::string>& names() const { return order_; }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    /**
     * @brief Collapse every single-element list to a scalar
     */
    void normalize();

private:
    std::vector<std::string> order_;
    std::map<std::string, AttributeValue> values_;
};

/**
 * @brief LDIF entry
 *
 * Output record shape:
 *   dn, attributes, object_class, change_type, source_file,
 *   line_number, entry_size
 */
struct LdifEntry {
    std::string dn;                          // Distinguished Name (trimmed)
    AttributeMap attributes;                 // Filtered attributes
    std::vector<std::string> objectClass;    // Every objectClass value, unfiltered
    std::optional<std::string> changeType;   // From "changetype", if present
    std::string sourceFile;                  // Path of the LDIF file
    int lineNumber = 0;                      // 1-based line of the dn: line
    size_t entrySize = 0;                    // Raw bytes of all lines incl. terminators

    /**
     * @brief Convert to the output record
     *
     * Strings that are not valid UTF-8 (DN, attribute values, object
     * classes, change type) are emitted as base64 text.
     */
    Json::Value toJson() const;
};

} // namespace ldif
} // namespace ldiftap
