/**
 * @file attribute_value.h
 * @brief Single- or multi-valued LDIF attribute value
 */

#pragma once

#include <string>
#include <variant>
#include <vector>

namespace ldiftap {
namespace ldif {

/**
 * @brief Attribute value: either a single string or an ordered list
 *
 * A value starts as Single. Appending a second value promotes it to
 * Multi; later values append to the list. Values are never overwritten.
 */
class AttributeValue {
public:
    using Single = std::string;
    using Multi = std::vector<std::string>;

    explicit AttributeValue(std::string value);

    bool isMulti() const { return std::holds_alternative<Multi>(value_); }

    /**
     * @brief Number of stored values (1 for Single)
     */
    size_t size() const;

    /**
     * @brief Add another value, promoting Single to Multi
     */
    void append(std::string value);

    /**
     * @brief Collapse a one-element list back to a scalar
     */
    void normalize();

    const std::string& first() const;

    /**
     * @brief All values in insertion order (copy for Single)
     */
    std::vector<std::string> values() const;

    const std::variant<Single, Multi>& raw() const { return value_; }

    bool operator==(const AttributeValue& other) const { return value_ == other.value_; }
    bool operator!=(const AttributeValue& other) const { return !(*this == other); }

private:
    std::variant<Single, Multi> value_;
};

} // namespace ldif
} // namespace ldiftap
