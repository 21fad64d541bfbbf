/**
 * @file attribute_value.cpp
 * @brief AttributeValue implementation
 */

#include "ldiftap/ldif/attribute_value.h"
#include <utility>

namespace ldiftap {
namespace ldif {

AttributeValue::AttributeValue(std::string value)
    : value_(std::move(value)) {}

size_t AttributeValue::size() const {
    if (auto* list = std::get_if<Multi>(&value_)) {
        return list->size();
    }
    return 1;
}

void AttributeValue::append(std::string value) {
    if (auto* list = std::get_if<Multi>(&value_)) {
        list->push_back(std::move(value));
        return;
    }

    Multi promoted;
    promoted.push_back(std::move(std::get<Single>(value_)));
    promoted.push_back(std::move(value));
    value_ = std::move(promoted);
}

void AttributeValue::normalize() {
    auto* list = std::get_if<Multi>(&value_);
    if (list && list->size() == 1) {
        Single scalar = std::move(list->front());
        value_ = std::move(scalar);
    }
}

const std::string& AttributeValue::first() const {
    if (auto* list = std::get_if<Multi>(&value_)) {
        return list->front();
    }
    return std::get<Single>(value_);
}

std::vector<std::string> AttributeValue::values() const {
    if (auto* list = std::get_if<Multi>(&value_)) {
        return *list;
    }
    return {std::get<Single>(value_)};
}

} // namespace ldif
} // namespace ldiftap
