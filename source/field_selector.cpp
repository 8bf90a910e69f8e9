// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file field_selector.cpp
/// @brief Implementation of FieldSelector.

#include <recdiff/field_selector.h>

#include <algorithm>

namespace recdiff {

FieldSelector FieldSelector::operator+(const PathElement& elem) const
{
    FieldSelector result{*this};
    result.elements_.push_back(elem);
    return result;
}

FieldSelector FieldSelector::operator+(const FieldSelector& other) const
{
    FieldSelector result;
    result.elements_.reserve(elements_.size() + other.elements_.size());
    result.elements_.insert(result.elements_.end(), elements_.begin(), elements_.end());
    result.elements_.insert(result.elements_.end(), other.elements_.begin(), other.elements_.end());
    return result;
}

bool FieldSelector::startswith(const FieldSelector& prefix) const noexcept
{
    if (prefix.size() > size()) return false;
    return std::equal(prefix.elements_.begin(), prefix.elements_.end(), elements_.begin());
}

std::string FieldSelector::path() const
{
    if (elements_.empty()) return "(root)";

    std::string result;
    for (const auto& elem : elements_) {
        result += path_element_to_string(elem);
    }
    return result;
}

std::strong_ordering FieldSelector::operator<=>(const FieldSelector& other) const
{
    return std::lexicographical_compare_three_way(
        elements_.begin(), elements_.end(),
        other.elements_.begin(), other.elements_.end());
}

} // namespace recdiff
