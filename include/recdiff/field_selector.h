// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file field_selector.h
/// @brief FieldSelector - an owning path into a record tree.
///
/// A FieldSelector is an ordered list of PathElements: field names and
/// mapping keys (strings), sequence and list positions (indices), or the
/// null key (std::monostate) shared by every item of an unordered set.
///
/// ```cpp
/// FieldSelector fs{"people", std::size_t{0}, "name"};
/// fs.path();                      // ".people[0].name"
/// (fs + "first").size();          // 4
/// fs.startswith({"people"});      // true
/// ```

#pragma once

#include <recdiff/api.h>
#include <recdiff/value.h>

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace recdiff {

class RECDIFF_API FieldSelector {
public:
    using value_type = PathElement;
    using const_iterator = std::vector<PathElement>::const_iterator;
    using iterator = const_iterator;
    using size_type = std::size_t;

    FieldSelector() = default;

    FieldSelector(std::initializer_list<PathElement> init)
        : elements_(init)
    {}

    explicit FieldSelector(std::vector<PathElement> elements)
        : elements_(std::move(elements))
    {}

    // ============================================================
    // Modifiers
    // ============================================================

    FieldSelector& push_back(PathElement elem) {
        elements_.push_back(std::move(elem));
        return *this;
    }

    void pop_back() {
        if (!elements_.empty()) elements_.pop_back();
    }

    void clear() noexcept { elements_.clear(); }

    // ============================================================
    // Concatenation
    // ============================================================

    /// New selector with one more component
    [[nodiscard]] FieldSelector operator+(const PathElement& elem) const;

    [[nodiscard]] FieldSelector operator+(const std::string& key) const { return *this + PathElement{key}; }
    [[nodiscard]] FieldSelector operator+(const char* key) const { return *this + PathElement{std::string{key}}; }
    [[nodiscard]] FieldSelector operator+(std::size_t index) const { return *this + PathElement{index}; }

    /// New selector with all of `other`'s components appended
    [[nodiscard]] FieldSelector operator+(const FieldSelector& other) const;

    // ============================================================
    // Access
    // ============================================================

    [[nodiscard]] const_iterator begin() const noexcept { return elements_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return elements_.end(); }

    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }

    [[nodiscard]] const PathElement& operator[](std::size_t i) const noexcept { return elements_[i]; }
    [[nodiscard]] const PathElement& front() const noexcept { return elements_.front(); }
    [[nodiscard]] const PathElement& back() const noexcept { return elements_.back(); }

    [[nodiscard]] const std::vector<PathElement>& elements() const noexcept { return elements_; }

    // ============================================================
    // Queries
    // ============================================================

    /// True if `prefix` is a (non-strict) prefix of this selector
    [[nodiscard]] bool startswith(const FieldSelector& prefix) const noexcept;

    /// Dot notation: ".people[0].name", "[*]" for the null key, "(root)" when empty
    [[nodiscard]] std::string path() const;

    [[nodiscard]] bool operator==(const FieldSelector& other) const = default;
    [[nodiscard]] std::strong_ordering operator<=>(const FieldSelector& other) const;

private:
    std::vector<PathElement> elements_;
};

} // namespace recdiff
