// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file multi_field_selector.h
/// @brief MultiFieldSelector - a set of paths into a record tree.
///
/// Built from a list of FieldSelectors and stored as a tree. A std::monostate
/// component in a selector means "any key" (every sequence position, every
/// mapping key, every collection item). A selector that ends at a node
/// selects that node's whole subtree.
///
/// ```cpp
/// MultiFieldSelector mfs{{"name"}, {"people", PathElement{}, "id"}};
/// mfs.contains({"name", "first"});          // true (inside .name)
/// mfs.contains({"people"});                 // true (ancestor of a selected path)
/// mfs.contains({"people", std::size_t{3}}); // true
/// mfs.contains({"age"});                    // false
/// mfs.at("people").any().contains({"id"});  // true
/// ```

#pragma once

#include <recdiff/api.h>
#include <recdiff/field_selector.h>
#include <recdiff/value.h>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace recdiff {

class RECDIFF_API MultiFieldSelector {
public:
    /// Selects nothing
    MultiFieldSelector() = default;

    MultiFieldSelector(std::initializer_list<FieldSelector> selectors);
    explicit MultiFieldSelector(const std::vector<FieldSelector>& selectors);

    /// Selects everything
    [[nodiscard]] static MultiFieldSelector all();

    /// Add a path; the empty path selects everything
    void add(const FieldSelector& selector);

    // ============================================================
    // Queries
    // ============================================================

    /// True if `fs` lies inside a selected subtree, or is an ancestor of a
    /// selected path (so that traversal can reach it)
    [[nodiscard]] bool contains(const FieldSelector& fs) const;

    /// Sub-selector below one concrete path component. Combines the exact
    /// branch with the "any key" branch.
    [[nodiscard]] MultiFieldSelector at(const PathElement& elem) const;

    [[nodiscard]] MultiFieldSelector at(const std::string& key) const { return at(PathElement{key}); }
    [[nodiscard]] MultiFieldSelector at(const char* key) const { return at(PathElement{std::string{key}}); }
    [[nodiscard]] MultiFieldSelector at(std::size_t index) const { return at(PathElement{index}); }

    /// Sub-selector below a whole path
    [[nodiscard]] MultiFieldSelector at(const FieldSelector& prefix) const;

    /// Sub-selector that applies to every key (only the "any key" branch)
    [[nodiscard]] MultiFieldSelector any() const;

    [[nodiscard]] bool selects_all() const noexcept { return all_; }
    [[nodiscard]] bool empty() const noexcept { return !all_ && keys_.empty(); }

    /// The selected paths, in the order they were first added
    [[nodiscard]] std::vector<FieldSelector> selectors() const;

    /// "{.a, .b[*].c}" style listing
    [[nodiscard]] std::string path() const;

private:
    bool contains_from(const FieldSelector& fs, std::size_t pos) const;
    void merge(const MultiFieldSelector& other);
    void collect(FieldSelector& prefix, std::vector<FieldSelector>& out) const;
    const MultiFieldSelector* child(const PathElement& elem) const;

    bool all_ = false;
    std::vector<PathElement> keys_;
    std::vector<MultiFieldSelector> children_;
};

} // namespace recdiff
