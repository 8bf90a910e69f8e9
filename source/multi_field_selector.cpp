// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file multi_field_selector.cpp
/// @brief Implementation of MultiFieldSelector (a prefix tree of paths).

#include <recdiff/multi_field_selector.h>

namespace recdiff {

namespace {

bool is_any_key(const PathElement& elem) noexcept
{
    return std::holds_alternative<std::monostate>(elem);
}

} // namespace

MultiFieldSelector::MultiFieldSelector(std::initializer_list<FieldSelector> selectors)
{
    for (const auto& fs : selectors) {
        add(fs);
    }
}

MultiFieldSelector::MultiFieldSelector(const std::vector<FieldSelector>& selectors)
{
    for (const auto& fs : selectors) {
        add(fs);
    }
}

MultiFieldSelector MultiFieldSelector::all()
{
    MultiFieldSelector result;
    result.all_ = true;
    return result;
}

void MultiFieldSelector::add(const FieldSelector& selector)
{
    MultiFieldSelector* node = this;
    for (const auto& elem : selector) {
        if (node->all_) return;

        std::size_t i = 0;
        while (i < node->keys_.size() && node->keys_[i] != elem) ++i;
        if (i == node->keys_.size()) {
            node->keys_.push_back(elem);
            node->children_.emplace_back();
        }
        node = &node->children_[i];
    }

    // A selected node covers its whole subtree
    node->all_ = true;
    node->keys_.clear();
    node->children_.clear();
}

const MultiFieldSelector* MultiFieldSelector::child(const PathElement& elem) const
{
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == elem) return &children_[i];
    }
    return nullptr;
}

// ============================================================
// Queries
// ============================================================

bool MultiFieldSelector::contains(const FieldSelector& fs) const
{
    return contains_from(fs, 0);
}

bool MultiFieldSelector::contains_from(const FieldSelector& fs, std::size_t pos) const
{
    if (all_) return true;
    if (pos == fs.size()) return !empty();

    const PathElement& elem = fs[pos];
    if (!is_any_key(elem)) {
        if (auto* exact = child(elem); exact && exact->contains_from(fs, pos + 1)) {
            return true;
        }
    }
    if (auto* wildcard = child(PathElement{}); wildcard && wildcard->contains_from(fs, pos + 1)) {
        return true;
    }
    return false;
}

MultiFieldSelector MultiFieldSelector::at(const PathElement& elem) const
{
    if (all_) return all();

    MultiFieldSelector result = any();
    if (!is_any_key(elem)) {
        if (auto* exact = child(elem)) {
            result.merge(*exact);
        }
    }
    return result;
}

MultiFieldSelector MultiFieldSelector::at(const FieldSelector& prefix) const
{
    MultiFieldSelector result = *this;
    for (const auto& elem : prefix) {
        if (result.all_ || result.empty()) break;
        result = result.at(elem);
    }
    return result;
}

MultiFieldSelector MultiFieldSelector::any() const
{
    if (all_) return all();
    if (auto* wildcard = child(PathElement{})) return *wildcard;
    return MultiFieldSelector{};
}

void MultiFieldSelector::merge(const MultiFieldSelector& other)
{
    if (all_) return;
    if (other.all_) {
        all_ = true;
        keys_.clear();
        children_.clear();
        return;
    }
    for (std::size_t i = 0; i < other.keys_.size(); ++i) {
        std::size_t j = 0;
        while (j < keys_.size() && keys_[j] != other.keys_[i]) ++j;
        if (j == keys_.size()) {
            keys_.push_back(other.keys_[i]);
            children_.push_back(other.children_[i]);
        } else {
            children_[j].merge(other.children_[i]);
        }
    }
}

std::vector<FieldSelector> MultiFieldSelector::selectors() const
{
    std::vector<FieldSelector> out;
    FieldSelector prefix;
    collect(prefix, out);
    return out;
}

void MultiFieldSelector::collect(FieldSelector& prefix, std::vector<FieldSelector>& out) const
{
    if (all_) {
        out.push_back(prefix);
        return;
    }
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        prefix.push_back(keys_[i]);
        children_[i].collect(prefix, out);
        prefix.pop_back();
    }
}

std::string MultiFieldSelector::path() const
{
    std::string result = "{";
    bool first = true;
    for (const auto& fs : selectors()) {
        if (!first) result += ", ";
        result += fs.path();
        first = false;
    }
    result += "}";
    return result;
}

} // namespace recdiff
