// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change.cpp
/// @brief ChangeKind conversions and ChangeEntry rendering.

#include <recdiff/change.h>

#include <array>

namespace recdiff {

namespace {

struct KindNames {
    ChangeKind kind;
    std::string_view token;
    std::string_view display;
};

constexpr std::array<KindNames, 4> kKindNames{{
    {ChangeKind::Unchanged, "none",     "UNCHANGED"},
    {ChangeKind::Added,     "added",    "ADDED"},
    {ChangeKind::Removed,   "removed",  "REMOVED"},
    {ChangeKind::Modified,  "modified", "MODIFIED"},
}};

} // namespace

ChangeKind change_kind_from_index(int index)
{
    if (index < to_index(ChangeKind::Unchanged) || index > to_index(ChangeKind::Modified)) {
        throw InvalidChangeKind("invalid change kind index: " + std::to_string(index));
    }
    return static_cast<ChangeKind>(index);
}

ChangeKind change_kind_from_string(std::string_view token)
{
    for (const auto& names : kKindNames) {
        if (token == names.token || token == names.display) return names.kind;
    }
    throw InvalidChangeKind("invalid change kind: '" + std::string{token} + "'");
}

std::string_view to_token(ChangeKind kind) noexcept
{
    for (const auto& names : kKindNames) {
        if (names.kind == kind) return names.token;
    }
    return {};
}

std::string_view display_name(ChangeKind kind) noexcept
{
    for (const auto& names : kKindNames) {
        if (names.kind == kind) return names.display;
    }
    return {};
}

std::ostream& operator<<(std::ostream& os, ChangeKind kind)
{
    return os << display_name(kind);
}

// ============================================================
// ChangeEntry
// ============================================================

std::string ChangeEntry::path() const
{
    if (base.startswith(other)) return base.path();
    if (other.startswith(base)) return other.path();
    return "(" + base.path() + "/" + other.path() + ")";
}

std::string ChangeEntry::to_string() const
{
    return "<ChangeEntry: " + std::string{display_name(kind)} + " " + path() + ">";
}

std::ostream& operator<<(std::ostream& os, const ChangeEntry& entry)
{
    return os << entry.to_string();
}

} // namespace recdiff
