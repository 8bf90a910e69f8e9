// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change.h
/// @brief ChangeKind and ChangeEntry - one reported difference.

#pragma once

#include <recdiff/api.h>
#include <recdiff/field_selector.h>

#include <compare>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace recdiff {

/// Kind of a reported difference. Ordered: Unchanged < Added < Removed < Modified.
enum class ChangeKind : int {
    Unchanged = 1,
    Added     = 2,
    Removed   = 3,
    Modified  = 4,
};

/// Raised for an unknown ChangeKind index, token or name
class RECDIFF_API InvalidChangeKind : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Kind from its index (1..4)
/// @throws InvalidChangeKind
[[nodiscard]] RECDIFF_API ChangeKind change_kind_from_index(int index);

/// Kind from a canonical token ("none", "added", "removed", "modified") or a
/// display name ("UNCHANGED", "ADDED", "REMOVED", "MODIFIED")
/// @throws InvalidChangeKind
[[nodiscard]] RECDIFF_API ChangeKind change_kind_from_string(std::string_view token);

[[nodiscard]] constexpr int to_index(ChangeKind kind) noexcept { return static_cast<int>(kind); }
[[nodiscard]] RECDIFF_API std::string_view to_token(ChangeKind kind) noexcept;
[[nodiscard]] RECDIFF_API std::string_view display_name(ChangeKind kind) noexcept;

RECDIFF_API std::ostream& operator<<(std::ostream& os, ChangeKind kind);

/// One difference between two trees.
///
/// Both paths are always present. An Added item of a collection has `base`
/// pointing at the parent collection, a Removed item has `other` pointing
/// at the parent.
struct RECDIFF_API ChangeEntry {
    ChangeKind kind = ChangeKind::Unchanged;
    FieldSelector base;
    FieldSelector other;

    /// The path shown to users: the common path, the longer path when one is
    /// a prefix of the other, or "(base/other)"
    [[nodiscard]] std::string path() const;

    /// "<ChangeEntry: MODIFIED .people[0].name>"
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const ChangeEntry& rhs) const = default;
};

RECDIFF_API std::ostream& operator<<(std::ostream& os, const ChangeEntry& entry);

} // namespace recdiff
