// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_options.h
/// @brief Comparison options and the value normalization policy.
///
/// DiffOptions is immutable for the duration of a diff run and is passed
/// around as std::shared_ptr<const DiffOptions>, so one instance can serve
/// several concurrent runs. DiffFlags is the inline form: every option is
/// optional, so a caller can override just a few of them:
///
/// @code
///   auto entries = diff(a, b, {.ignore_case = true, .unchanged = true});
///
///   auto opts = std::make_shared<DiffOptions>();
///   opts->duck_type = true;
///   auto stream = diff_iter(a, b, opts);
/// @endcode
///
/// Text normalization runs in a fixed order: whitespace, case, Unicode NFC.
/// Case folding and NFC go through Boost.Locale; the locale is generated
/// once from RECDIFF_TEXT_LOCALE.

#pragma once

#include <recdiff/api.h>
#include <recdiff/field_selector.h>
#include <recdiff/multi_field_selector.h>
#include <recdiff/record_type.h>
#include <recdiff/value.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace recdiff {

/// Identity of a collection item: the identity value and the number of
/// columns it was built from (1 for a scalar identity, n for an n-tuple)
struct ItemIdentity {
    Value value;
    std::size_t arity = 1;
};

/// Equality override applied to normalized leaf values
using ItemsEqualFn = std::function<bool(const Value& a, const Value& b)>;

/// Identity override for keyed collection items.
/// Arguments: the item, the declared item type to read it as (may be null),
/// the selector restricting identity columns (may be null) and the options.
using RecordIdFn = std::function<ItemIdentity(const Value& item,
                                              const RecordType* declared_type,
                                              const MultiFieldSelector* selector,
                                              const DiffOptions& options)>;

/// Inline option overrides; an unset member keeps the DiffOptions default
struct DiffFlags {
    std::optional<bool> ignore_ws;
    std::optional<bool> ignore_case;
    std::optional<bool> unicode_normal;
    std::optional<bool> unchanged;
    std::optional<bool> ignore_empty_slots;
    std::optional<bool> duck_type;
    std::optional<bool> extraneous;
    std::optional<MultiFieldSelector> compare_filter;
    ItemsEqualFn items_equal;
    RecordIdFn record_id;

    [[nodiscard]] bool empty() const noexcept {
        return !ignore_ws && !ignore_case && !unicode_normal && !unchanged &&
               !ignore_empty_slots && !duck_type && !extraneous && !compare_filter &&
               !items_equal && !record_id;
    }
};

class RECDIFF_API DiffOptions {
public:
    bool ignore_ws = true;            ///< collapse whitespace runs and trim text
    bool ignore_case = false;         ///< compare text upper-cased
    bool unicode_normal = true;       ///< compare text in NFC
    bool unchanged = false;           ///< also report Unchanged entries
    bool ignore_empty_slots = false;  ///< treat "" and null as not set
    bool duck_type = false;           ///< compare records of different types by field name
    bool extraneous = false;          ///< include fields marked extraneous
    std::optional<MultiFieldSelector> compare_filter;  ///< only compare these paths
    ItemsEqualFn items_equal;
    RecordIdFn record_id;

    DiffOptions() = default;

    /// Defaults overridden by every member `flags` sets
    explicit DiffOptions(const DiffFlags& flags);

    // ============================================================
    // Text normalization
    // ============================================================

    /// Collapse runs of Unicode White_Space to a single ASCII space and trim
    [[nodiscard]] std::string normalize_whitespace(std::string_view text) const;

    [[nodiscard]] std::string normalize_case(std::string_view text) const;

    /// Unicode Normalization Form C
    [[nodiscard]] std::string normalize_unf(std::string_view text) const;

    /// All enabled text steps, in order
    [[nodiscard]] std::string normalize_text(std::string_view text) const;

    // ============================================================
    // Value normalization
    // ============================================================

    /// True for the empty string and null
    [[nodiscard]] bool value_is_empty(const Value& val) const noexcept;

    /// Normalize a slot: text steps, then empty -> Absent when ignore_empty_slots
    [[nodiscard]] Slot normalize_val(Slot val) const;

    /// normalize_val after the field's compare_as hook (the hook never sees Absent)
    [[nodiscard]] Slot normalize_slot(Slot val, const FieldMeta* meta) const;

    /// normalize_val after the collection's compare_item_as hook
    [[nodiscard]] Slot normalize_item(Slot val, const CollectionType* type) const;

    // ============================================================
    // Comparison helpers
    // ============================================================

    /// True if a filter is set and `fs` is outside of it
    [[nodiscard]] bool is_filtered(const FieldSelector& fs) const;

    /// items_equal if set, structural == otherwise
    [[nodiscard]] bool items_are_equal(const Value& a, const Value& b) const;

    /// Selector for the identity columns of the items of the collection at
    /// `collection_path`; std::nullopt when no filter is set
    [[nodiscard]] std::optional<MultiFieldSelector> identity_selector(const FieldSelector& collection_path) const;

    /// record_id override if set, recdiff::record_id otherwise
    [[nodiscard]] ItemIdentity item_identity(const Value& item,
                                             const RecordType* declared_type,
                                             const MultiFieldSelector* selector,
                                             const CollectionType* container) const;
};

using DiffOptionsPtr = std::shared_ptr<const DiffOptions>;

} // namespace recdiff
