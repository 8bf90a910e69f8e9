// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record_id.h
/// @brief Identity of collection items.
///
/// Two items of a keyed collection are "the same item" when their identities
/// are equal, whatever their position or their other fields. A record's
/// identity is built from its primary key columns, or from all of its
/// comparable fields when it declares none. Anything else is identified by
/// its normalized value.

#pragma once

#include <recdiff/api.h>
#include <recdiff/diff_options.h>
#include <recdiff/value.h>

#include <string>

namespace recdiff {

/// Identity of a collection item.
///
/// @param item           the item
/// @param declared_type  type to read a record item as; null = the item's own type
/// @param selector       restricts identity columns; null = no restriction
/// @param options        normalization applied to each column
/// @param container      collection whose compare_item_as hook applies to
///                       non-record items; may be null
[[nodiscard]] RECDIFF_API ItemIdentity record_id(const Value& item,
                                                 const RecordType* declared_type,
                                                 const MultiFieldSelector* selector,
                                                 const DiffOptions& options,
                                                 const CollectionType* container = nullptr);

/// Injective string encoding of a value, usable as an ordered map key.
/// Values equal under == encode identically. Every NaN encodes as one key,
/// so NaN identities match each other even though NaN != NaN.
[[nodiscard]] RECDIFF_API std::string canonical_key(const Value& val);

} // namespace recdiff
