// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record_type.h
/// @brief Declared record and collection types.
///
/// A RecordType is an ordered (by name) mapping from field name to FieldMeta.
/// A CollectionType describes a keyed container of items, usually records of
/// a declared item type. Both carry optional comparison hooks, stored as
/// empty-able std::function fields.
///
/// Types are shared, immutable, and referenced from values by
/// std::shared_ptr<const ...>:
/// @code
///   auto person = make_record_type("Person", {
///       FieldMeta{.name = "id"},
///       FieldMeta{.name = "name"},
///       FieldMeta{.name = "etag", .extraneous = true},
///   }, {"id"});
/// @endcode

#pragma once

#include <recdiff/value.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace recdiff {

/// Maps a raw value to the value that is actually compared
using ValueHook = std::function<Value(const Value&)>;

/// Metadata of a single record field
struct FieldMeta {
    std::string name;
    bool extraneous = false;  ///< excluded from comparison unless DiffOptions::extraneous
    ValueHook compare_as;     ///< applied to a set slot before normalization
    std::string doc;
};

struct RECDIFF_API RecordType {
    std::string name;
    std::map<std::string, FieldMeta, std::less<>> fields;
    std::vector<std::string> primary_key;  ///< identity columns; empty = use all non-extraneous fields

    /// Metadata for a field, or nullptr if the type does not declare it
    [[nodiscard]] const FieldMeta* field(std::string_view field_name) const;

    [[nodiscard]] bool has_primary_key() const noexcept { return !primary_key.empty(); }
};

enum class CollectionKind {
    List,  ///< keyed by position
    Dict,  ///< keyed by string
    Set,   ///< unordered; every item has the null key
};

struct RECDIFF_API CollectionType {
    std::string name;
    CollectionKind kind = CollectionKind::List;
    RecordTypePtr item_type;   ///< declared item type, may be null
    ValueHook compare_item_as; ///< applied to each item before normalization
};

/// Create a record type
/// @throws std::invalid_argument on duplicate field names or on a primary
///         key column that is not a declared field
[[nodiscard]] RECDIFF_API RecordTypePtr make_record_type(
    std::string name,
    std::vector<FieldMeta> fields,
    std::vector<std::string> primary_key = {});

[[nodiscard]] RECDIFF_API CollectionTypePtr make_collection_type(
    std::string name,
    CollectionKind kind,
    RecordTypePtr item_type = nullptr,
    ValueHook compare_item_as = {});

/// Build a record value from field values
/// @throws std::invalid_argument if a field is not declared by the type
[[nodiscard]] RECDIFF_API Value make_record(
    const RecordTypePtr& type,
    std::initializer_list<std::pair<std::string, Value>> fields);

/// Build a list collection (keys 0..n-1)
[[nodiscard]] RECDIFF_API Value make_list(const CollectionTypePtr& type, std::initializer_list<Value> items);

/// Build a dict collection (string keys, insertion order kept)
[[nodiscard]] RECDIFF_API Value make_dict(
    const CollectionTypePtr& type,
    std::initializer_list<std::pair<std::string, Value>> items);

/// Build a set collection (every key is the null key)
[[nodiscard]] RECDIFF_API Value make_set(const CollectionTypePtr& type, std::initializer_list<Value> items);

} // namespace recdiff
