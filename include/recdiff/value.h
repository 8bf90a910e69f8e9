// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable dynamic Value tree compared by the diff engine.
///
/// A Value is one of:
/// - Scalars: null (std::monostate), bool, int64, double, string
/// - Sequence: positional list of values (immer::vector)
/// - ValueMap: string-keyed mapping of values (immer::map)
/// - Record: an instance of a declared RecordType (see record_type.h)
/// - Collection: an instance of a declared CollectionType, holding
///   (key, item) pairs
///
/// All containers are immer persistent structures, so copying a Value is a
/// reference count increment and unchanged subtrees are shared.

#pragma once

#include <recdiff/recdiff_config.h>
#include <recdiff/api.h>
#include <recdiff/log.h>
#include <recdiff/value_fwd.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace recdiff {

using ValueBox    = immer::box<Value>;
using ValueMap    = immer::map<std::string, ValueBox>;
using ValueVector = immer::vector<ValueBox>;

/// A single path component: the null key of unordered sets, a field or
/// mapping key, or a sequence index
using PathElement = std::variant<std::monostate, std::string, std::size_t>;

/// One (key, item) pair of a Collection
struct CollectionItem {
    PathElement key;
    ValueBox value;
};

using CollectionItems = immer::vector<CollectionItem>;

/// Payload of a record value: its declared type and the fields that are set.
/// A field missing from `fields` is "not set", which is not the same as a
/// field set to null.
struct RecordData {
    RecordTypePtr type;
    ValueMap fields;
};

/// Payload of a collection value
struct CollectionData {
    CollectionTypePtr type;
    CollectionItems items;
};

using RecordBox     = immer::box<RecordData>;
using CollectionBox = immer::box<CollectionData>;

struct Value
{
    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 ValueVector,
                 ValueMap,
                 RecordBox,
                 CollectionBox>
        data;

    constexpr Value() noexcept : data(std::monostate{}) {}
    constexpr Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    constexpr Value(bool v) noexcept : data(v) {}
    constexpr Value(int v) noexcept : data(static_cast<int64_t>(v)) {}
    constexpr Value(int64_t v) noexcept : data(v) {}
    constexpr Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(RecordBox v) : data(std::move(v)) {}
    Value(CollectionBox v) : data(std::move(v)) {}

    // Factory functions for container types
    static Value sequence(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value map(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_sequence() const noexcept { return is<ValueVector>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMap>(); }
    [[nodiscard]] bool is_record() const noexcept { return is<RecordBox>(); }
    [[nodiscard]] bool is_collection() const noexcept { return is<CollectionBox>(); }

    [[nodiscard]] bool is_scalar() const noexcept {
        return !is_sequence() && !is_map() && !is_record() && !is_collection();
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    /// Record payload, or nullptr if this is not a record
    [[nodiscard]] const RecordData* record() const {
        if (auto* r = get_if<RecordBox>()) return &r->get();
        return nullptr;
    }

    /// Collection payload, or nullptr if this is not a collection
    [[nodiscard]] const CollectionData* collection() const {
        if (auto* c = get_if<CollectionBox>()) return &c->get();
        return nullptr;
    }

    /// Value of a record field or mapping key; std::nullopt when it is not set.
    /// Records answer from their set fields, maps from their keys, anything
    /// else has no fields.
    [[nodiscard]] std::optional<Value> get_field(std::string_view name) const;

    /// Like get_field(), but logs and returns null when not found
    [[nodiscard]] Value at(std::string_view key) const;

    /// Element of a sequence or list collection; logs and returns null when out of range
    [[nodiscard]] Value at(std::size_t index) const;

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* v = get_if<ValueVector>()) return v->size();
        if (auto* r = get_if<RecordBox>()) return r->get().fields.size();
        if (auto* c = get_if<CollectionBox>()) return c->get().items.size();
        return 0;
    }
};

/// Slot contents after lookup or normalization: std::nullopt means the slot
/// is absent (not set, or normalized away), which is distinct from null
using Slot = std::optional<Value>;

// ============================================================
// Comparison
//
// Structural: scalars by value, containers element-wise, records by declared
// type name and set fields, collections by declared type name and items.
// ============================================================

[[nodiscard]] RECDIFF_API bool operator==(const RecordData& a, const RecordData& b);
[[nodiscard]] RECDIFF_API bool operator==(const CollectionData& a, const CollectionData& b);
[[nodiscard]] RECDIFF_API bool operator==(const CollectionItem& a, const CollectionItem& b);

[[nodiscard]] inline bool operator==(const Value& a, const Value& b)
{
    return a.data == b.data;
}

[[nodiscard]] inline bool operator!=(const Value& a, const Value& b)
{
    return !(a == b);
}

// ============================================================
// Utility functions
// ============================================================

/// Convert Value to a short human-readable string
[[nodiscard]] RECDIFF_API std::string value_to_string(const Value& val);

/// Print Value with indentation
RECDIFF_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

/// Declared type name of a value: the RecordType/CollectionType name, or
/// one of "null", "bool", "int", "double", "string", "sequence", "map"
[[nodiscard]] RECDIFF_API std::string type_name(const Value& val);

/// Render a single path element (".name", "[3]", "[*]" for the null key)
[[nodiscard]] RECDIFF_API std::string path_element_to_string(const PathElement& elem);

} // namespace recdiff
