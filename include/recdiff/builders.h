// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of immutable Values.
///
/// - MapBuilder: build a ValueMap
/// - SequenceBuilder: build a ValueVector
/// - RecordBuilder: build a record of a declared RecordType
/// - CollectionBuilder: build a collection of a declared CollectionType
///
/// Usage:
/// @code
///   Value person = RecordBuilder(person_type)
///       .set("id", 7)
///       .set("name", "Jo")
///       .set("tags", SequenceBuilder().push_back("x").push_back("y").finish())
///       .finish();
/// @endcode

#pragma once

#include <recdiff/record_type.h>
#include <recdiff/value.h>

#include <stdexcept>
#include <string>

namespace recdiff {

/// Builder for constructing a ValueMap efficiently - O(n) complexity
class MapBuilder {
public:
    using transient_type = ValueMap::transient_type;

    MapBuilder() : transient_(ValueMap{}.transient()) {}
    explicit MapBuilder(const ValueMap& existing) : transient_(existing.transient()) {}

    MapBuilder(MapBuilder&&) noexcept = default;
    MapBuilder& operator=(MapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    MapBuilder(const MapBuilder&) = delete;
    MapBuilder& operator=(const MapBuilder&) = delete;

    MapBuilder& set(const std::string& key, Value val) {
        transient_.set(key, ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the immutable Value
    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    [[nodiscard]] ValueMap finish_map() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

/// Builder for constructing a ValueVector efficiently - O(n) complexity
class SequenceBuilder {
public:
    using transient_type = ValueVector::transient_type;

    SequenceBuilder() : transient_(ValueVector{}.transient()) {}
    explicit SequenceBuilder(const ValueVector& existing) : transient_(existing.transient()) {}

    SequenceBuilder(SequenceBuilder&&) noexcept = default;
    SequenceBuilder& operator=(SequenceBuilder&&) noexcept = default;

    SequenceBuilder(const SequenceBuilder&) = delete;
    SequenceBuilder& operator=(const SequenceBuilder&) = delete;

    SequenceBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    [[nodiscard]] ValueVector finish_vector() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

/// Builder for a record of a declared type
///
/// Fields that are never set stay "not set", which the diff engine reports
/// as Added/Removed rather than as a change of value.
class RecordBuilder {
public:
    explicit RecordBuilder(RecordTypePtr type)
        : type_(std::move(type))
        , transient_(ValueMap{}.transient())
    {
        if (!type_) throw std::invalid_argument("RecordBuilder: null record type");
    }

    /// Start from an existing record's fields (its type is kept)
    explicit RecordBuilder(const RecordData& existing)
        : type_(existing.type)
        , transient_(existing.fields.transient())
    {}

    RecordBuilder(RecordBuilder&&) noexcept = default;
    RecordBuilder& operator=(RecordBuilder&&) noexcept = default;

    RecordBuilder(const RecordBuilder&) = delete;
    RecordBuilder& operator=(const RecordBuilder&) = delete;

    /// Set a declared field
    /// @throws std::invalid_argument if the type does not declare the field
    RecordBuilder& set(const std::string& field, Value val) {
        if (!type_->field(field)) {
            throw std::invalid_argument("RecordBuilder: " + type_->name +
                                        " has no field '" + field + "'");
        }
        transient_.set(field, ValueBox{std::move(val)});
        return *this;
    }

    /// Mark a field as not set
    RecordBuilder& unset(const std::string& field) {
        transient_.erase(field);
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& field) const {
        return transient_.count(field) > 0;
    }

    [[nodiscard]] Value finish() {
        return Value{RecordBox{RecordData{type_, transient_.persistent()}}};
    }

private:
    RecordTypePtr type_;
    ValueMap::transient_type transient_;
};

/// Builder for a collection of a declared type
///
/// List collections take push_back(), dict collections set(), set
/// collections insert(); using the wrong one throws std::logic_error.
class CollectionBuilder {
public:
    explicit CollectionBuilder(CollectionTypePtr type)
        : type_(std::move(type))
        , transient_(CollectionItems{}.transient())
    {
        if (!type_) throw std::invalid_argument("CollectionBuilder: null collection type");
    }

    CollectionBuilder(CollectionBuilder&&) noexcept = default;
    CollectionBuilder& operator=(CollectionBuilder&&) noexcept = default;

    CollectionBuilder(const CollectionBuilder&) = delete;
    CollectionBuilder& operator=(const CollectionBuilder&) = delete;

    CollectionBuilder& push_back(Value item) {
        require_kind(CollectionKind::List, "push_back");
        const std::size_t index = transient_.size();
        transient_.push_back(CollectionItem{PathElement{index}, ValueBox{std::move(item)}});
        return *this;
    }

    CollectionBuilder& set(const std::string& key, Value item) {
        require_kind(CollectionKind::Dict, "set");
        const PathElement elem{key};
        for (std::size_t i = 0; i < transient_.size(); ++i) {
            if (transient_[i].key == elem) {
                transient_.set(i, CollectionItem{elem, ValueBox{std::move(item)}});
                return *this;
            }
        }
        transient_.push_back(CollectionItem{elem, ValueBox{std::move(item)}});
        return *this;
    }

    CollectionBuilder& insert(Value item) {
        require_kind(CollectionKind::Set, "insert");
        transient_.push_back(CollectionItem{PathElement{}, ValueBox{std::move(item)}});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{CollectionBox{CollectionData{type_, transient_.persistent()}}};
    }

private:
    void require_kind(CollectionKind kind, const char* op) const {
        if (type_->kind != kind) {
            throw std::logic_error(std::string{"CollectionBuilder::"} + op +
                                   " does not apply to collection type " + type_->name);
        }
    }

    CollectionTypePtr type_;
    CollectionItems::transient_type transient_;
};

} // namespace recdiff
