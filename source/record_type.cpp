// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record_type.cpp
/// @brief Record and collection type construction.

#include <recdiff/record_type.h>
#include <recdiff/builders.h>

#include <algorithm>
#include <stdexcept>

namespace recdiff {

const FieldMeta* RecordType::field(std::string_view field_name) const
{
    auto it = fields.find(field_name);
    return it != fields.end() ? &it->second : nullptr;
}

RecordTypePtr make_record_type(std::string name,
                               std::vector<FieldMeta> fields,
                               std::vector<std::string> primary_key)
{
    auto type = std::make_shared<RecordType>();
    type->name = std::move(name);

    for (auto& meta : fields) {
        if (meta.name.empty()) {
            throw std::invalid_argument("make_record_type: " + type->name + " has an unnamed field");
        }
        const std::string field_name = meta.name;
        if (!type->fields.emplace(field_name, std::move(meta)).second) {
            throw std::invalid_argument("make_record_type: " + type->name +
                                        " declares field '" + field_name + "' twice");
        }
    }

    for (const auto& column : primary_key) {
        if (!type->field(column)) {
            throw std::invalid_argument("make_record_type: primary key column '" + column +
                                        "' is not a field of " + type->name);
        }
    }
    type->primary_key = std::move(primary_key);
    std::sort(type->primary_key.begin(), type->primary_key.end());

    return type;
}

CollectionTypePtr make_collection_type(std::string name,
                                       CollectionKind kind,
                                       RecordTypePtr item_type,
                                       ValueHook compare_item_as)
{
    auto type = std::make_shared<CollectionType>();
    type->name = std::move(name);
    type->kind = kind;
    type->item_type = std::move(item_type);
    type->compare_item_as = std::move(compare_item_as);
    return type;
}

Value make_record(const RecordTypePtr& type,
                  std::initializer_list<std::pair<std::string, Value>> fields)
{
    RecordBuilder builder(type);
    for (const auto& [name, val] : fields) {
        builder.set(name, val);
    }
    return builder.finish();
}

Value make_list(const CollectionTypePtr& type, std::initializer_list<Value> items)
{
    CollectionBuilder builder(type);
    for (const auto& item : items) {
        builder.push_back(item);
    }
    return builder.finish();
}

Value make_dict(const CollectionTypePtr& type,
                std::initializer_list<std::pair<std::string, Value>> items)
{
    CollectionBuilder builder(type);
    for (const auto& [key, item] : items) {
        builder.set(key, item);
    }
    return builder.finish();
}

Value make_set(const CollectionTypePtr& type, std::initializer_list<Value> items)
{
    CollectionBuilder builder(type);
    for (const auto& item : items) {
        builder.insert(item);
    }
    return builder.finish();
}

} // namespace recdiff
