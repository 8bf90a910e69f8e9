// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.cpp
/// @brief Value lookup, comparison and printing utilities.

#include <recdiff/value.h>
#include <recdiff/record_type.h>

#include <iostream>
#include <sstream>
#include <string>

namespace recdiff {

// ============================================================
// Lookup
// ============================================================

std::optional<Value> Value::get_field(std::string_view name) const
{
    const ValueMap* fields = nullptr;
    if (auto* r = get_if<RecordBox>()) {
        fields = &r->get().fields;
    } else if (auto* m = get_if<ValueMap>()) {
        fields = m;
    }
    if (!fields) return std::nullopt;

    if (auto* found = fields->find(std::string{name})) {
        return found->get();
    }
    return std::nullopt;
}

Value Value::at(std::string_view key) const
{
    if (auto* c = get_if<CollectionBox>()) {
        for (const auto& item : c->get().items) {
            if (auto* k = std::get_if<std::string>(&item.key); k && *k == key) {
                return item.value.get();
            }
        }
        detail::log_key_error("Value::at", key, "not found in collection");
        return Value{};
    }
    if (!is_record() && !is_map()) {
        detail::log_key_error("Value::at", key, "lookup on a value without fields");
        return Value{};
    }
    if (auto found = get_field(key)) {
        return std::move(*found);
    }
    detail::log_key_error("Value::at", key, "not set");
    return Value{};
}

Value Value::at(std::size_t index) const
{
    if (auto* v = get_if<ValueVector>()) {
        if (index < v->size()) return (*v)[index].get();
        detail::log_index_error("Value::at", index, "out of range");
        return Value{};
    }
    if (auto* c = get_if<CollectionBox>()) {
        const auto& items = c->get().items;
        if (index < items.size()) return items[index].value.get();
        detail::log_index_error("Value::at", index, "out of range");
        return Value{};
    }
    detail::log_index_error("Value::at", index, "lookup on a value without positions");
    return Value{};
}

// ============================================================
// Comparison
// ============================================================

namespace {

std::string_view declared_name(const RecordTypePtr& type)
{
    return type ? std::string_view{type->name} : std::string_view{};
}

std::string_view declared_name(const CollectionTypePtr& type)
{
    return type ? std::string_view{type->name} : std::string_view{};
}

} // namespace

bool operator==(const RecordData& a, const RecordData& b)
{
    return a.type == b.type && a.fields == b.fields;
}

bool operator==(const CollectionData& a, const CollectionData& b)
{
    return a.type == b.type && a.items == b.items;
}

bool operator==(const CollectionItem& a, const CollectionItem& b)
{
    return a.key == b.key && a.value == b.value;
}

// ============================================================
// Utility functions
// ============================================================

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[sequence:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, RecordBox>) {
            return "<" + std::string{declared_name(arg.get().type)} + ":" +
                   std::to_string(arg.get().fields.size()) + ">";
        } else if constexpr (std::is_same_v<T, CollectionBox>) {
            return "<" + std::string{declared_name(arg.get().type)} + "[" +
                   std::to_string(arg.get().items.size()) + "]>";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    std::visit(
        [&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueMap>) {
                for (const auto& [k, v] : arg) {
                    std::cout << indent << prefix << k << ":\n";
                    print_value(*v, "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << indent << prefix << "[" << i << "]:\n";
                    print_value(*arg[i], "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, RecordBox>) {
                const auto& rec = arg.get();
                std::cout << indent << prefix << declared_name(rec.type) << "\n";
                if (!rec.type) return;
                // Declared order, so the output is stable
                for (const auto& [name, meta] : rec.type->fields) {
                    if (auto* v = rec.fields.find(name)) {
                        std::cout << indent << "  " << name << ":\n";
                        print_value(v->get(), "", depth + 2);
                    }
                }
            } else if constexpr (std::is_same_v<T, CollectionBox>) {
                const auto& coll = arg.get();
                std::cout << indent << prefix << declared_name(coll.type) << "\n";
                for (const auto& item : coll.items) {
                    std::cout << indent << "  " << path_element_to_string(item.key) << ":\n";
                    print_value(item.value.get(), "", depth + 2);
                }
            } else {
                std::cout << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

std::string type_name(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "int";
        } else if constexpr (std::is_same_v<T, double>) {
            return "double";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "sequence";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "map";
        } else {
            return std::string{declared_name(arg.get().type)};
        }
    }, val.data);
}

std::string path_element_to_string(const PathElement& elem)
{
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "." + v;
        } else if constexpr (std::is_same_v<T, std::size_t>) {
            return "[" + std::to_string(v) + "]";
        } else {
            return "[*]";
        }
    }, elem);
}

} // namespace recdiff
