// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record_id.cpp
/// @brief Item identities and their canonical encoding.

#include <recdiff/record_id.h>
#include <recdiff/builders.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <vector>

namespace recdiff {

namespace {

Value value_or_null(Slot slot)
{
    return slot ? std::move(*slot) : Value{};
}

/// Identity contribution of one record column
Value column_identity(const Value& raw,
                      const FieldMeta* meta,
                      const MultiFieldSelector* selector,
                      const DiffOptions& options)
{
    Slot norm = options.normalize_slot(raw, meta);
    if (!norm) return Value{};
    const Value& val = *norm;

    if (val.is_record()) {
        return record_id(val, nullptr, selector, options).value;
    }

    if (auto* coll = val.collection()) {
        std::optional<MultiFieldSelector> item_selector;
        if (selector) item_selector = selector->any();

        SequenceBuilder ids;
        for (const auto& item : coll->items) {
            ids.push_back(record_id(item.value.get(), nullptr,
                                    item_selector ? &*item_selector : nullptr,
                                    options, coll->type.get()).value);
        }
        return ids.finish();
    }

    if (auto* seq = val.get_if<ValueVector>()) {
        SequenceBuilder items;
        for (const auto& item : *seq) {
            items.push_back(value_or_null(options.normalize_val(item.get())));
        }
        return items.finish();
    }

    return val;
}

} // namespace

ItemIdentity record_id(const Value& item,
                       const RecordType* declared_type,
                       const MultiFieldSelector* selector,
                       const DiffOptions& options,
                       const CollectionType* container)
{
    const RecordData* rec = item.record();
    if (!rec) {
        return ItemIdentity{value_or_null(options.normalize_item(item, container)), 1};
    }

    const RecordType* type = declared_type ? declared_type : rec->type.get();
    if (!type) {
        return ItemIdentity{item, 1};
    }

    std::vector<const FieldMeta*> columns;

    bool use_primary_key = type->has_primary_key();
    if (use_primary_key && selector) {
        use_primary_key = std::all_of(type->primary_key.begin(), type->primary_key.end(),
                                      [&](const std::string& column) {
                                          return selector->contains(FieldSelector{column});
                                      });
    }

    if (use_primary_key) {
        for (const auto& column : type->primary_key) {
            columns.push_back(type->field(column));
        }
    } else {
        // std::map keeps the fields sorted by name
        for (const auto& [name, meta] : type->fields) {
            if (meta.extraneous && !options.extraneous) continue;
            if (selector && !selector->contains(FieldSelector{name})) continue;
            columns.push_back(&meta);
        }
    }

    SequenceBuilder tuple;
    Value single;
    for (const FieldMeta* meta : columns) {
        std::optional<MultiFieldSelector> sub;
        if (selector) sub = selector->at(meta->name);

        Value id;
        if (auto raw = item.get_field(meta->name)) {
            id = column_identity(*raw, meta, sub ? &*sub : nullptr, options);
        }
        if (columns.size() == 1) {
            single = std::move(id);
        } else {
            tuple.push_back(std::move(id));
        }
    }

    if (columns.size() == 1) {
        return ItemIdentity{std::move(single), 1};
    }
    return ItemIdentity{tuple.finish(), columns.size()};
}

// ============================================================
// canonical_key
//
// Every value starts with a one-character tag; strings are length
// prefixed and containers bracketed, so the encoding is injective.
// ============================================================

namespace {

void append_string(std::string& out, std::string_view s)
{
    out += std::to_string(s.size());
    out += ':';
    out += s;
}

void append_key(std::string& out, const Value& val);

void append_fields(std::string& out, const ValueMap& fields)
{
    std::vector<const std::string*> names;
    names.reserve(fields.size());
    for (const auto& [name, v] : fields) {
        names.push_back(&name);
    }
    std::sort(names.begin(), names.end(),
              [](const std::string* a, const std::string* b) { return *a < *b; });

    out += '{';
    for (const std::string* name : names) {
        append_string(out, *name);
        append_key(out, fields.find(*name)->get());
    }
    out += '}';
}

void append_key(std::string& out, const Value& val)
{
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out += 'n';
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "b1" : "b0";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += 'i';
            out += std::to_string(arg);
            out += ';';
        } else if constexpr (std::is_same_v<T, double>) {
            out += 'd';
            if (arg == 0.0) {
                out += '0';  // 0.0 == -0.0
            } else if (std::isnan(arg)) {
                out += "nan";
            } else {
                char buf[32];
                auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), arg);
                out.append(buf, ec == std::errc{} ? end : buf);
            }
            out += ';';
        } else if constexpr (std::is_same_v<T, std::string>) {
            out += 's';
            append_string(out, arg);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            out += '[';
            for (const auto& item : arg) {
                append_key(out, item.get());
            }
            out += ']';
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            out += 'm';
            append_fields(out, arg);
        } else if constexpr (std::is_same_v<T, RecordBox>) {
            const auto& rec = arg.get();
            out += 'R';
            append_string(out, rec.type ? std::string_view{rec.type->name} : std::string_view{});
            append_fields(out, rec.fields);
        } else if constexpr (std::is_same_v<T, CollectionBox>) {
            const auto& coll = arg.get();
            out += 'C';
            append_string(out, coll.type ? std::string_view{coll.type->name} : std::string_view{});
            out += '[';
            for (const auto& item : coll.items) {
                std::visit([&](const auto& k) {
                    using K = std::decay_t<decltype(k)>;
                    if constexpr (std::is_same_v<K, std::string>) {
                        out += 's';
                        append_string(out, k);
                    } else if constexpr (std::is_same_v<K, std::size_t>) {
                        out += 'i';
                        out += std::to_string(k);
                        out += ';';
                    } else {
                        out += 'n';
                    }
                }, item.key);
                append_key(out, item.value.get());
            }
            out += ']';
        }
    }, val.data);
}

} // namespace

std::string canonical_key(const Value& val)
{
    std::string out;
    append_key(out, val);
    return out;
}

} // namespace recdiff
