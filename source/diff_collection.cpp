// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_collection.cpp
/// @brief Keyed collection, sequence and mapping comparers.
///
/// Both sides are reduced to lists of (identity, occurrence) and reconciled
/// as multisets: the n-th occurrence of an identity in the base is matched
/// with the n-th occurrence of the same identity in the other side.

#include "diff_frames.h"

#include <recdiff/errors.h>
#include <recdiff/log.h>
#include <recdiff/record_id.h>

#include <algorithm>

namespace recdiff::detail {

namespace {

template <typename Occ>
struct Reconciled {
    std::vector<Occ> removed;
    std::vector<Occ> added;
    std::vector<std::pair<Occ, Occ>> matched;
};

/// Each side: (canonical identity, occurrence) in container order
template <typename Occ>
Reconciled<Occ> reconcile(std::vector<std::pair<std::string, Occ>> side_a,
                          std::vector<std::pair<std::string, Occ>> side_b)
{
    // identity -> positions in side_b
    std::map<std::string, std::vector<std::size_t>> index_b;
    for (std::size_t j = 0; j < side_b.size(); ++j) {
        index_b[side_b[j].first].push_back(j);
    }

    Reconciled<Occ> result;
    std::map<std::string, std::size_t> seen_a;
    std::vector<bool> b_matched(side_b.size(), false);

    for (auto& [identity, occ] : side_a) {
        std::size_t& n = seen_a[identity];
        auto it = index_b.find(identity);
        if (it != index_b.end() && n < it->second.size()) {
            const std::size_t j = it->second[n];
            b_matched[j] = true;
            result.matched.emplace_back(std::move(occ), side_b[j].second);
        } else {
            result.removed.push_back(std::move(occ));
        }
        ++n;
    }

    for (std::size_t j = 0; j < side_b.size(); ++j) {
        if (!b_matched[j]) result.added.push_back(std::move(side_b[j].second));
    }
    return result;
}

} // namespace

// ============================================================
// KeyedFrame
// ============================================================

namespace {

using ItemList = std::vector<std::pair<PathElement, Value>>;

/// Items of a collection in container order, of a sequence by position and
/// of a mapping by sorted key
ItemList keyed_items(const Value& val, const FieldSelector& where)
{
    ItemList out;
    if (const CollectionData* coll = val.collection()) {
        out.reserve(coll->items.size());
        for (const auto& item : coll->items) {
            out.emplace_back(item.key, item.value.get());
        }
    } else if (auto* seq = val.get_if<ValueVector>()) {
        out.reserve(seq->size());
        for (std::size_t i = 0; i < seq->size(); ++i) {
            out.emplace_back(PathElement{i}, (*seq)[i].get());
        }
    } else if (auto* map = val.get_if<ValueMap>()) {
        out.reserve(map->size());
        for (const auto& [k, v] : *map) {
            out.emplace_back(PathElement{k}, v.get());
        }
        std::sort(out.begin(), out.end(), [](const auto& x, const auto& y) {
            return std::get<std::string>(x.first) < std::get<std::string>(y.first);
        });
    } else {
        throw DiffError("collection comparison of a " + type_name(val) + " at " + where.path());
    }
    return out;
}

const CollectionType* declared_container(const Value& val)
{
    const CollectionData* coll = val.collection();
    return coll ? coll->type.get() : nullptr;
}

} // namespace

KeyedFrame::KeyedFrame(const Value& a, const Value& b,
                       FieldSelector base, FieldSelector other,
                       const DiffOptions& options)
    : base_(std::move(base))
    , other_(std::move(other))
    , options_(options)
{
    const CollectionType* container_a = declared_container(a);
    const CollectionType* container_b = options_.duck_type ? container_a : declared_container(b);
    const RecordType* declared_type =
        options_.duck_type && container_a ? container_a->item_type.get() : nullptr;

    const std::optional<MultiFieldSelector> selector = options_.identity_selector(base_);
    const MultiFieldSelector* selector_ptr = selector ? &*selector : nullptr;

    std::optional<std::size_t> arity;
    auto identify = [&](const Value& item, const CollectionType* container) {
        ItemIdentity id = options_.item_identity(item, declared_type, selector_ptr, container);
        if (!arity) {
            arity = id.arity;
        } else if (*arity != id.arity) {
            const std::string msg = "identities of different shapes in collection at " + base_.path() +
                                    ": " + std::to_string(*arity) + " vs " + std::to_string(id.arity) +
                                    " column(s)";
            log_diff_error("KeyedFrame", msg);
            throw IdentityShapeMismatch(msg);
        }
        return canonical_key(id.value);
    };

    std::vector<std::pair<std::string, Occurrence>> side_a;
    for (auto& [key, item] : keyed_items(a, base_)) {
        side_a.emplace_back(identify(item, container_a), Occurrence{std::move(key), std::move(item)});
    }

    std::vector<std::pair<std::string, Occurrence>> side_b;
    for (auto& [key, item] : keyed_items(b, other_)) {
        side_b.emplace_back(identify(item, container_b), Occurrence{std::move(key), std::move(item)});
    }

    auto result = reconcile(std::move(side_a), std::move(side_b));
    removed_ = std::move(result.removed);
    added_ = std::move(result.added);
    matched_.reserve(result.matched.size());
    for (auto& [occ_a, occ_b] : result.matched) {
        matched_.push_back(Match{std::move(occ_a), std::move(occ_b)});
    }
}

const DiffOptions& KeyedFrame::quiet_options()
{
    if (!quiet_options_) {
        quiet_options_ = std::make_unique<DiffOptions>(options_);
        quiet_options_->unchanged = false;
    }
    return *quiet_options_;
}

bool KeyedFrame::advance(Step& step)
{
    while (true) {
        switch (phase_) {
        case Phase::Removed:
            if (pos_ < removed_.size()) {
                const Occurrence& occ = removed_[pos_++];
                step.entry = ChangeEntry{ChangeKind::Removed, base_ + occ.key, other_};
                return true;
            }
            phase_ = Phase::Added;
            pos_ = 0;
            break;

        case Phase::Added:
            if (pos_ < added_.size()) {
                const Occurrence& occ = added_[pos_++];
                step.entry = ChangeEntry{ChangeKind::Added, base_, other_ + occ.key};
                return true;
            }
            phase_ = Phase::Matched;
            pos_ = 0;
            break;

        case Phase::Matched:
            while (pos_ < matched_.size()) {
                const Match& m = matched_[pos_++];
                FieldSelector bp = base_ + m.a.key;
                FieldSelector op = other_ + m.b.key;

                const bool records =
                    pair_shape(classify(m.a.item), classify(m.b.item), options_.duck_type) == Shape::Record;
                if (records) {
                    if (options_.unchanged &&
                        !records_differ(m.a.item, m.b.item, bp, op, quiet_options())) {
                        step.entry = ChangeEntry{ChangeKind::Unchanged, bp, op};
                    }
                    step.child = make_frame(Shape::Record, m.a.item, m.b.item,
                                            std::move(bp), std::move(op), options_);
                    return true;
                }

                // Same identity and no fields: nothing more to compare
                if (options_.unchanged) {
                    step.entry = ChangeEntry{ChangeKind::Unchanged, std::move(bp), std::move(op)};
                    return true;
                }
            }
            phase_ = Phase::Done;
            break;

        case Phase::Done:
            return false;
        }
    }
}

// ============================================================
// UnkeyedFrame
// ============================================================

namespace {

using KeyedIdentities = std::vector<std::pair<std::string, PathElement>>;

void add_identity(KeyedIdentities& out, const Value& item, PathElement key, const DiffOptions& options)
{
    Slot norm = options.normalize_val(item);
    if (!norm) {
        if (options.ignore_empty_slots) return;
        norm = Value{};
    }
    out.emplace_back(canonical_key(*norm), std::move(key));
}

KeyedIdentities unkeyed_identities(const Value& val, const DiffOptions& options)
{
    KeyedIdentities out;
    if (auto* seq = val.get_if<ValueVector>()) {
        out.reserve(seq->size());
        for (std::size_t i = 0; i < seq->size(); ++i) {
            add_identity(out, (*seq)[i].get(), PathElement{i}, options);
        }
    } else if (auto* map = val.get_if<ValueMap>()) {
        std::vector<std::string> keys;
        keys.reserve(map->size());
        for (const auto& [k, v] : *map) {
            keys.push_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out.reserve(keys.size());
        for (auto& k : keys) {
            add_identity(out, map->find(k)->get(), PathElement{std::move(k)}, options);
        }
    }
    return out;
}

} // namespace

UnkeyedFrame::UnkeyedFrame(const Value& a, const Value& b,
                           FieldSelector base, FieldSelector other,
                           const DiffOptions& options)
    : base_(std::move(base))
    , other_(std::move(other))
    , options_(options)
{
    auto result = reconcile(unkeyed_identities(a, options_), unkeyed_identities(b, options_));
    removed_ = std::move(result.removed);
    added_ = std::move(result.added);
    matched_ = std::move(result.matched);
}

bool UnkeyedFrame::advance(Step& step)
{
    while (true) {
        switch (phase_) {
        case Phase::Removed:
            if (pos_ < removed_.size()) {
                step.entry = ChangeEntry{ChangeKind::Removed, base_ + removed_[pos_++], other_};
                return true;
            }
            phase_ = Phase::Added;
            pos_ = 0;
            break;

        case Phase::Added:
            if (pos_ < added_.size()) {
                step.entry = ChangeEntry{ChangeKind::Added, base_, other_ + added_[pos_++]};
                return true;
            }
            phase_ = options_.unchanged ? Phase::Matched : Phase::Done;
            pos_ = 0;
            break;

        case Phase::Matched:
            if (pos_ < matched_.size()) {
                const auto& [key_a, key_b] = matched_[pos_++];
                step.entry = ChangeEntry{ChangeKind::Unchanged, base_ + key_a, other_ + key_b};
                return true;
            }
            phase_ = Phase::Done;
            break;

        case Phase::Done:
            return false;
        }
    }
}

} // namespace recdiff::detail
