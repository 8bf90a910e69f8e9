// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_record.cpp
/// @brief Shape dispatch, the record comparer and the frame stack driver.

#include "diff_frames.h"

#include <recdiff/errors.h>
#include <recdiff/log.h>

#include <stdexcept>

namespace recdiff {

// ============================================================
// Errors
// ============================================================

TypeMismatch::TypeMismatch(std::string base_type, std::string other_type, const std::string& where)
    : DiffError("cannot compare " + base_type + " with " + other_type + " at " + where +
                " (enable duck_type to compare by field name)")
    , base_type_(std::move(base_type))
    , other_type_(std::move(other_type))
{}

namespace detail {

namespace {

[[noreturn]] void throw_type_mismatch(const Value& a, const Value& b, const FieldSelector& where)
{
    TypeMismatch err(type_name(a), type_name(b), where.path());
    log_diff_error("diff", err.what());
    throw err;
}

} // namespace

// ============================================================
// Shape dispatch
// ============================================================

Shape classify(const Value& val) noexcept
{
    if (val.is_record()) return Shape::Record;
    if (val.is_collection()) return Shape::Collection;
    if (val.is_sequence()) return Shape::Sequence;
    if (val.is_map()) return Shape::Mapping;
    return Shape::Scalar;
}

const char* shape_name(Shape shape) noexcept
{
    switch (shape) {
    case Shape::Scalar:     return "scalar";
    case Shape::Record:     return "record";
    case Shape::Sequence:   return "sequence";
    case Shape::Collection: return "collection";
    case Shape::Mapping:    return "mapping";
    }
    return "unknown";
}

std::optional<Shape> pair_shape(Shape a, Shape b, bool duck_type) noexcept
{
    if (a == Shape::Scalar || b == Shape::Scalar) return std::nullopt;
    if (a == b) return a;
    if (!duck_type) return std::nullopt;

    // Fields are read through the base side's declared type
    if (a == Shape::Record) {
        if (b == Shape::Mapping) return Shape::Record;
        return std::nullopt;
    }
    if (b == Shape::Record) return std::nullopt;

    if (a == Shape::Collection || b == Shape::Collection) return Shape::Collection;
    return Shape::Sequence;
}

std::unique_ptr<Frame> make_frame(Shape shape,
                                  const Value& a, const Value& b,
                                  FieldSelector base, FieldSelector other,
                                  const DiffOptions& options)
{
    switch (shape) {
    case Shape::Record:
        if (!options.duck_type && (!b.is_record() || a.record()->type != b.record()->type)) {
            throw_type_mismatch(a, b, base);
        }
        return std::make_unique<RecordFrame>(a, b, std::move(base), std::move(other), options);
    case Shape::Collection:
        if (!options.duck_type && (!b.is_collection() || a.collection()->type != b.collection()->type)) {
            throw_type_mismatch(a, b, base);
        }
        return std::make_unique<KeyedFrame>(a, b, std::move(base), std::move(other), options);
    case Shape::Sequence:
    case Shape::Mapping:
        return std::make_unique<UnkeyedFrame>(a, b, std::move(base), std::move(other), options);
    case Shape::Scalar:
        break;
    }
    throw std::logic_error(std::string{"make_frame: no frame for shape "} + shape_name(shape));
}

std::unique_ptr<Frame> make_root_frame(const Value& a, const Value& b, const DiffOptions& options)
{
    const Shape sa = classify(a);
    const Shape sb = classify(b);

    if (auto shape = pair_shape(sa, sb, options.duck_type)) {
        return make_frame(*shape, a, b, FieldSelector{}, FieldSelector{}, options);
    }
    if (sa != sb && !options.duck_type) {
        throw_type_mismatch(a, b, FieldSelector{});
    }
    return std::make_unique<LeafFrame>(a, b, options);
}

// ============================================================
// Frame stack
// ============================================================

std::optional<ChangeEntry> pull(FrameStack& stack)
{
    while (!stack.empty()) {
        Step step;
        if (!stack.back()->advance(step)) {
            stack.pop_back();
            continue;
        }
        if (step.child) {
            stack.push_back(std::move(step.child));
        }
        if (step.entry) {
            return std::move(step.entry);
        }
    }
    return std::nullopt;
}

bool records_differ(const Value& a, const Value& b,
                    const FieldSelector& base, const FieldSelector& other,
                    const DiffOptions& quiet_options)
{
    FrameStack stack;
    stack.push_back(make_frame(Shape::Record, a, b, base, other, quiet_options));
    return pull(stack).has_value();
}

// ============================================================
// RecordFrame
// ============================================================

RecordFrame::RecordFrame(const Value& a, const Value& b,
                         FieldSelector base, FieldSelector other,
                         const DiffOptions& options)
    : a_(a)
    , b_(b)
    , base_(std::move(base))
    , other_(std::move(other))
    , options_(options)
{
    const RecordData* rec = a_.record();
    if (!rec || !rec->type) {
        throw DiffError("record without a declared type at " + base_.path());
    }
    type_ = rec->type;
    it_ = type_->fields.begin();
}

bool RecordFrame::advance(Step& step)
{
    while (it_ != type_->fields.end()) {
        const FieldMeta& meta = it_->second;
        ++it_;

        if (meta.extraneous && !options_.extraneous) continue;

        FieldSelector bp = base_ + meta.name;
        if (options_.is_filtered(bp)) continue;

        Slot va = options_.normalize_slot(a_.get_field(meta.name), &meta);
        Slot vb = options_.normalize_slot(b_.get_field(meta.name), &meta);
        if (!va && !vb) continue;

        FieldSelector op = other_ + meta.name;
        if (!va) {
            step.entry = ChangeEntry{ChangeKind::Added, std::move(bp), std::move(op)};
            return true;
        }
        if (!vb) {
            step.entry = ChangeEntry{ChangeKind::Removed, std::move(bp), std::move(op)};
            return true;
        }

        if (auto shape = pair_shape(classify(*va), classify(*vb), options_.duck_type)) {
            step.child = make_frame(*shape, *va, *vb, std::move(bp), std::move(op), options_);
            return true;
        }

        if (!options_.items_are_equal(*va, *vb)) {
            step.entry = ChangeEntry{ChangeKind::Modified, std::move(bp), std::move(op)};
            return true;
        }
        if (options_.unchanged) {
            step.entry = ChangeEntry{ChangeKind::Unchanged, std::move(bp), std::move(op)};
            return true;
        }
    }
    return false;
}

// ============================================================
// LeafFrame
// ============================================================

LeafFrame::LeafFrame(const Value& a, const Value& b, const DiffOptions& options)
    : a_(a)
    , b_(b)
    , options_(options)
{}

bool LeafFrame::advance(Step& step)
{
    if (done_) return false;
    done_ = true;

    Slot va = options_.normalize_val(a_);
    Slot vb = options_.normalize_val(b_);
    if (!va && !vb) return false;

    if (!va) {
        step.entry = ChangeEntry{ChangeKind::Added, {}, {}};
    } else if (!vb) {
        step.entry = ChangeEntry{ChangeKind::Removed, {}, {}};
    } else if (!options_.items_are_equal(*va, *vb)) {
        step.entry = ChangeEntry{ChangeKind::Modified, {}, {}};
    } else if (options_.unchanged) {
        step.entry = ChangeEntry{ChangeKind::Unchanged, {}, {}};
    } else {
        return false;
    }
    return true;
}

} // namespace detail

} // namespace recdiff
