// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_frames.h
/// @brief Traversal frames of a DiffStream (internal).
///
/// A DiffStream keeps a stack of frames, one per container being compared.
/// Each call to Frame::advance() does one of three things:
///   - fills `step.entry` (an entry to report),
///   - fills `step.child` (a nested container to compare next),
///   - returns false (the frame is exhausted and gets popped).
/// An entry and a child may come together; the entry is reported first.

#pragma once

#include <recdiff/change.h>
#include <recdiff/diff_options.h>
#include <recdiff/value.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recdiff::detail {

/// Comparable shapes; a value's shape picks its comparer
enum class Shape {
    Scalar,
    Record,
    Sequence,
    Collection,
    Mapping,
};

[[nodiscard]] Shape classify(const Value& val) noexcept;
[[nodiscard]] const char* shape_name(Shape shape) noexcept;

/// Comparer for a pair of shapes, or std::nullopt when the values can only
/// be compared as leaves. Without duck typing the shapes must be equal;
/// with it a record reads a mapping by field name, a collection pairs with
/// a sequence or a mapping, and a sequence pairs with a mapping.
[[nodiscard]] std::optional<Shape> pair_shape(Shape a, Shape b, bool duck_type) noexcept;

class Frame;

struct Step {
    std::optional<ChangeEntry> entry;
    std::unique_ptr<Frame> child;
};

class Frame {
public:
    virtual ~Frame() = default;
    virtual bool advance(Step& step) = 0;
};

using FrameStack = std::vector<std::unique_ptr<Frame>>;

/// Run the stack until it produces an entry or empties
[[nodiscard]] std::optional<ChangeEntry> pull(FrameStack& stack);

/// Frame comparing two values of shape `shape`. Throws TypeMismatch for
/// records or collections of different declared types without duck typing.
[[nodiscard]] std::unique_ptr<Frame> make_frame(Shape shape,
                                                const Value& a, const Value& b,
                                                FieldSelector base, FieldSelector other,
                                                const DiffOptions& options);

/// Frame for the roots of a diff, including scalar roots and roots of
/// different shapes
[[nodiscard]] std::unique_ptr<Frame> make_root_frame(const Value& a, const Value& b,
                                                     const DiffOptions& options);

/// True if comparing a and b yields any entry, Unchanged aside
[[nodiscard]] bool records_differ(const Value& a, const Value& b,
                                  const FieldSelector& base, const FieldSelector& other,
                                  const DiffOptions& quiet_options);

// ============================================================
// Frames
// ============================================================

/// Field-by-field comparison of two records (or a record and a map when
/// duck typing)
class RecordFrame : public Frame {
public:
    RecordFrame(const Value& a, const Value& b,
                FieldSelector base, FieldSelector other,
                const DiffOptions& options);

    bool advance(Step& step) override;

private:
    Value a_;
    Value b_;
    FieldSelector base_;
    FieldSelector other_;
    const DiffOptions& options_;
    RecordTypePtr type_;
    std::map<std::string, FieldMeta, std::less<>>::const_iterator it_;
};

/// Identity-based comparison of two collections (or, when duck typing, a
/// collection and a sequence or mapping)
class KeyedFrame : public Frame {
public:
    KeyedFrame(const Value& a, const Value& b,
               FieldSelector base, FieldSelector other,
               const DiffOptions& options);

    bool advance(Step& step) override;

private:
    const DiffOptions& quiet_options();

    struct Occurrence {
        PathElement key;
        Value item;
    };

    struct Match {
        Occurrence a;
        Occurrence b;
    };

    enum class Phase { Removed, Added, Matched, Done };

    FieldSelector base_;
    FieldSelector other_;
    const DiffOptions& options_;
    std::vector<Occurrence> removed_;
    std::vector<Occurrence> added_;
    std::vector<Match> matched_;
    Phase phase_ = Phase::Removed;
    std::size_t pos_ = 0;
    std::unique_ptr<DiffOptions> quiet_options_;
};

/// Value-based comparison of two sequences or two scalar mappings
class UnkeyedFrame : public Frame {
public:
    UnkeyedFrame(const Value& a, const Value& b,
                 FieldSelector base, FieldSelector other,
                 const DiffOptions& options);

    bool advance(Step& step) override;

private:
    enum class Phase { Removed, Added, Matched, Done };

    FieldSelector base_;
    FieldSelector other_;
    const DiffOptions& options_;
    std::vector<PathElement> removed_;
    std::vector<PathElement> added_;
    std::vector<std::pair<PathElement, PathElement>> matched_;
    Phase phase_ = Phase::Removed;
    std::size_t pos_ = 0;
};

/// Single comparison of two values at one path (scalar roots, or roots of
/// different shapes under duck typing)
class LeafFrame : public Frame {
public:
    LeafFrame(const Value& a, const Value& b, const DiffOptions& options);

    bool advance(Step& step) override;

private:
    Value a_;
    Value b_;
    const DiffOptions& options_;
    bool done_ = false;
};

} // namespace recdiff::detail
