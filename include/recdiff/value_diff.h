// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Structural diff of two record trees.
///
/// diff_iter() returns a DiffStream that produces ChangeEntry values one at a
/// time, on demand. Stopping early is free: the stream only holds traversal
/// state. diff() drains a stream into a Diff.
///
/// @code
///   for (const ChangeEntry& e : diff_iter(before, after)) {
///       std::cout << e << "\n";
///   }
///
///   Diff d = diff(before, after, {.unchanged = true});
///   std::cout << d.summary() << "\n";   // "Person: 3 item(s)"
/// @endcode
///
/// Entry order: fields in name order, depth first. Inside a collection:
/// removed items (base order), added items (other order), then matched
/// items (base order).

#pragma once

#include <recdiff/api.h>
#include <recdiff/change.h>
#include <recdiff/diff_options.h>
#include <recdiff/errors.h>
#include <recdiff/value.h>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recdiff {

namespace detail {
class Frame;
}

// ============================================================
// DiffStream - lazy, single-pass sequence of ChangeEntry
// ============================================================

class RECDIFF_API DiffStream {
public:
    /// Input iterator over the remaining entries
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ChangeEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChangeEntry*;
        using reference = const ChangeEntry&;

        iterator() = default;
        explicit iterator(DiffStream* stream) : stream_(stream) { fetch(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            fetch();
            return *this;
        }

        void operator++(int) { fetch(); }

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.stream_ == b.stream_;
        }

    private:
        void fetch() {
            current_ = stream_->next();
            if (!current_) stream_ = nullptr;
        }

        DiffStream* stream_ = nullptr;
        std::optional<ChangeEntry> current_;
    };

    /// @throws TypeMismatch when the root shapes or declared types differ
    ///         and duck typing is off
    DiffStream(Value base, Value other, DiffOptionsPtr options);
    ~DiffStream();

    DiffStream(DiffStream&&) noexcept;
    DiffStream& operator=(DiffStream&&) noexcept;

    DiffStream(const DiffStream&) = delete;
    DiffStream& operator=(const DiffStream&) = delete;

    /// Next entry, or std::nullopt once the stream is exhausted
    /// @throws TypeMismatch, IdentityShapeMismatch found while traversing
    [[nodiscard]] std::optional<ChangeEntry> next();

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] iterator end() { return iterator{}; }

    [[nodiscard]] bool done() const noexcept { return stack_.empty(); }

    [[nodiscard]] const DiffOptions& options() const noexcept { return *options_; }
    [[nodiscard]] const Value& base() const noexcept { return base_; }
    [[nodiscard]] const Value& other() const noexcept { return other_; }

private:
    Value base_;
    Value other_;
    DiffOptionsPtr options_;
    std::vector<std::unique_ptr<detail::Frame>> stack_;
};

// ============================================================
// Diff - eager result
// ============================================================

class RECDIFF_API Diff {
public:
    using const_iterator = std::vector<ChangeEntry>::const_iterator;

    Diff() = default;
    Diff(std::vector<ChangeEntry> entries, std::string base_type_name, std::string other_type_name);

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }
    [[nodiscard]] const ChangeEntry& operator[](std::size_t i) const { return entries_[i]; }

    [[nodiscard]] const std::vector<ChangeEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] const std::string& base_type_name() const noexcept { return base_type_name_; }
    [[nodiscard]] const std::string& other_type_name() const noexcept { return other_type_name_; }

    /// Number of entries of one kind
    [[nodiscard]] std::size_t count(ChangeKind kind) const noexcept;

    /// True if any entry is not Unchanged
    [[nodiscard]] bool has_changes() const noexcept;

    /// "Person vs Employee: 3 item(s)", or "Person: 3 item(s)" for equal type names
    [[nodiscard]] std::string summary() const;

    /// Print the summary and one line per entry to stdout
    void print() const;

private:
    std::vector<ChangeEntry> entries_;
    std::string base_type_name_;
    std::string other_type_name_;
};

// ============================================================
// Entry points
// ============================================================

/// Lazy diff with default options overridden by `flags`
/// @throws TypeMismatch
[[nodiscard]] RECDIFF_API DiffStream diff_iter(const Value& base, const Value& other, const DiffFlags& flags = {});

/// Lazy diff with an options object. Passing both a non-null `options` and
/// non-empty `flags` is rejected.
/// @throws DiffOptionsConflict, TypeMismatch
[[nodiscard]] RECDIFF_API DiffStream diff_iter(const Value& base, const Value& other,
                                               DiffOptionsPtr options, const DiffFlags& flags = {});

/// Eager diff
[[nodiscard]] RECDIFF_API Diff diff(const Value& base, const Value& other, const DiffFlags& flags = {});

[[nodiscard]] RECDIFF_API Diff diff(const Value& base, const Value& other,
                                    DiffOptionsPtr options, const DiffFlags& flags = {});

/// Quick check: stops at the first difference, never reports Unchanged
[[nodiscard]] RECDIFF_API bool has_any_difference(const Value& base, const Value& other,
                                                  const DiffFlags& flags = {});

} // namespace recdiff
