// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.cpp
/// @brief DiffStream, Diff and the diff entry points.

#include <recdiff/value_diff.h>

#include "diff_frames.h"

#include <iostream>

namespace recdiff {

// ============================================================
// DiffStream
// ============================================================

DiffStream::DiffStream(Value base, Value other, DiffOptionsPtr options)
    : base_(std::move(base))
    , other_(std::move(other))
    , options_(options ? std::move(options) : std::make_shared<const DiffOptions>())
{
    stack_.push_back(detail::make_root_frame(base_, other_, *options_));
}

DiffStream::~DiffStream() = default;
DiffStream::DiffStream(DiffStream&&) noexcept = default;
DiffStream& DiffStream::operator=(DiffStream&&) noexcept = default;

std::optional<ChangeEntry> DiffStream::next()
{
    return detail::pull(stack_);
}

// ============================================================
// Diff
// ============================================================

Diff::Diff(std::vector<ChangeEntry> entries, std::string base_type_name, std::string other_type_name)
    : entries_(std::move(entries))
    , base_type_name_(std::move(base_type_name))
    , other_type_name_(std::move(other_type_name))
{}

std::size_t Diff::count(ChangeKind kind) const noexcept
{
    std::size_t n = 0;
    for (const auto& e : entries_) {
        if (e.kind == kind) ++n;
    }
    return n;
}

bool Diff::has_changes() const noexcept
{
    return count(ChangeKind::Unchanged) != entries_.size();
}

std::string Diff::summary() const
{
    std::string result = base_type_name_;
    if (other_type_name_ != base_type_name_) {
        result += " vs " + other_type_name_;
    }
    result += ": " + std::to_string(entries_.size()) + " item(s)";
    return result;
}

void Diff::print() const
{
    std::cout << summary() << "\n";
    if (entries_.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& e : entries_) {
        std::cout << "  " << display_name(e.kind) << " " << e.path() << "\n";
    }
}

// ============================================================
// Entry points
// ============================================================

DiffStream diff_iter(const Value& base, const Value& other, const DiffFlags& flags)
{
    return DiffStream{base, other, std::make_shared<const DiffOptions>(flags)};
}

DiffStream diff_iter(const Value& base, const Value& other,
                     DiffOptionsPtr options, const DiffFlags& flags)
{
    if (options && !flags.empty()) {
        const char* msg = "diff_iter: pass either a DiffOptions object or inline flags, not both";
        detail::log_diff_error("diff_iter", msg);
        throw DiffOptionsConflict(msg);
    }
    if (!options) {
        return diff_iter(base, other, flags);
    }
    return DiffStream{base, other, std::move(options)};
}

namespace {

Diff drain(DiffStream stream)
{
    std::vector<ChangeEntry> entries;
    while (auto entry = stream.next()) {
        entries.push_back(std::move(*entry));
    }
    return Diff{std::move(entries), type_name(stream.base()), type_name(stream.other())};
}

} // namespace

Diff diff(const Value& base, const Value& other, const DiffFlags& flags)
{
    return drain(diff_iter(base, other, flags));
}

Diff diff(const Value& base, const Value& other, DiffOptionsPtr options, const DiffFlags& flags)
{
    return drain(diff_iter(base, other, std::move(options), flags));
}

bool has_any_difference(const Value& base, const Value& other, const DiffFlags& flags)
{
    DiffOptions options{flags};
    options.unchanged = false;

    // Fast path: same object
    if (&base.data == &other.data) {
        return false;
    }
    auto stream = DiffStream{base, other, std::make_shared<const DiffOptions>(std::move(options))};
    return stream.next().has_value();
}

} // namespace recdiff
