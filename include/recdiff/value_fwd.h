// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for Value, type-system and selector types
///
/// Lets headers declare functions using these types without including the
/// full value.h (and with it, immer).

#pragma once

#include <memory>

namespace recdiff {

struct Value;
struct RecordData;
struct CollectionData;
struct CollectionItem;

struct FieldMeta;
struct RecordType;
struct CollectionType;

using RecordTypePtr     = std::shared_ptr<const RecordType>;
using CollectionTypePtr = std::shared_ptr<const CollectionType>;

class FieldSelector;
class MultiFieldSelector;

class DiffOptions;
struct DiffFlags;
struct ChangeEntry;
class DiffStream;
class Diff;

} // namespace recdiff
