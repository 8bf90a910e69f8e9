// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exceptions thrown by the diff engine.
///
/// DiffError (std::runtime_error)
///   +- TypeMismatch           operands of different declared types
///   +- ConfigurationError
///        +- DiffOptionsConflict      options object and inline flags together
///        +- IdentityShapeMismatch    mixed identity arity in a keyed collection
///
/// InvalidChangeKind (std::invalid_argument) is raised by change.h.
///
/// Absence of a value is never an error.

#pragma once

#include <recdiff/api.h>

#include <stdexcept>
#include <string>

namespace recdiff {

class RECDIFF_API DiffError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Two values of different declared types compared without duck typing
class RECDIFF_API TypeMismatch : public DiffError {
public:
    TypeMismatch(std::string base_type, std::string other_type, const std::string& where);

    [[nodiscard]] const std::string& base_type() const noexcept { return base_type_; }
    [[nodiscard]] const std::string& other_type() const noexcept { return other_type_; }

private:
    std::string base_type_;
    std::string other_type_;
};

class RECDIFF_API ConfigurationError : public DiffError {
public:
    using DiffError::DiffError;
};

class RECDIFF_API DiffOptionsConflict : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

class RECDIFF_API IdentityShapeMismatch : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

} // namespace recdiff
