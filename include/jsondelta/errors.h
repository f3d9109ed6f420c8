// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exceptions raised by patch, unpatch, marshaling and configuration.
///
/// Every error derives from DeltaError (a std::runtime_error), so callers
/// that do not care about the category can catch a single type. Diff itself
/// only throws DepthLimitError.

#pragma once

#include "api.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace jsondelta {

class JSONDELTA_API DeltaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A map patch names a key that the base does not contain
class JSONDELTA_API MissingKeyError : public DeltaError {
public:
    explicit MissingKeyError(std::string key)
        : DeltaError("key not found: '" + key + "'"), key_(std::move(key)) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// A sequence patch references a position outside the working copy
class JSONDELTA_API OutOfRangeError : public DeltaError {
public:
    OutOfRangeError(std::size_t position, std::size_t size)
        : DeltaError("position " + std::to_string(position) +
                     " out of range for sequence of size " + std::to_string(size)),
          position_(position), size_(size) {}

    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

private:
    std::size_t position_;
    std::size_t size_;
};

/// The delta cannot be interpreted against the base it is applied to
class JSONDELTA_API InvalidDeltaError : public DeltaError {
public:
    using DeltaError::DeltaError;
};

/// Unpatch needs information the syntax did not record
class JSONDELTA_API IrreversibleDeltaError : public InvalidDeltaError {
public:
    using InvalidDeltaError::InvalidDeltaError;
};

/// A string collides with an escape pattern that unmarshal cannot invert
class JSONDELTA_API AmbiguousEscapeError : public DeltaError {
public:
    using DeltaError::DeltaError;
};

/// Input nesting exceeds the configured max_depth
class JSONDELTA_API DepthLimitError : public DeltaError {
public:
    explicit DepthLimitError(std::size_t max_depth)
        : DeltaError("nesting exceeds max depth " + std::to_string(max_depth)) {}
};

/// Invalid JsonDiffer / Marshaler configuration
class JSONDELTA_API ConfigError : public DeltaError {
public:
    using DeltaError::DeltaError;
};

/// The text loader rejected its input
class JSONDELTA_API ParseError : public DeltaError {
public:
    using DeltaError::DeltaError;
};

} // namespace jsondelta
