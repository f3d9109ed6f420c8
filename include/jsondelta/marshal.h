// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file marshal.h
/// @brief Carries deltas inside plain JSON by escaping markers.
///
/// With the default escape token "$":
///
/// | delta                  | marshaled           |
/// |------------------------|---------------------|
/// | Marker::Delete (key)   | "$delete"           |
/// | "price" (key or value) | "price"             |
/// | "$price"               | "$$price"           |
///
/// unmarshal() reverses this: "$delete" as a key becomes Marker::Delete,
/// "$$price" loses one "$". A marker token cannot stand for a plain value,
/// so "$delete" in a value position is rejected with AmbiguousEscapeError.
///
/// unmarshal(marshal(d)) == d for every delta.

#pragma once

#include "delta.h"

#include <optional>
#include <string>
#include <string_view>

namespace jsondelta {

class JSONDELTA_API Marshaler {
public:
    /// @throws ConfigError if @p escape is empty or is a prefix of a marker
    ///         label ("d" would make the key "delete" marshal to "ddelete")
    explicit Marshaler(std::string escape = "$");

    [[nodiscard]] Value marshal(const Delta& delta) const;

    /// @throws AmbiguousEscapeError on marker tokens outside key positions
    [[nodiscard]] Delta unmarshal(const Value& value) const;

    [[nodiscard]] const std::string& escape() const noexcept { return escape_; }

    /// The escaped form of a marker ("$add")
    [[nodiscard]] std::string token(Marker m) const;

private:
    std::string escape_string(const std::string& s) const;
    std::string unescape_string(const std::string& s) const;
    std::optional<Marker> marker_for(std::string_view s) const;

    Value marshal_value(const Value& v) const;
    Value unmarshal_value(const Value& v) const;

    std::string escape_;
};

} // namespace jsondelta
