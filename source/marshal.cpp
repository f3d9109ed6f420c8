// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// marshal.cpp - marker escaping for plain-JSON transport

#include <jsondelta/marshal.h>
#include <jsondelta/builders.h>
#include <jsondelta/errors.h>

#include <utility>

namespace jsondelta {

Marshaler::Marshaler(std::string escape)
    : escape_(std::move(escape))
{
    if (escape_.empty()) {
        throw ConfigError("escape token must not be empty");
    }
    // An escaped plain key would spell the same token as a marker
    for (auto m : all_markers) {
        if (marker_label(m).starts_with(escape_)) {
            throw ConfigError("escape token '" + escape_ + "' is a prefix of marker label '" +
                              std::string(marker_label(m)) + "'");
        }
    }
}

std::string Marshaler::token(Marker m) const
{
    return escape_ + std::string(marker_label(m));
}

std::string Marshaler::escape_string(const std::string& s) const
{
    if (s.starts_with(escape_)) {
        return escape_ + s;
    }
    return s;
}

std::string Marshaler::unescape_string(const std::string& s) const
{
    if (s.starts_with(escape_)) {
        return s.substr(escape_.size());
    }
    return s;
}

std::optional<Marker> Marshaler::marker_for(std::string_view s) const
{
    if (!s.starts_with(escape_)) return std::nullopt;
    const auto label = s.substr(escape_.size());
    for (auto m : all_markers) {
        if (label == marker_label(m)) return m;
    }
    return std::nullopt;
}

// ============================================================
// Marshal
// ============================================================

Value Marshaler::marshal(const Delta& delta) const
{
    if (auto* v = delta.as_value()) {
        return marshal_value(*v);
    }
    MapBuilder builder;
    for (const auto& [k, v] : *delta.as_map()) {
        if (auto* marker = std::get_if<Marker>(&k)) {
            builder.set(token(*marker), marshal(v.get()));
        } else {
            builder.set(escape_string(std::get<std::string>(k)), marshal(v.get()));
        }
    }
    return builder.finish();
}

Value Marshaler::marshal_value(const Value& v) const
{
    return std::visit([this, &v](const auto& arg) -> Value {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return escape_string(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            MapBuilder builder;
            for (const auto& [k, child] : arg) {
                builder.set(escape_string(k), marshal_value(child.get()));
            }
            return builder.finish();
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            VectorBuilder builder;
            for (const auto& child : arg) builder.push_back(marshal_value(child.get()));
            return builder.finish();
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            ArrayBuilder builder;
            for (const auto& child : arg) builder.push_back(marshal_value(child.get()));
            return builder.finish();
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            SetBuilder builder;
            for (const auto& child : arg) builder.insert(marshal_value(child.get()));
            return builder.finish();
        } else {
            return v;
        }
    }, v.data);
}

// ============================================================
// Unmarshal
// ============================================================

Delta Marshaler::unmarshal(const Value& value) const
{
    auto* m = value.get_if<ValueMap>();
    if (!m) {
        return Delta{unmarshal_value(value)};
    }
    DeltaMapBuilder builder;
    for (const auto& [k, v] : *m) {
        if (auto marker = marker_for(k)) {
            builder.set(*marker, unmarshal(v.get()));
        } else {
            builder.set(unescape_string(k), unmarshal(v.get()));
        }
    }
    return builder.finish();
}

Value Marshaler::unmarshal_value(const Value& v) const
{
    return std::visit([this, &v](const auto& arg) -> Value {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto marker = marker_for(arg)) {
                detail::log_access_error("Marshaler::unmarshal",
                                         "marker token '" + arg + "' in a value position");
                throw AmbiguousEscapeError("marker token '" + arg +
                                           "' cannot appear as a plain value");
            }
            return unescape_string(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            MapBuilder builder;
            for (const auto& [k, child] : arg) {
                if (marker_for(k)) {
                    detail::log_key_error("Marshaler::unmarshal", k, "is a marker inside a value payload");
                    throw AmbiguousEscapeError("marker token '" + k +
                                               "' cannot appear as a key inside a value payload");
                }
                builder.set(unescape_string(k), unmarshal_value(child.get()));
            }
            return builder.finish();
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            VectorBuilder builder;
            for (const auto& child : arg) builder.push_back(unmarshal_value(child.get()));
            return builder.finish();
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            ArrayBuilder builder;
            for (const auto& child : arg) builder.push_back(unmarshal_value(child.get()));
            return builder.finish();
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            SetBuilder builder;
            for (const auto& child : arg) builder.insert(unmarshal_value(child.get()));
            return builder.finish();
        } else {
            return v;
        }
    }, v.data);
}

} // namespace jsondelta
