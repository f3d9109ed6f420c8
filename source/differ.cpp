// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// differ.cpp - JsonDiffer configuration and top-level operations

#include <jsondelta/differ.h>
#include <jsondelta/errors.h>

#include <utility>

namespace jsondelta {

namespace {

// Fill in defaults and validate before any member is built from the options
DifferOptions resolve_options(DifferOptions options)
{
    if (options.escape_str.empty()) {
        detail::log_access_error("JsonDiffer", "escape_str must not be empty");
        throw ConfigError("escape_str must not be empty");
    }
    if (options.max_depth == 0) {
        detail::log_access_error("JsonDiffer", "max_depth must be positive");
        throw ConfigError("max_depth must be positive");
    }
    if (!options.syntax) {
        options.syntax = builtin_syntax("compact");
    }
    if (!options.loader) {
        options.loader = std::make_shared<const JsonLoader>(options.max_depth);
    }
    if (!options.dumper) {
        options.dumper = std::make_shared<const JsonDumper>();
    }
    return options;
}

} // anonymous namespace

JsonDiffer::JsonDiffer(DifferOptions options)
    : options_(resolve_options(std::move(options)))
    , marshaler_(options_.escape_str)
    , engine_(options_.syntax, options_.max_depth)
{
}

// ============================================================
// Diff
// ============================================================

Delta JsonDiffer::diff(const Value& a, const Value& b) const
{
    return ValueComparator{*options_.syntax, options_.max_depth}.compare(a, b).delta;
}

Value JsonDiffer::diff_marshaled(const Value& a, const Value& b) const
{
    return marshaler_.marshal(diff(a, b));
}

std::string JsonDiffer::diff_text(std::string_view a, std::string_view b) const
{
    const Value lhs = options_.loader->load(a);
    const Value rhs = options_.loader->load(b);
    return options_.dumper->dump(diff_marshaled(lhs, rhs));
}

double JsonDiffer::similarity(const Value& a, const Value& b) const
{
    return ValueComparator{*options_.syntax, options_.max_depth}.similarity(a, b);
}

double JsonDiffer::similarity_text(std::string_view a, std::string_view b) const
{
    return similarity(options_.loader->load(a), options_.loader->load(b));
}

// ============================================================
// Patch / unpatch
// ============================================================

Value JsonDiffer::patch(const Value& base, const Delta& delta) const
{
    return engine_.apply(base, delta);
}

Value JsonDiffer::patch_marshaled(const Value& base, const Value& marshaled_delta) const
{
    return engine_.apply(base, marshaler_.unmarshal(marshaled_delta));
}

std::string JsonDiffer::patch_text(std::string_view base, std::string_view delta) const
{
    const Value lhs = options_.loader->load(base);
    const Value d = options_.loader->load(delta);
    return options_.dumper->dump(patch_marshaled(lhs, d));
}

Value JsonDiffer::unpatch(const Value& target, const Delta& delta) const
{
    return engine_.revert(target, delta);
}

Value JsonDiffer::unpatch_marshaled(const Value& target, const Value& marshaled_delta) const
{
    return engine_.revert(target, marshaler_.unmarshal(marshaled_delta));
}

std::string JsonDiffer::unpatch_text(std::string_view target, std::string_view delta) const
{
    const Value rhs = options_.loader->load(target);
    const Value d = options_.loader->load(delta);
    return options_.dumper->dump(unpatch_marshaled(rhs, d));
}

// ============================================================
// Marshaling
// ============================================================

Value JsonDiffer::marshal(const Delta& delta) const
{
    return marshaler_.marshal(delta);
}

Delta JsonDiffer::unmarshal(const Value& value) const
{
    return marshaler_.unmarshal(value);
}

// ============================================================
// Shortcuts
// ============================================================

Delta diff(const Value& a, const Value& b)
{
    return JsonDiffer{}.diff(a, b);
}

Value patch(const Value& base, const Delta& delta)
{
    return JsonDiffer{}.patch(base, delta);
}

double similarity(const Value& a, const Value& b)
{
    return JsonDiffer{}.similarity(a, b);
}

} // namespace jsondelta
