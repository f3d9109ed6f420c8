// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file differ.h
/// @brief JsonDiffer: the configured entry point for diff, patch and unpatch.
///
/// Usage:
/// @code
///   #include <jsondelta/differ.h>
///
///   JsonDiffer differ;                        // compact syntax, "$" escape
///   Value a = Value::map({{"a", 1}, {"b", 2}});
///   Value b = Value::map({{"a", 1}, {"b", 3}});
///
///   Delta d = differ.diff(a, b);              // {"b": 3}
///   Value restored = differ.patch(a, d);      // == b
///   double s = differ.similarity(a, b);       // 0.75
///
///   // Text in, text out (load + marshal + dump)
///   std::string wire = differ.diff_text(R"({"x":[1,2]})", R"({"x":[1]})");
///   // {"x":{"$delete":[1]}}
///
///   // Wire-form deltas go through the *_marshaled overloads
///   Value wire_delta = differ.diff_marshaled(a, b);
///   Value same = differ.patch_marshaled(a, wire_delta);  // == b
///
///   DifferOptions opts;
///   opts.syntax = builtin_syntax("symmetric");
///   JsonDiffer reversible{opts};
///   Value original = reversible.unpatch(b, reversible.diff(a, b));  // == a
/// @endcode
///
/// A JsonDiffer holds no mutable state and may serve concurrent callers.

#pragma once

#include "delta_syntax.h"
#include "marshal.h"
#include "patch.h"
#include "serialization.h"
#include "value_diff.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace jsondelta {

struct DifferOptions {
    /// Delta shape; "compact" when null
    std::shared_ptr<const DeltaSyntax> syntax;
    /// Text boundary; JsonLoader / JsonDumper when null
    std::shared_ptr<const Loader> loader;
    std::shared_ptr<const Dumper> dumper;
    /// Prefix that marks reserved keys on the wire; must not be empty
    std::string escape_str = "$";
    /// Nesting limit for diff and patch
    std::size_t max_depth = JSONDELTA_DEFAULT_MAX_DEPTH;
};

class JSONDELTA_API JsonDiffer {
public:
    /// @throws ConfigError on an invalid escape token or a zero depth limit
    explicit JsonDiffer(DifferOptions options = {});

    // ============================================================
    // Diff
    // ============================================================

    [[nodiscard]] Delta diff(const Value& a, const Value& b) const;

    /// diff() followed by marshal()
    [[nodiscard]] Value diff_marshaled(const Value& a, const Value& b) const;

    /// Load both texts, diff, marshal and dump the delta
    [[nodiscard]] std::string diff_text(std::string_view a, std::string_view b) const;

    [[nodiscard]] double similarity(const Value& a, const Value& b) const;
    [[nodiscard]] double similarity_text(std::string_view a, std::string_view b) const;

    // ============================================================
    // Patch / unpatch
    // ============================================================

    [[nodiscard]] Value patch(const Value& base, const Delta& delta) const;

    /// unmarshal() followed by patch(). The argument is the wire form, so
    /// "$delete" keys are markers here; patch(base, Delta{v}) would treat
    /// @p marshaled_delta as a literal replacement instead.
    [[nodiscard]] Value patch_marshaled(const Value& base, const Value& marshaled_delta) const;

    /// Load base and delta, patch, and dump the result
    [[nodiscard]] std::string patch_text(std::string_view base, std::string_view delta) const;

    [[nodiscard]] Value unpatch(const Value& target, const Delta& delta) const;
    [[nodiscard]] Value unpatch_marshaled(const Value& target, const Value& marshaled_delta) const;
    [[nodiscard]] std::string unpatch_text(std::string_view target, std::string_view delta) const;

    // ============================================================
    // Marshaling
    // ============================================================

    [[nodiscard]] Value marshal(const Delta& delta) const;
    [[nodiscard]] Delta unmarshal(const Value& value) const;

    [[nodiscard]] const DeltaSyntax& syntax() const noexcept { return *options_.syntax; }
    [[nodiscard]] const DifferOptions& options() const noexcept { return options_; }

private:
    DifferOptions options_;
    Marshaler marshaler_;
    PatchEngine engine_;
};

// ============================================================
// Shortcuts using a default-configured JsonDiffer
// ============================================================

[[nodiscard]] JSONDELTA_API Delta diff(const Value& a, const Value& b);
[[nodiscard]] JSONDELTA_API Value patch(const Value& base, const Delta& delta);
[[nodiscard]] JSONDELTA_API double similarity(const Value& a, const Value& b);

} // namespace jsondelta
