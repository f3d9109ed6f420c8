// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// delta_syntax.cpp - built-in syntax registry

#include <jsondelta/delta_syntax.h>
#include <jsondelta/errors.h>

#include <string>

namespace jsondelta {

std::shared_ptr<const DeltaSyntax> builtin_syntax(std::string_view name)
{
    // Stateless, so one shared instance each is enough
    static const auto compact = std::make_shared<const CompactSyntax>();
    static const auto symmetric = std::make_shared<const SymmetricSyntax>();

    if (name == compact->name()) return compact;
    if (name == symmetric->name()) return symmetric;

    detail::log_access_error("builtin_syntax", "unknown syntax '" + std::string(name) + "'");
    throw ConfigError("unknown delta syntax: '" + std::string(name) + "'");
}

} // namespace jsondelta
