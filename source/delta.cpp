// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// delta.cpp - Delta tree construction, lowering and diagnostics

#include <jsondelta/delta.h>
#include <jsondelta/builders.h>
#include <jsondelta/errors.h>

#include <charconv>
#include <sstream>

namespace jsondelta {

namespace {

DeltaMap lift_map(const ValueMap& m)
{
    auto transient = DeltaMap{}.transient();
    for (const auto& [k, v] : m) {
        transient.set(DeltaKey{k}, DeltaBox{Delta{v.get()}});
    }
    return transient.persistent();
}

void write_delta(const Delta& delta, std::ostringstream& oss)
{
    if (auto* v = delta.as_value()) {
        oss << value_to_string(*v);
        return;
    }
    const auto& m = *delta.as_map();
    oss << "{";
    bool first = true;
    for (const auto& [k, v] : m) {
        if (!first) oss << ", ";
        first = false;
        if (auto* marker = std::get_if<Marker>(&k)) {
            oss << "<" << marker_label(*marker) << ">";
        } else {
            oss << "\"" << std::get<std::string>(k) << "\"";
        }
        oss << ": ";
        write_delta(v.get(), oss);
    }
    oss << "}";
}

} // anonymous namespace

Delta::Delta(const Value& v)
{
    if (auto* m = v.get_if<ValueMap>()) {
        data = lift_map(*m);
    } else {
        data = v;
    }
}

Delta Delta::object(std::initializer_list<std::pair<DeltaKey, Delta>> init)
{
    DeltaMapBuilder builder;
    for (const auto& [k, v] : init) {
        builder.set(k, v);
    }
    return builder.finish();
}

const Delta* Delta::find(const DeltaKey& key) const
{
    if (auto* m = as_map()) {
        if (auto* found = m->find(key)) return &found->get();
    }
    return nullptr;
}

bool Delta::has_markers() const
{
    if (auto* m = as_map()) {
        for (const auto& [k, v] : *m) {
            if (std::holds_alternative<Marker>(k)) return true;
        }
    }
    return false;
}

Value Delta::to_value() const
{
    if (auto* v = as_value()) {
        return *v;
    }
    MapBuilder builder;
    for (const auto& [k, v] : *as_map()) {
        auto* key = std::get_if<std::string>(&k);
        if (!key) {
            throw InvalidDeltaError("marker '" + std::string(marker_label(std::get<Marker>(k))) +
                                    "' cannot appear inside a value payload");
        }
        builder.set(*key, v.get().to_value());
    }
    return builder.finish();
}

bool operator==(const Delta& a, const Delta& b)
{
    if (&a == &b) return true;
    if (auto* av = a.as_value()) {
        auto* bv = b.as_value();
        return bv && *av == *bv;
    }
    auto* bm = b.as_map();
    if (!bm) return false;
    const auto& am = *a.as_map();
    if (am.size() != bm->size()) return false;
    for (const auto& [k, v] : am) {
        auto* other = bm->find(k);
        if (!other) return false;
        if (!(v.get() == other->get())) return false;
    }
    return true;
}

std::string position_key(std::size_t pos)
{
    return std::to_string(pos);
}

std::optional<std::size_t> parse_position(std::string_view key) noexcept
{
    if (key.empty()) return std::nullopt;
    std::size_t pos = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), pos);
    if (ec != std::errc{} || ptr != key.data() + key.size()) return std::nullopt;
    return pos;
}

std::string delta_to_string(const Delta& delta)
{
    std::ostringstream oss;
    write_delta(delta, oss);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Delta& delta)
{
    return os << delta_to_string(delta);
}

} // namespace jsondelta
