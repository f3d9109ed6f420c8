// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// compact_syntax.cpp - the default, minimal delta syntax

#include <jsondelta/delta_syntax.h>
#include <jsondelta/builders.h>
#include <jsondelta/errors.h>
#include <jsondelta/patch.h>

#include <string>

namespace jsondelta {

namespace {

// {replace: b} for maps (a bare map would read as a patch), b otherwise
Delta replacement(const Value& b)
{
    if (b.is_map()) {
        return Delta::object({{Marker::Replace, Delta{b}}});
    }
    return Delta{b};
}

Value value_list(const std::vector<Value>& values)
{
    VectorBuilder builder;
    for (const auto& v : values) builder.push_back(v);
    return builder.finish();
}

bool contains_markers(const Delta& delta)
{
    if (auto* m = delta.as_map()) {
        for (const auto& [k, v] : *m) {
            if (std::holds_alternative<Marker>(k) || contains_markers(v.get())) return true;
        }
    }
    return false;
}

Value patch_map(const CompactSyntax& syntax, const PatchContext& ctx,
                const Value& base, const DeltaMap& delta)
{
    MapBuilder builder{std::get<ValueMap>(base.data)};
    const Delta* deleted = nullptr;

    for (const auto& [k, v] : delta) {
        if (auto* marker = std::get_if<Marker>(&k)) {
            if (*marker == Marker::Delete) {
                deleted = &v.get();
                continue;
            }
            detail::reject_delta("CompactSyntax::patch",
                                 "marker '" + std::string(marker_label(*marker)) +
                                     "' cannot be applied to a map");
        }
        const auto& key = std::get<std::string>(k);
        if (auto* current = builder.find(key)) {
            builder.set(key, syntax.patch(ctx.nested(), current->get(), v.get()));
        } else if (contains_markers(v.get())) {
            // A nested edit needs an existing value to apply to
            detail::log_key_error("CompactSyntax::patch", key, "not found");
            throw MissingKeyError(key);
        } else {
            builder.set(key, v.get().to_value());
        }
    }

    if (deleted) {
        for (const auto& key : detail::payload_list(*deleted, "delete")) {
            if (!key.is_string()) {
                detail::reject_delta("CompactSyntax::patch",
                                     "map delete entry must be a key, got " + value_to_string(key));
            }
            if (!builder.erase(key.as_string())) {
                detail::log_key_error("CompactSyntax::patch", key.as_string_view(), "not found");
                throw MissingKeyError(key.as_string());
            }
        }
    }
    return builder.finish();
}

Value patch_sequence(const CompactSyntax& syntax, const PatchContext& ctx,
                     const Value& base, const DeltaMap& delta)
{
    auto items = detail::sequence_items(base);

    if (auto* deleted = delta.find(DeltaKey{Marker::Delete})) {
        std::vector<std::size_t> positions;
        for (const auto& p : detail::payload_list(deleted->get(), "delete")) {
            positions.push_back(detail::payload_position(p, "delete"));
        }
        detail::erase_positions(items, std::move(positions), "CompactSyntax::patch");
    }

    if (auto* inserted = delta.find(DeltaKey{Marker::Insert})) {
        detail::insert_entries(items, detail::positioned_entries(inserted->get(), "insert"),
                               "CompactSyntax::patch");
    }

    for (const auto& [k, v] : delta) {
        if (auto* marker = std::get_if<Marker>(&k)) {
            if (*marker == Marker::Delete || *marker == Marker::Insert) continue;
        }
        const std::size_t pos = detail::key_position(k, "CompactSyntax::patch");
        if (pos >= items.size()) {
            detail::log_index_error("CompactSyntax::patch", pos, "out of range");
            throw OutOfRangeError(pos, items.size());
        }
        items[pos] = ValueBox{syntax.patch(ctx.nested(), items[pos].get(), v.get())};
    }

    return detail::rebuild_sequence(base, items);
}

Value patch_set(const Value& base, const DeltaMap& delta)
{
    std::vector<Value> discard;
    std::vector<Value> add;
    for (const auto& [k, v] : delta) {
        auto* marker = std::get_if<Marker>(&k);
        if (marker && *marker == Marker::Discard) {
            discard = detail::payload_list(v.get(), "discard");
        } else if (marker && *marker == Marker::Add) {
            add = detail::payload_list(v.get(), "add");
        } else {
            detail::reject_delta("CompactSyntax::patch", "set delta accepts only add and discard");
        }
    }
    return detail::edit_set(base, discard, add);
}

} // anonymous namespace

// ============================================================
// Emit
// ============================================================

Delta CompactSyntax::emit_set_diff(const Value& a, const Value& b, double s,
                                   const SetChanges& changes) const
{
    if (s == 0.0 || changes.removed.size() == a.size()) {
        return replacement(b);
    }
    DeltaMapBuilder builder;
    if (!changes.removed.empty()) {
        builder.set(Marker::Discard, value_list(changes.removed));
    }
    if (!changes.added.empty()) {
        builder.set(Marker::Add, value_list(changes.added));
    }
    return builder.finish();
}

Delta CompactSyntax::emit_list_diff(const Value& /*a*/, const Value& b, double s,
                                    const SequenceChanges& changes) const
{
    if (s == 0.0) return replacement(b);
    if (s == 1.0) return Delta{};

    DeltaMapBuilder builder;
    for (const auto& [pos, d] : changes.changed) {
        builder.set(position_key(pos), d);
    }
    if (!changes.inserted.empty()) {
        VectorBuilder entries;
        for (const auto& [pos, v] : changes.inserted) {
            entries.push_back(Value::vector({pos, v}));
        }
        builder.set(Marker::Insert, entries.finish());
    }
    if (!changes.deleted.empty()) {
        VectorBuilder positions;
        for (auto it = changes.deleted.rbegin(); it != changes.deleted.rend(); ++it) {
            positions.push_back(it->first);
        }
        builder.set(Marker::Delete, positions.finish());
    }
    return builder.finish();
}

Delta CompactSyntax::emit_dict_diff(const Value& /*a*/, const Value& b, double s,
                                    const MapChanges& changes) const
{
    if (s == 0.0) return replacement(b);
    if (s == 1.0) return Delta{};

    DeltaMapBuilder builder;
    for (const auto& [k, d] : changes.changed) {
        builder.set(k, d);
    }
    for (const auto& [k, v] : changes.added) {
        builder.set(k, v);
    }
    if (!changes.removed.empty()) {
        VectorBuilder keys;
        for (const auto& [k, v] : changes.removed) keys.push_back(k);
        builder.set(Marker::Delete, keys.finish());
    }
    return builder.finish();
}

Delta CompactSyntax::emit_value_diff(const Value& /*a*/, const Value& b, double s) const
{
    if (s == 1.0) return Delta{};
    return replacement(b);
}

// ============================================================
// Patch
// ============================================================

Value CompactSyntax::patch(const PatchContext& ctx, const Value& base, const Delta& delta) const
{
    if (auto* v = delta.as_value()) {
        return *v;
    }
    const auto& m = *delta.as_map();
    if (m.empty()) {
        return base;
    }
    if (auto* replaced = delta.find(DeltaKey{Marker::Replace})) {
        return replaced->to_value();
    }
    if (base.is_map()) {
        return patch_map(*this, ctx, base, m);
    }
    if (base.is_sequence()) {
        return patch_sequence(*this, ctx, base, m);
    }
    if (base.is_set()) {
        return patch_set(base, m);
    }
    return delta.to_value();
}

Value CompactSyntax::unpatch(const PatchContext& /*ctx*/, const Value& target, const Delta& delta) const
{
    if (delta.is_empty()) {
        return target;
    }

    // A set delta records both the removed and the added elements
    if (target.is_set() && delta.is_map()) {
        std::vector<Value> discard;
        std::vector<Value> add;
        bool set_shaped = true;
        for (const auto& [k, v] : *delta.as_map()) {
            auto* marker = std::get_if<Marker>(&k);
            if (marker && *marker == Marker::Discard) {
                discard = detail::payload_list(v.get(), "discard");
            } else if (marker && *marker == Marker::Add) {
                add = detail::payload_list(v.get(), "add");
            } else {
                set_shaped = false;
            }
        }
        if (set_shaped) {
            return detail::edit_set(target, add, discard);
        }
    }

    detail::log_access_error("CompactSyntax::unpatch",
                             "compact deltas only record the new side of this change");
    throw IrreversibleDeltaError(
        "compact syntax cannot unpatch " + std::string(shape_name(target)) +
        " delta; use the symmetric syntax");
}

} // namespace jsondelta
