// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// symmetric_syntax.cpp - reversible delta syntax
//
// Wire shape:
//   replacement / scalar change : [old, new]
//   map                         : {key: delta, insert: {k: v}, delete: {k: v}}
//   sequence                    : {"pos": delta, insert: [[pos, v]], delete: [[pos, v]]}
//   set                         : {add: [...], discard: [...]}

#include <jsondelta/delta_syntax.h>
#include <jsondelta/builders.h>
#include <jsondelta/errors.h>
#include <jsondelta/patch.h>

#include <string>

namespace jsondelta {

namespace {

constexpr std::string_view patch_fn = "SymmetricSyntax::patch";
constexpr std::string_view unpatch_fn = "SymmetricSyntax::unpatch";

Delta both_sides(const Value& a, const Value& b)
{
    return Delta{Value::vector({a, b})};
}

/// The [old, new] pair of a replacement delta
const ValueVector& replacement_pair(const Value& v, std::string_view func)
{
    auto* pair = v.get_if<ValueVector>();
    if (!pair || pair->size() != 2) {
        detail::reject_delta(func, "replacement must be an [old, new] pair, got " + value_to_string(v));
    }
    return *pair;
}

Value value_list(const std::vector<Value>& values)
{
    VectorBuilder builder;
    for (const auto& v : values) builder.push_back(v);
    return builder.finish();
}

Value positioned_list(const std::vector<std::pair<std::size_t, Value>>& entries, bool descending)
{
    VectorBuilder builder;
    auto push = [&builder](const std::pair<std::size_t, Value>& e) {
        builder.push_back(Value::vector({e.first, e.second}));
    };
    if (descending) {
        for (auto it = entries.rbegin(); it != entries.rend(); ++it) push(*it);
    } else {
        for (const auto& e : entries) push(e);
    }
    return builder.finish();
}

/// {key: value} payload of map insert / delete
std::vector<std::pair<std::string, Value>> keyed_entries(const Delta& payload, std::string_view func)
{
    std::vector<std::pair<std::string, Value>> entries;
    auto* m = payload.as_map();
    if (!m) {
        detail::reject_delta(func, "map insert/delete payload must be a {key: value} map");
    }
    for (const auto& [k, v] : *m) {
        auto* key = std::get_if<std::string>(&k);
        if (!key) {
            detail::reject_delta(func, "map insert/delete payload cannot contain markers");
        }
        entries.emplace_back(*key, v.get().to_value());
    }
    return entries;
}

std::vector<std::size_t> positions_of(const std::vector<std::pair<std::size_t, Value>>& entries)
{
    std::vector<std::size_t> positions;
    positions.reserve(entries.size());
    for (const auto& [pos, v] : entries) positions.push_back(pos);
    return positions;
}

struct SetEdit {
    std::vector<Value> add;
    std::vector<Value> discard;
};

SetEdit set_edit(const DeltaMap& delta, std::string_view func)
{
    SetEdit edit;
    for (const auto& [k, v] : delta) {
        auto* marker = std::get_if<Marker>(&k);
        if (marker && *marker == Marker::Add) {
            edit.add = detail::payload_list(v.get(), "add");
        } else if (marker && *marker == Marker::Discard) {
            edit.discard = detail::payload_list(v.get(), "discard");
        } else {
            detail::reject_delta(func, "set delta accepts only add and discard");
        }
    }
    return edit;
}

void erase_key(MapBuilder& builder, const std::string& key, std::string_view func)
{
    if (!builder.erase(key)) {
        detail::log_key_error(func, key, "not found");
        throw MissingKeyError(key);
    }
}

} // anonymous namespace

// ============================================================
// Emit
// ============================================================

Delta SymmetricSyntax::emit_set_diff(const Value& a, const Value& b, double s,
                                     const SetChanges& changes) const
{
    if (s == 0.0 || changes.removed.size() == a.size()) {
        return both_sides(a, b);
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

Delta SymmetricSyntax::emit_list_diff(const Value& a, const Value& b, double s,
                                      const SequenceChanges& changes) const
{
    if (s == 0.0) return both_sides(a, b);
    if (s == 1.0) return Delta{};

    DeltaMapBuilder builder;
    for (const auto& [pos, d] : changes.changed) {
        builder.set(position_key(pos), d);
    }
    if (!changes.inserted.empty()) {
        builder.set(Marker::Insert, positioned_list(changes.inserted, false));
    }
    if (!changes.deleted.empty()) {
        builder.set(Marker::Delete, positioned_list(changes.deleted, true));
    }
    return builder.finish();
}

Delta SymmetricSyntax::emit_dict_diff(const Value& a, const Value& b, double s,
                                      const MapChanges& changes) const
{
    if (s == 0.0) return both_sides(a, b);
    if (s == 1.0) return Delta{};

    DeltaMapBuilder builder;
    for (const auto& [k, d] : changes.changed) {
        builder.set(k, d);
    }
    if (!changes.added.empty()) {
        MapBuilder added;
        for (const auto& [k, v] : changes.added) added.set(k, v);
        builder.set(Marker::Insert, added.finish());
    }
    if (!changes.removed.empty()) {
        MapBuilder removed;
        for (const auto& [k, v] : changes.removed) removed.set(k, v);
        builder.set(Marker::Delete, removed.finish());
    }
    return builder.finish();
}

Delta SymmetricSyntax::emit_value_diff(const Value& a, const Value& b, double s) const
{
    if (s == 1.0) return Delta{};
    return both_sides(a, b);
}

// ============================================================
// Patch
// ============================================================

Value SymmetricSyntax::patch(const PatchContext& ctx, const Value& base, const Delta& delta) const
{
    if (auto* v = delta.as_value()) {
        return replacement_pair(*v, patch_fn)[1].get();
    }
    const auto& m = *delta.as_map();
    if (m.empty()) {
        return base;
    }

    if (base.is_map()) {
        MapBuilder builder{std::get<ValueMap>(base.data)};
        const Delta* inserted = nullptr;
        const Delta* deleted = nullptr;
        for (const auto& [k, v] : m) {
            if (auto* marker = std::get_if<Marker>(&k)) {
                if (*marker == Marker::Insert) {
                    inserted = &v.get();
                } else if (*marker == Marker::Delete) {
                    deleted = &v.get();
                } else {
                    detail::reject_delta(patch_fn, "marker '" + std::string(marker_label(*marker)) +
                                                       "' cannot be applied to a map");
                }
                continue;
            }
            const auto& key = std::get<std::string>(k);
            auto* current = builder.find(key);
            if (!current) {
                detail::log_key_error(patch_fn, key, "not found");
                throw MissingKeyError(key);
            }
            builder.set(key, patch(ctx.nested(), current->get(), v.get()));
        }
        if (inserted) {
            for (auto& [key, value] : keyed_entries(*inserted, patch_fn)) {
                builder.set(key, std::move(value));
            }
        }
        if (deleted) {
            for (const auto& [key, value] : keyed_entries(*deleted, patch_fn)) {
                erase_key(builder, key, patch_fn);
            }
        }
        return builder.finish();
    }

    if (base.is_sequence()) {
        auto items = detail::sequence_items(base);
        if (auto* deleted = m.find(DeltaKey{Marker::Delete})) {
            detail::erase_positions(items, positions_of(detail::positioned_entries(deleted->get(), "delete")),
                                    patch_fn);
        }
        if (auto* inserted = m.find(DeltaKey{Marker::Insert})) {
            detail::insert_entries(items, detail::positioned_entries(inserted->get(), "insert"), patch_fn);
        }
        for (const auto& [k, v] : m) {
            if (auto* marker = std::get_if<Marker>(&k)) {
                if (*marker == Marker::Delete || *marker == Marker::Insert) continue;
            }
            const std::size_t pos = detail::key_position(k, patch_fn);
            if (pos >= items.size()) {
                detail::log_index_error(patch_fn, pos, "out of range");
                throw OutOfRangeError(pos, items.size());
            }
            items[pos] = ValueBox{patch(ctx.nested(), items[pos].get(), v.get())};
        }
        return detail::rebuild_sequence(base, items);
    }

    if (base.is_set()) {
        auto edit = set_edit(m, patch_fn);
        return detail::edit_set(base, edit.discard, edit.add);
    }

    detail::reject_delta(patch_fn, "structured delta cannot be applied to a " +
                                       std::string(shape_name(base)));
}

// ============================================================
// Unpatch
// ============================================================

Value SymmetricSyntax::unpatch(const PatchContext& ctx, const Value& target, const Delta& delta) const
{
    if (auto* v = delta.as_value()) {
        return replacement_pair(*v, unpatch_fn)[0].get();
    }
    const auto& m = *delta.as_map();
    if (m.empty()) {
        return target;
    }

    if (target.is_map()) {
        MapBuilder builder{std::get<ValueMap>(target.data)};
        const Delta* inserted = nullptr;
        const Delta* deleted = nullptr;
        for (const auto& [k, v] : m) {
            if (auto* marker = std::get_if<Marker>(&k)) {
                if (*marker == Marker::Insert) {
                    inserted = &v.get();
                } else if (*marker == Marker::Delete) {
                    deleted = &v.get();
                } else {
                    detail::reject_delta(unpatch_fn, "marker '" + std::string(marker_label(*marker)) +
                                                         "' cannot be applied to a map");
                }
                continue;
            }
            const auto& key = std::get<std::string>(k);
            auto* current = builder.find(key);
            if (!current) {
                detail::log_key_error(unpatch_fn, key, "not found");
                throw MissingKeyError(key);
            }
            builder.set(key, unpatch(ctx.nested(), current->get(), v.get()));
        }
        if (inserted) {
            for (const auto& [key, value] : keyed_entries(*inserted, unpatch_fn)) {
                erase_key(builder, key, unpatch_fn);
            }
        }
        if (deleted) {
            for (auto& [key, value] : keyed_entries(*deleted, unpatch_fn)) {
                builder.set(key, std::move(value));
            }
        }
        return builder.finish();
    }

    if (target.is_sequence()) {
        auto items = detail::sequence_items(target);
        for (const auto& [k, v] : m) {
            if (auto* marker = std::get_if<Marker>(&k)) {
                if (*marker == Marker::Delete || *marker == Marker::Insert) continue;
            }
            const std::size_t pos = detail::key_position(k, unpatch_fn);
            if (pos >= items.size()) {
                detail::log_index_error(unpatch_fn, pos, "out of range");
                throw OutOfRangeError(pos, items.size());
            }
            items[pos] = ValueBox{unpatch(ctx.nested(), items[pos].get(), v.get())};
        }
        if (auto* inserted = m.find(DeltaKey{Marker::Insert})) {
            detail::erase_positions(items, positions_of(detail::positioned_entries(inserted->get(), "insert")),
                                    unpatch_fn);
        }
        if (auto* deleted = m.find(DeltaKey{Marker::Delete})) {
            detail::insert_entries(items, detail::positioned_entries(deleted->get(), "delete"), unpatch_fn);
        }
        return detail::rebuild_sequence(target, items);
    }

    if (target.is_set()) {
        auto edit = set_edit(m, unpatch_fn);
        return detail::edit_set(target, edit.add, edit.discard);
    }

    detail::reject_delta(unpatch_fn, "structured delta cannot be reverted on a " +
                                         std::string(shape_name(target)));
}

} // namespace jsondelta
