// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// patch.cpp - PatchEngine, PatchContext and shared patch helpers

#include <jsondelta/patch.h>
#include <jsondelta/builders.h>
#include <jsondelta/errors.h>

#include <algorithm>
#include <functional>
#include <string>

namespace jsondelta {

// ============================================================
// PatchContext
// ============================================================

PatchContext PatchContext::nested() const
{
    if (depth_ + 1 > max_depth_) {
        detail::log_access_error("PatchContext::nested",
                                 "nesting exceeds max depth " + std::to_string(max_depth_));
        throw DepthLimitError(max_depth_);
    }
    return PatchContext{depth_ + 1, max_depth_};
}

// ============================================================
// PatchEngine
// ============================================================

PatchEngine::PatchEngine(std::shared_ptr<const DeltaSyntax> syntax, std::size_t max_depth)
    : syntax_(std::move(syntax)), max_depth_(max_depth)
{
    if (!syntax_) {
        throw ConfigError("PatchEngine requires a delta syntax");
    }
}

Value PatchEngine::apply(const Value& base, const Delta& delta) const
{
    return syntax_->patch(PatchContext{max_depth_}, base, delta);
}

Value PatchEngine::revert(const Value& target, const Delta& delta) const
{
    return syntax_->unpatch(PatchContext{max_depth_}, target, delta);
}

// ============================================================
// Helpers
// ============================================================

namespace detail {

void reject_delta(std::string_view func, const std::string& message)
{
    log_access_error(func, message);
    throw InvalidDeltaError(message);
}

std::vector<Value> payload_list(const Delta& payload, std::string_view what)
{
    std::vector<Value> result;
    const Value* v = payload.as_value();
    if (v) {
        if (auto* vec = v->get_if<ValueVector>()) {
            result.reserve(vec->size());
            for (const auto& item : *vec) result.push_back(item.get());
            return result;
        }
        if (auto* arr = v->get_if<ValueArray>()) {
            result.reserve(arr->size());
            for (const auto& item : *arr) result.push_back(item.get());
            return result;
        }
    }
    reject_delta(what, std::string(what) + " payload must be a list");
}

std::size_t payload_position(const Value& v, std::string_view what)
{
    if (auto* i = v.get_if<std::int64_t>()) {
        if (*i >= 0) return static_cast<std::size_t>(*i);
    }
    reject_delta(what, std::string(what) + " position must be a non-negative integer, got " +
                           value_to_string(v));
}

std::size_t key_position(const DeltaKey& key, std::string_view what)
{
    if (auto* marker = std::get_if<Marker>(&key)) {
        reject_delta(what, "unexpected marker '" + std::string(marker_label(*marker)) +
                               "' in sequence delta");
    }
    const auto& text = std::get<std::string>(key);
    if (auto pos = parse_position(text)) {
        return *pos;
    }
    reject_delta(what, "sequence delta key '" + text + "' is not a position");
}

std::vector<std::pair<std::size_t, Value>> positioned_entries(const Delta& payload, std::string_view what)
{
    std::vector<std::pair<std::size_t, Value>> entries;
    for (const auto& entry : payload_list(payload, what)) {
        if (!entry.is_sequence() || entry.size() != 2) {
            reject_delta(what, std::string(what) + " entry must be a [position, value] pair, got " +
                                   value_to_string(entry));
        }
        entries.emplace_back(payload_position(entry.at(std::size_t{0}), what), entry.at(std::size_t{1}));
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& l, const auto& r) { return l.first < r.first; });
    return entries;
}

void erase_positions(std::vector<ValueBox>& items, std::vector<std::size_t> positions,
                     std::string_view what)
{
    // High-to-low so that earlier removals do not shift later ones
    std::sort(positions.begin(), positions.end(), std::greater<>{});
    for (std::size_t i = 0; i < positions.size(); ++i) {
        const std::size_t pos = positions[i];
        if (i > 0 && positions[i - 1] == pos) {
            reject_delta(what, "position " + std::to_string(pos) + " deleted twice");
        }
        if (pos >= items.size()) {
            log_index_error(what, pos, "out of range");
            throw OutOfRangeError(pos, items.size());
        }
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(pos));
    }
}

void insert_entries(std::vector<ValueBox>& items,
                    const std::vector<std::pair<std::size_t, Value>>& entries,
                    std::string_view what)
{
    for (const auto& [pos, value] : entries) {
        if (pos > items.size()) {
            log_index_error(what, pos, "out of range");
            throw OutOfRangeError(pos, items.size());
        }
        items.insert(items.begin() + static_cast<std::ptrdiff_t>(pos), ValueBox{value});
    }
}

std::vector<ValueBox> sequence_items(const Value& seq)
{
    if (auto* vec = seq.get_if<ValueVector>()) {
        return std::vector<ValueBox>(vec->begin(), vec->end());
    }
    if (auto* arr = seq.get_if<ValueArray>()) {
        return std::vector<ValueBox>(arr->begin(), arr->end());
    }
    return {};
}

Value rebuild_sequence(const Value& like, const std::vector<ValueBox>& items)
{
    if (like.is_array()) {
        ArrayBuilder builder;
        for (const auto& box : items) builder.push_back_box(box);
        return builder.finish();
    }
    VectorBuilder builder;
    for (const auto& box : items) builder.push_back_box(box);
    return builder.finish();
}

Value edit_set(const Value& base, const std::vector<Value>& remove, const std::vector<Value>& add)
{
    SetBuilder builder{std::get<ValueSet>(base.data)};
    for (const auto& v : remove) builder.erase(v);
    for (const auto& v : add) builder.insert(v);
    return builder.finish();
}

} // namespace detail

} // namespace jsondelta
