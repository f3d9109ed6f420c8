// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value construction, equality, hashing and diagnostics

#include <jsondelta/value.h>
#include <jsondelta/builders.h>

#include <functional>
#include <sstream>

namespace jsondelta {

namespace {

// Distinct seeds so that e.g. an empty vector, an empty array and an
// empty set do not all hash to the same bucket
constexpr std::size_t null_seed   = 0x9e3779b97f4a7c15ull;
constexpr std::size_t map_seed    = 0x51afd7ed558ccd1dull;
constexpr std::size_t vector_seed = 0xc4ceb9fe1a85ec53ull;
constexpr std::size_t array_seed  = 0x2545f4914f6cdd1dull;
constexpr std::size_t set_seed    = 0x94d049bb133111ebull;

inline std::size_t hash_combine(std::size_t seed, std::size_t h) noexcept
{
    return seed ^ (h + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

inline std::size_t hash_number(double d) noexcept
{
    // -0.0 == 0.0, so both must hash alike
    if (d == 0.0) d = 0.0;
    return std::hash<double>{}(d);
}

bool numbers_equal(const Value& a, const Value& b) noexcept
{
    auto* ai = a.get_if<std::int64_t>();
    auto* bi = b.get_if<std::int64_t>();
    if (ai && bi) return *ai == *bi;
    return a.as_number() == b.as_number();
}

template <typename Seq>
bool sequences_equal(const Seq& a, const Seq& b)
{
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto& x = a[i];
        const auto& y = b[i];
        if (&x.get() == &y.get()) continue;
        if (!(x.get() == y.get())) return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================
// Factories
// ============================================================

Value Value::map(std::initializer_list<std::pair<std::string, Value>> init)
{
    MapBuilder builder;
    for (const auto& [k, v] : init) {
        builder.set(k, v);
    }
    return builder.finish();
}

Value Value::vector(std::initializer_list<Value> init)
{
    VectorBuilder builder;
    for (const auto& v : init) {
        builder.push_back(v);
    }
    return builder.finish();
}

Value Value::array(std::initializer_list<Value> init)
{
    ArrayBuilder builder;
    for (const auto& v : init) {
        builder.push_back(v);
    }
    return builder.finish();
}

Value Value::set(std::initializer_list<Value> init)
{
    SetBuilder builder;
    for (const auto& v : init) {
        builder.insert(v);
    }
    return builder.finish();
}

// ============================================================
// Access
// ============================================================

Value Value::at(const std::string& key) const
{
    if (auto* m = get_if<ValueMap>()) {
        if (auto* found = m->find(key)) return found->get();
    }
    detail::log_key_error("Value::at", key, "not found or type mismatch");
    return Value{};
}

Value Value::at(std::size_t index) const
{
    if (auto* v = get_if<ValueVector>()) {
        if (index < v->size()) return (*v)[index].get();
    }
    if (auto* a = get_if<ValueArray>()) {
        if (index < a->size()) return (*a)[index].get();
    }
    detail::log_index_error("Value::at", index, "out of range or type mismatch");
    return Value{};
}

std::size_t Value::size() const noexcept
{
    return std::visit([](const auto& arg) -> std::size_t {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ValueMap> ||
                      std::is_same_v<T, ValueVector> ||
                      std::is_same_v<T, ValueArray> ||
                      std::is_same_v<T, ValueSet>) {
            return arg.size();
        } else {
            return 0;
        }
    }, data);
}

// ============================================================
// Equality
// ============================================================

bool operator==(const Value& a, const Value& b)
{
    if (&a == &b) return true;

    if (a.is_number() && b.is_number()) {
        return numbers_equal(a, b);
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const T& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (lhs.size() != rhs.size()) return false;
            for (const auto& [k, v] : lhs) {
                auto* other = rhs.find(k);
                if (!other) return false;
                if (&v.get() != &other->get() && !(v.get() == other->get())) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, ValueVector> ||
                             std::is_same_v<T, ValueArray>) {
            return sequences_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            if (lhs.size() != rhs.size()) return false;
            for (const auto& v : lhs) {
                if (!rhs.count(v)) return false;
            }
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

// ============================================================
// Hashing
// ============================================================

std::size_t hash_value(const Value& val) noexcept
{
    return std::visit([](const auto& arg) -> std::size_t {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return null_seed;
        } else if constexpr (std::is_same_v<T, bool>) {
            return hash_combine(null_seed, arg ? 1u : 2u);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return hash_number(static_cast<double>(arg));
        } else if constexpr (std::is_same_v<T, double>) {
            return hash_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return std::hash<std::string>{}(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            // Order-independent: sum of per-entry hashes
            std::size_t sum = map_seed;
            for (const auto& [k, v] : arg) {
                sum += hash_combine(std::hash<std::string>{}(k), hash_value(v.get()));
            }
            return sum;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            std::size_t seed = vector_seed;
            for (const auto& v : arg) {
                seed = hash_combine(seed, hash_value(v.get()));
            }
            return seed;
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            std::size_t seed = array_seed;
            for (const auto& v : arg) {
                seed = hash_combine(seed, hash_value(v.get()));
            }
            return seed;
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            std::size_t sum = set_seed;
            for (const auto& v : arg) {
                sum += hash_combine(set_seed, hash_value(v.get()));
            }
            return sum;
        }
    }, val.data);
}

std::size_t ValueHash::operator()(const Value& val) const noexcept
{
    return hash_value(val);
}

std::size_t ValueHash::operator()(const ValueBox& box) const noexcept
{
    return hash_value(box.get());
}

// ============================================================
// Diagnostics
// ============================================================

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, ValueSet>) {
            return "<set:" + std::to_string(arg.size()) + ">";
        } else {
            return "null";
        }
    }, val.data);
}

std::string_view shape_name(const Value& val) noexcept
{
    if (val.is_map()) return "map";
    if (val.is_vector()) return "vector";
    if (val.is_array()) return "array";
    if (val.is_set()) return "set";
    return "scalar";
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << value_to_string(val);
}

} // namespace jsondelta
