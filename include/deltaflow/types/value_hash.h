#pragma once

/**
 * @file value_hash.h
 * @brief Identity strategy for values flowing through collections.
 *
 * Every value carried by a collection is identified by value equality. Operators that
 * keep per-value state (Input membership, flat-map per-item bookkeeping, join indexes,
 * with-latest tracking, the multicast output index) key their containers with
 * value_hash, which defers to ankerl::unordered_dense::hash (and through it std::hash)
 * and adds the compound types the standard library leaves unhashed.
 */

#include <ankerl/unordered_dense.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace deltaflow {

template<typename T>
struct value_hash;

/**
 * @brief Mix a further hash into a running seed.
 */
[[nodiscard]] inline std::uint64_t hash_combine(std::uint64_t seed, std::uint64_t value) noexcept {
    return ankerl::unordered_dense::hash<std::uint64_t>{}(
        seed ^ (value + 0x9e37'79b9'7f4a'7c15ULL + (seed << 6U) + (seed >> 2U)));
}

template<typename T>
    requires requires(const T &v) { { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>; }
struct value_hash<T> {
    [[nodiscard]] std::uint64_t operator()(const T &value) const {
        return ankerl::unordered_dense::hash<T>{}(value);
    }
};

template<typename A, typename B>
struct value_hash<std::pair<A, B>> {
    [[nodiscard]] std::uint64_t operator()(const std::pair<A, B> &value) const {
        return hash_combine(value_hash<A>{}(value.first), value_hash<B>{}(value.second));
    }
};

template<typename... Ts>
struct value_hash<std::tuple<Ts...>> {
    [[nodiscard]] std::uint64_t operator()(const std::tuple<Ts...> &value) const {
        return std::apply(
            [](const Ts &... xs) {
                std::uint64_t seed{sizeof...(Ts)};
                ((seed = hash_combine(seed, value_hash<Ts>{}(xs))), ...);
                return seed;
            },
            value);
    }
};

template<typename T, typename Alloc>
struct value_hash<std::vector<T, Alloc>> {
    [[nodiscard]] std::uint64_t operator()(const std::vector<T, Alloc> &value) const {
        std::uint64_t seed{value.size()};
        for (const auto &v: value) { seed = hash_combine(seed, value_hash<T>{}(v)); }
        return seed;
    }
};

template<typename T>
struct value_hash<std::optional<T>> {
    [[nodiscard]] std::uint64_t operator()(const std::optional<T> &value) const {
        return value ? hash_combine(1U, value_hash<T>{}(*value)) : 0U;
    }
};

/**
 * @brief A type that can travel through a collection.
 *
 * Copyable (values are replayed and retained by operators), equality comparable and
 * hashable by value_hash.
 */
template<typename T>
concept Element = std::copy_constructible<T> && std::equality_comparable<T> && requires(const T &v) {
    { value_hash<T>{}(v) } -> std::convertible_to<std::uint64_t>;
};

/// Hash map keyed by value identity
template<typename K, typename V>
using ValueMap = ankerl::unordered_dense::map<K, V, value_hash<K>>;

/// Hash set keyed by value identity
template<typename K>
using ValueSet = ankerl::unordered_dense::set<K, value_hash<K>>;

} // namespace deltaflow
