#pragma once

/**
 * @file delta.h
 * @brief Delta and Change - the unit of communication between dataflow nodes.
 *
 * A Delta is a signed unit change to the multiplicity of one value. A Change pairs the
 * value with its delta. Collections never exchange snapshots, only Changes.
 */

#include <deltaflow/deltaflow_export.h>

#include <fmt/format.h>

#include <cstdint>
#include <string_view>

namespace deltaflow {

enum class Delta : std::int8_t { Insert = 1, Retract = -1 };

/**
 * @brief The opposite direction of a delta.
 */
[[nodiscard]] constexpr Delta negate(Delta delta) noexcept {
    return delta == Delta::Insert ? Delta::Retract : Delta::Insert;
}

/**
 * @brief The signed multiplicity change carried by a delta (+1 or -1).
 */
[[nodiscard]] constexpr int weight(Delta delta) noexcept { return static_cast<int>(delta); }

[[nodiscard]] DELTAFLOW_EXPORT std::string_view to_string(Delta delta) noexcept;

template<typename T>
struct Change {
    T value;
    Delta delta;

    [[nodiscard]] bool is_insert() const noexcept { return delta == Delta::Insert; }
    [[nodiscard]] bool is_retract() const noexcept { return delta == Delta::Retract; }

    bool operator==(const Change &) const = default;
};

template<typename T>
Change(T, Delta) -> Change<T>;

template<typename T>
[[nodiscard]] Change<T> insert_of(T value) { return Change<T>{std::move(value), Delta::Insert}; }

template<typename T>
[[nodiscard]] Change<T> retract_of(T value) { return Change<T>{std::move(value), Delta::Retract}; }

} // namespace deltaflow

template<>
struct fmt::formatter<deltaflow::Delta> : fmt::formatter<std::string_view> {
    auto format(deltaflow::Delta delta, fmt::format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(deltaflow::to_string(delta), ctx);
    }
};

template<typename T>
    requires fmt::is_formattable<T>::value
struct fmt::formatter<deltaflow::Change<T>> {
    constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

    auto format(const deltaflow::Change<T> &change, fmt::format_context &ctx) const {
        return fmt::format_to(ctx.out(), "{}{}", change.delta == deltaflow::Delta::Insert ? '+' : '-', change.value);
    }
};
