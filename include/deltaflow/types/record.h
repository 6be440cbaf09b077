#pragma once

/**
 * @file record.h
 * @brief Value and Record - the dynamically typed data carried by a Context.
 *
 * A Context merges inputs of different types into one reactive record, so its fields hold a
 * Value: a closed variant of the scalar types the engine knows how to compare, hash and print.
 * A Record maps field names to Values, ordered by name.
 */

#include <deltaflow/deltaflow_export.h>
#include <deltaflow/types/value_hash.h>
#include <deltaflow/util/errors.h>

#include <fmt/format.h>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace deltaflow {

using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

[[nodiscard]] DELTAFLOW_EXPORT std::string to_string(const Value &value);

/**
 * @brief The name of the alternative held ("none", "bool", "int", "float", "string").
 */
[[nodiscard]] DELTAFLOW_EXPORT std::string_view type_name(const Value &value) noexcept;

template<typename T>
[[nodiscard]] constexpr std::string_view value_type_name() noexcept {
    if constexpr (std::is_same_v<T, bool>) {
        return "bool";
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return "int";
    } else if constexpr (std::is_same_v<T, double>) {
        return "float";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "string";
    } else {
        return "none";
    }
}

class DELTAFLOW_EXPORT Record {
public:
    using fields_type = std::map<std::string, Value, std::less<>>;

    Record() = default;

    Record(std::initializer_list<fields_type::value_type> fields) : fields_{fields} {}

    /**
     * @brief A copy of this record with name set to value.
     */
    [[nodiscard]] Record with(std::string name, Value value) const;

    /**
     * @brief The value of field name.
     * @throws std::out_of_range if the record has no such field
     */
    [[nodiscard]] const Value &get(std::string_view name) const;

    /**
     * @brief The value of field name as T.
     * @throws std::out_of_range if the record has no such field
     * @throws bad_value_type if the field holds another alternative
     */
    template<typename T>
    [[nodiscard]] const T &get(std::string_view name) const {
        const auto &value = get(name);
        if (const auto *typed = std::get_if<T>(&value)) { return *typed; }
        throw_error<bad_value_type>(name, value_type_name<T>(), type_name(value));
    }

    /**
     * @brief The value of field name, none when absent.
     */
    [[nodiscard]] Value value_or_none(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const { return fields_.find(name) != fields_.end(); }

    [[nodiscard]] std::size_t size() const { return fields_.size(); }

    [[nodiscard]] bool empty() const { return fields_.empty(); }

    [[nodiscard]] const fields_type &fields() const { return fields_; }

    bool operator==(const Record &) const = default;

private:
    fields_type fields_;
};

[[nodiscard]] DELTAFLOW_EXPORT std::string to_string(const Record &record);

template<>
struct value_hash<Record> {
    [[nodiscard]] DELTAFLOW_EXPORT std::uint64_t operator()(const Record &record) const;
};

} // namespace deltaflow

template<>
struct fmt::formatter<deltaflow::Value> : fmt::formatter<std::string> {
    auto format(const deltaflow::Value &value, fmt::format_context &ctx) const {
        return fmt::formatter<std::string>::format(deltaflow::to_string(value), ctx);
    }
};

template<>
struct fmt::formatter<deltaflow::Record> : fmt::formatter<std::string> {
    auto format(const deltaflow::Record &record, fmt::format_context &ctx) const {
        return fmt::formatter<std::string>::format(deltaflow::to_string(record), ctx);
    }
};
