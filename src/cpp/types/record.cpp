#include <deltaflow/types/record.h>

#include <fmt/format.h>

#include <stdexcept>
#include <type_traits>

namespace deltaflow {
    std::string to_string(const Value &value) {
        return std::visit(
            [](const auto &v) -> std::string {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, std::monostate>) {
                    return "None";
                } else if constexpr (std::is_same_v<V, bool>) {
                    return v ? "true" : "false";
                } else if constexpr (std::is_same_v<V, std::string>) {
                    return fmt::format("'{}'", v);
                } else {
                    return fmt::format("{}", v);
                }
            },
            value);
    }

    std::string_view type_name(const Value &value) noexcept {
        switch (value.index()) {
            case 1:
                return "bool";
            case 2:
                return "int";
            case 3:
                return "float";
            case 4:
                return "string";
            default:
                return "none";
        }
    }

    Record Record::with(std::string name, Value value) const {
        Record result{*this};
        result.fields_.insert_or_assign(std::move(name), std::move(value));
        return result;
    }

    const Value &Record::get(std::string_view name) const {
        auto it = fields_.find(name);
        if (it == fields_.end()) { throw_error<std::out_of_range>("Record has no field '{}'", name); }
        return it->second;
    }

    Value Record::value_or_none(std::string_view name) const {
        auto it = fields_.find(name);
        return it == fields_.end() ? Value{} : it->second;
    }

    std::string to_string(const Record &record) {
        std::string out{"{"};
        bool first{true};
        for (const auto &[name, value]: record.fields()) {
            if (!first) { out += ", "; }
            first = false;
            out += fmt::format("{}: {}", name, to_string(value));
        }
        out += "}";
        return out;
    }

    std::uint64_t value_hash<Record>::operator()(const Record &record) const {
        std::uint64_t seed{record.size()};
        for (const auto &[name, value]: record.fields()) {
            seed = hash_combine(seed, value_hash<std::string>{}(name));
            seed = hash_combine(seed, value_hash<Value>{}(value));
        }
        return seed;
    }
} // namespace deltaflow
