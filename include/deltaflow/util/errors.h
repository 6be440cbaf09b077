#ifndef DELTAFLOW_UTIL_ERRORS
#define DELTAFLOW_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace deltaflow {

    template<typename Error = std::logic_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location info
    template<typename Error = std::logic_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::logic_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    /**
     * Raised when a dynamically typed Value holds a different alternative to the one requested.
     */
    struct bad_value_type : std::runtime_error {
        bad_value_type(std::string_view field, std::string_view expected, std::string_view actual)
            : std::runtime_error{fmt::format("Field '{}': expected type '{}', got: {}", field, expected, actual)}
        {}
    };

} // namespace deltaflow

#endif // DELTAFLOW_UTIL_ERRORS
