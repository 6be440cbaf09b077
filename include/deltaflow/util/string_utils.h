#ifndef DELTAFLOW_STRING_UTILS_H
#define DELTAFLOW_STRING_UTILS_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <typeinfo>

namespace deltaflow {
    /**
     * Render a value for trace output. Types fmt knows how to format are formatted, anything else is
     * shown as its (implementation defined) type name.
     */
    template<typename T>
    std::string to_display_string(const T &value) {
        if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("{}", value);
        } else {
            return fmt::format("<{}>", typeid(T).name());
        }
    }
} // namespace deltaflow

#endif  // DELTAFLOW_STRING_UTILS_H
