#pragma once

#include <deltaflow/deltaflow_export.h>

#include <optional>
#include <string>

namespace deltaflow {

    /**
     * @brief Engine wide settings for the calling thread.
     *
     * from_environment reads:
     *  DELTAFLOW_TRACE          enable DeltaTrace
     *  DELTAFLOW_TRACE_FILTER   only trace nodes whose label contains this text
     *  DELTAFLOW_TRACE_VALUES   print emitted values
     *  DELTAFLOW_TRACE_STDOUT   write the trace to stdout rather than stderr
     * A flag is set when the variable is present and is not "0" or "false".
     */
    struct DELTAFLOW_EXPORT EngineConfig {
        bool trace{false};
        std::optional<std::string> trace_filter{};
        bool trace_values{false};
        bool trace_to_stdout{false};

        [[nodiscard]] static EngineConfig from_environment();

        bool operator==(const EngineConfig &) const = default;
    };

    /**
     * Installs (or removes) the trace observer on the calling thread's ObserverRegistry. Calling this again
     * replaces the previously installed trace, other observers are left untouched.
     */
    DELTAFLOW_EXPORT void configure(const EngineConfig &config);

    /**
     * The configuration last applied on the calling thread.
     */
    [[nodiscard]] DELTAFLOW_EXPORT const EngineConfig &current_config();

} // namespace deltaflow
