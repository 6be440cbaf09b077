#include <deltaflow/runtime/engine_config.h>
#include <deltaflow/runtime/observers/delta_trace.h>

#include <cstdlib>
#include <memory>
#include <string_view>

namespace deltaflow {

    namespace {
        bool env_flag(const char *name) {
            const char *value = std::getenv(name);
            if (value == nullptr) { return false; }
            std::string_view v{value};
            return v != "0" && v != "false";
        }

        std::optional<std::string> env_string(const char *name) {
            const char *value = std::getenv(name);
            if (value == nullptr || *value == '\0') { return std::nullopt; }
            return std::string{value};
        }

        struct ConfigState {
            EngineConfig config;
            DataflowObserver::s_ptr trace;
        };

        ConfigState &state() {
            static thread_local ConfigState s;
            return s;
        }
    } // namespace

    EngineConfig EngineConfig::from_environment() {
        return EngineConfig{
            .trace = env_flag("DELTAFLOW_TRACE"),
            .trace_filter = env_string("DELTAFLOW_TRACE_FILTER"),
            .trace_values = env_flag("DELTAFLOW_TRACE_VALUES"),
            .trace_to_stdout = env_flag("DELTAFLOW_TRACE_STDOUT"),
        };
    }

    void configure(const EngineConfig &config) {
        auto &s = state();
        auto &registry = ObserverRegistry::instance();
        if (s.trace) {
            registry.remove(s.trace);
            s.trace.reset();
        }
        DeltaTrace::set_print_all_values(config.trace_values);
        DeltaTrace::set_use_logger(!config.trace_to_stdout);
        if (config.trace) {
            s.trace = std::make_shared<DeltaTrace>(config.trace_filter);
            registry.add(s.trace);
        }
        s.config = config;
    }

    const EngineConfig &current_config() {
        return state().config;
    }

} // namespace deltaflow
