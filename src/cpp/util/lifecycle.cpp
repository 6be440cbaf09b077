#include <deltaflow/util/lifecycle.h>

namespace deltaflow {
    std::string_view to_string(LifeCycleState state) {
        switch (state) {
            case LifeCycleState::Stopped: return "Stopped";
            case LifeCycleState::Starting: return "Starting";
            case LifeCycleState::Started: return "Started";
            case LifeCycleState::Stopping: return "Stopping";
        }
        return "Unknown";
    }

    bool ComponentLifeCycle::is_started() const {
        return _state == LifeCycleState::Started || _state == LifeCycleState::Stopping;
    }

    void start_component(ComponentLifeCycle &component) {
        if (component._state != LifeCycleState::Stopped) { return; }
        component._state = LifeCycleState::Starting;
        try {
            component.start();
        } catch (...) {
            component._state = LifeCycleState::Stopped;
            throw;
        }
        component._state = LifeCycleState::Started;
    }

    void stop_component(ComponentLifeCycle &component) {
        if (component._state != LifeCycleState::Started) { return; }
        component._state = LifeCycleState::Stopping;
        try {
            component.stop();
        } catch (...) {
            component._state = LifeCycleState::Stopped;
            throw;
        }
        component._state = LifeCycleState::Stopped;
    }
} // namespace deltaflow
