#ifndef DELTAFLOW_LIFECYCLE_H
#define DELTAFLOW_LIFECYCLE_H

#include <deltaflow/deltaflow_export.h>

#include <cstdint>
#include <string_view>

namespace deltaflow {
    struct ComponentLifeCycle;

    enum class LifeCycleState : std::uint8_t { Stopped, Starting, Started, Stopping };

    std::string_view DELTAFLOW_EXPORT to_string(LifeCycleState state);

    /**
     * Stopped -> Starting -> Started. A call made in any other state is ignored, which covers a subscriber
     * arriving while the upstream replay of the first one is still running.
     * If start throws, the component goes back to Stopped and the exception propagates.
     */
    void DELTAFLOW_EXPORT start_component(ComponentLifeCycle &component);

    /**
     * Started -> Stopping -> Stopped. A call made in any other state is ignored.
     */
    void DELTAFLOW_EXPORT stop_component(ComponentLifeCycle &component);

    /**
     * A component connected on demand. A derived collection is started by its first downstream subscriber and
     * stopped by its last, possibly many times over its life, and must come back from stop as if newly built.
     */
    struct DELTAFLOW_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        [[nodiscard]] LifeCycleState life_cycle_state() const { return _state; }

        /**
         * Started, including while stop is running.
         */
        [[nodiscard]] bool is_started() const;

        [[nodiscard]] bool is_starting() const { return _state == LifeCycleState::Starting; }

        [[nodiscard]] bool is_stopping() const { return _state == LifeCycleState::Stopping; }

    protected:
        /**
         * Subscribe upstream. Changes replayed during start must be processed as normal.
         */
        virtual void start() = 0;

        /**
         * Release every subscription held and reset the operator state to its initial value.
         */
        virtual void stop() = 0;

    private:
        LifeCycleState _state{LifeCycleState::Stopped};

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);
    };
}

#endif //DELTAFLOW_LIFECYCLE_H
