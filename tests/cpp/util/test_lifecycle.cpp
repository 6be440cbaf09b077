#include <catch2/catch_test_macros.hpp>
#include <deltaflow/util/lifecycle.h>

#include <stdexcept>

using namespace deltaflow;

namespace {

struct CountingComponent : ComponentLifeCycle {
    int starts{0};
    int stops{0};
    bool fail_start{false};
    bool was_starting{false};

protected:
    void start() override {
        was_starting = is_starting();
        ++starts;
        if (fail_start) { throw std::runtime_error("start failed"); }
    }

    void stop() override { ++stops; }
};

} // namespace

TEST_CASE("ComponentLifeCycle - starts stopped", "[lifecycle]") {
    CountingComponent component;
    CHECK_FALSE(component.is_started());
    CHECK_FALSE(component.is_starting());
    CHECK_FALSE(component.is_stopping());
    CHECK(component.life_cycle_state() == LifeCycleState::Stopped);
}

TEST_CASE("ComponentLifeCycle - start and stop are idempotent", "[lifecycle]") {
    CountingComponent component;

    start_component(component);
    start_component(component);
    CHECK(component.is_started());
    CHECK(component.was_starting);
    CHECK(component.starts == 1);

    stop_component(component);
    stop_component(component);
    CHECK_FALSE(component.is_started());
    CHECK(component.stops == 1);
}

TEST_CASE("ComponentLifeCycle - can be restarted", "[lifecycle]") {
    CountingComponent component;
    start_component(component);
    stop_component(component);
    start_component(component);

    CHECK(component.is_started());
    CHECK(component.starts == 2);
}

TEST_CASE("ComponentLifeCycle - a failed start leaves the component stopped", "[lifecycle]") {
    CountingComponent component;
    component.fail_start = true;

    CHECK_THROWS_AS(start_component(component), std::runtime_error);
    CHECK_FALSE(component.is_started());
    CHECK_FALSE(component.is_starting());

    stop_component(component);
    CHECK(component.stops == 0);
}

TEST_CASE("ComponentLifeCycle - state names", "[lifecycle]") {
    CHECK(to_string(LifeCycleState::Stopped) == "Stopped");
    CHECK(to_string(LifeCycleState::Starting) == "Starting");
    CHECK(to_string(LifeCycleState::Started) == "Started");
    CHECK(to_string(LifeCycleState::Stopping) == "Stopping");
}

TEST_CASE("ComponentLifeCycle - stop runs in the stopping state", "[lifecycle]") {
    struct StateRecorder : ComponentLifeCycle {
        LifeCycleState seen{LifeCycleState::Stopped};

    protected:
        void start() override {}

        void stop() override { seen = life_cycle_state(); }
    };

    StateRecorder component;
    start_component(component);
    CHECK(component.life_cycle_state() == LifeCycleState::Started);
    stop_component(component);
    CHECK(component.seen == LifeCycleState::Stopping);
    CHECK(component.life_cycle_state() == LifeCycleState::Stopped);
}
