#include <catch2/catch_test_macros.hpp>

#include "../change_recorder.h"

#include <vector>

using namespace deltaflow;
using deltaflow::test::ChangeRecorder;

namespace {
    int sum(const int &state, const int &item, Delta delta) { return state + item * weight(delta); }
} // namespace

TEST_CASE("reduce - retracts the previous answer before inserting the next", "[reduce]") {
    auto i = input<int>();
    auto total = i->reduce(0, sum);
    ChangeRecorder<int> rec;
    auto sub = total->subscribe(rec.callback());

    i->insert(5);
    i->insert(3);

    CHECK(rec.changes() == std::vector{insert_of(5), retract_of(5), insert_of(8)});
}

TEST_CASE("reduce - the seed is never emitted", "[reduce]") {
    auto i = input<int>();
    auto total = i->reduce(100, sum);
    ChangeRecorder<int> rec;
    auto sub = total->subscribe(rec.callback());

    CHECK(rec.empty());
    auto node = std::dynamic_pointer_cast<ReduceNode<int, int>>(total);
    REQUIRE(node);
    CHECK_FALSE(node->current().has_value());

    i->insert(1);
    CHECK(rec.changes() == std::vector{insert_of(101)});
    CHECK(node->current() == 101);
}

TEST_CASE("reduce - a late subscriber receives exactly the current answer", "[reduce]") {
    auto i = input<int>();
    auto total = i->reduce(0, sum);
    auto first = total->subscribe([](const int &, Delta) {});
    i->insert(5);
    i->insert(3);

    ChangeRecorder<int> late;
    auto second = total->subscribe(late.callback());

    CHECK(late.changes() == std::vector{insert_of(8)});
}

TEST_CASE("reduce - retracts fold back out", "[reduce]") {
    auto i = input<int>();
    i->insert(4);
    i->insert(6);
    auto total = i->reduce(0, sum);
    ChangeRecorder<int> rec;
    auto sub = total->subscribe(rec.callback());

    i->retract(4);

    CHECK(rec.net().size() == 1);
    CHECK(rec.count(6) == 1);
}

TEST_CASE("reduce - stopping resets the state to the seed", "[reduce]") {
    auto i = input<int>();
    i->insert(5);
    i->insert(3);
    auto total = i->reduce(0, sum);
    {
        auto sub = total->subscribe([](const int &, Delta) {});
    }

    ChangeRecorder<int> rec;
    auto sub = total->subscribe(rec.callback());

    // Restarted from 0, the upstream replay flows through the fold again
    CHECK(rec.changes() == std::vector{insert_of(5), retract_of(5), insert_of(8)});
}

TEST_CASE("reduce - state of another type", "[reduce]") {
    auto words = input<std::string>();
    auto letters = words->reduce(std::size_t{0}, [](const std::size_t &n, const std::string &w, Delta d) {
        return d == Delta::Insert ? n + w.size() : n - w.size();
    });
    ChangeRecorder<std::size_t> rec;
    auto sub = letters->subscribe(rec.callback());

    words->insert("abc");
    words->insert("de");
    words->retract("abc");

    CHECK(rec.count(2) == 1);
    CHECK(rec.net().size() == 1);
}
