#include <catch2/catch_test_macros.hpp>

#include "../change_recorder.h"

#include <map>
#include <memory>
#include <vector>

using namespace deltaflow;
using deltaflow::test::ChangeRecorder;

TEST_CASE("flat_map - inner collections are merged and torn down with their item", "[flat_map]") {
    auto i = input<int>();
    auto out = i->flat_map([](const int &x) { return Collection<int>::from({x, x * 10}); });
    ChangeRecorder<int> rec;
    auto sub = out->subscribe(rec.callback());

    i->insert(1);
    i->insert(2);
    CHECK(rec.changes() == std::vector{insert_of(1), insert_of(10), insert_of(2), insert_of(20)});

    rec.clear();
    i->retract(1);
    CHECK(rec.changes() == std::vector{retract_of(1), retract_of(10)});
}

TEST_CASE("flat_map - fn is called once per present item", "[flat_map]") {
    auto i = input<int>();
    int calls{0};
    auto out = i->flat_map([&calls](const int &x) {
        ++calls;
        return Collection<int>::from({x});
    });
    auto sub = out->subscribe([](const int &, Delta) {});

    i->insert(1);
    i->insert(2);
    i->retract(1);

    CHECK(calls == 2);
    auto node = std::dynamic_pointer_cast<FlatMapNodeBase<int, int>>(out);
    REQUIRE(node);
    CHECK(node->inner_count() == 1);
    CHECK(out->label() == "flat_map");
}

TEST_CASE("flat_map - live inner changes are forwarded", "[flat_map]") {
    std::map<int, input_ptr<int>> inners{{1, input<int>()}, {2, input<int>()}};
    auto i = input<int>();
    auto out = i->flat_map([&inners](const int &x) { return inners.at(x); });
    ChangeRecorder<int> rec;
    auto sub = out->subscribe(rec.callback());

    i->insert(1);
    inners[1]->insert(100);
    inners[1]->insert(101);
    inners[1]->retract(100);

    CHECK(rec.changes() == std::vector{insert_of(100), insert_of(101), retract_of(100)});
}

TEST_CASE("flat_map - retracting an item releases its inner subscription", "[flat_map]") {
    auto inner = input<int>();
    inner->insert(7);
    inner->insert(8);
    auto i = input<int>();
    auto out = i->flat_map([inner](const int &) { return inner; });
    ChangeRecorder<int> rec;
    auto sub = out->subscribe(rec.callback());

    i->insert(1);
    CHECK(inner->subscriber_count() == 1);

    i->retract(1);

    CHECK(inner->subscriber_count() == 0);
    CHECK(rec.size() == 4);
    CHECK(rec.net().empty());

    // Changes after the teardown do not leak through
    rec.clear();
    inner->insert(9);
    CHECK(rec.empty());
}

TEST_CASE("flat_map - the same item present twice owns two inner subscriptions", "[flat_map]") {
    auto twice = Collection<int>::concat({Collection<int>::from({1}), Collection<int>::from({1})});
    auto out = twice->flat_map([](const int &x) { return Collection<int>::from({x * 10}); });
    ChangeRecorder<int> rec;
    auto sub = out->subscribe(rec.callback());

    CHECK(rec.count(10) == 2);
    auto node = std::dynamic_pointer_cast<FlatMapNodeBase<int, int>>(out);
    REQUIRE(node);
    CHECK(node->inner_count() == 2);
}

TEST_CASE("flat_map - unsubscribing releases every inner subscription", "[flat_map]") {
    auto inner = input<int>(5);
    auto i = input<int>();
    i->insert(1);
    i->insert(2);
    auto out = i->flat_map([inner](const int &) { return inner; });
    auto sub = out->subscribe([](const int &, Delta) {});
    CHECK(inner->subscriber_count() == 2);

    sub.unsubscribe();

    CHECK(inner->subscriber_count() == 0);
    CHECK(i->subscriber_count() == 0);
}

TEST_CASE("flat_map - nested flat_maps", "[flat_map]") {
    auto i = input<int>();
    auto out = i->flat_map([](const int &x) {
        return Collection<int>::from({x, x + 1})->flat_map(
            [](const int &y) { return Collection<int>::from({y * 100}); });
    });
    ChangeRecorder<int> rec;
    auto sub = out->subscribe(rec.callback());

    i->insert(1);
    CHECK(rec.changes() == std::vector{insert_of(100), insert_of(200)});

    i->retract(1);
    CHECK(rec.net().empty());
}

TEST_CASE("flat_map - a subscriber may drop the pipeline while it is being notified", "[flat_map]") {
    auto i = input<int>();
    std::vector<Change<int>> seen;
    Subscription sub;
    sub = i->flat_map([](const int &x) { return Collection<int>::from({x, x * 10}); })
                  ->subscribe([&](const int &value, Delta delta) {
                      seen.push_back(Change<int>{value, delta});
                      // The handle is the only owner of the flat_map node
                      if (delta == Delta::Retract) { sub.unsubscribe(); }
                  });

    i->insert(1);
    i->retract(1);

    CHECK(seen == std::vector{insert_of(1), insert_of(10), retract_of(1)});
    CHECK_FALSE(sub.active());
    CHECK(i->subscriber_count() == 0);

    i->insert(2);
    CHECK(seen.size() == 3);
}

TEST_CASE("flat_map - a late subscriber is replayed in the order values became live", "[flat_map][multicast]") {
    auto i = input<int>();
    i->insert(1);
    i->insert(2);
    i->insert(3);
    auto out = i->flat_map([](const int &x) { return Collection<int>::from({x}); });
    auto sub = out->subscribe([](const int &, Delta) {});
    i->retract(1);
    i->insert(1);

    ChangeRecorder<int> rec;
    auto late = out->subscribe(rec.callback());
    CHECK(rec.changes() == std::vector{insert_of(2), insert_of(3), insert_of(1)});
}
