#include <catch2/catch_test_macros.hpp>

#include "../change_recorder.h"

#include <vector>

using namespace deltaflow;
using deltaflow::test::ChangeRecorder;

TEST_CASE("multicast - a second subscriber is replayed the current output once", "[multicast]") {
    auto i = input<int>();
    i->insert(1);
    i->insert(2);
    int calls{0};
    auto doubled = i->map([&calls](int x) {
        ++calls;
        return x * 2;
    });

    ChangeRecorder<int> a;
    ChangeRecorder<int> b;
    auto sub_a = doubled->subscribe(a.callback());
    auto sub_b = doubled->subscribe(b.callback());

    CHECK(calls == 2);
    CHECK(i->subscriber_count() == 1);
    CHECK(doubled->subscriber_count() == 2);
    CHECK(b.net() == a.net());

    i->insert(3);
    CHECK(calls == 3);
    CHECK(a.changes().back() == insert_of(6));
    CHECK(b.changes().back() == insert_of(6));
}

TEST_CASE("multicast - operator state is shared by all subscribers", "[multicast]") {
    auto i = input<int>();
    auto total = i->reduce(0, [](const int &s, const int &x, Delta d) { return s + x * weight(d); });
    ChangeRecorder<int> a;
    ChangeRecorder<int> b;
    auto sub_a = total->subscribe(a.callback());
    auto sub_b = total->subscribe(b.callback());

    i->insert(2);
    i->insert(3);

    CHECK(a.changes() == b.changes());
    CHECK(b.count(5) == 1);
    CHECK(b.net().size() == 1);
}

TEST_CASE("multicast - the node stays connected until the last subscriber leaves", "[multicast]") {
    auto i = input<int>();
    auto mapped = i->map([](int x) { return x; });
    auto sub_a = mapped->subscribe([](const int &, Delta) {});
    auto sub_b = mapped->subscribe([](const int &, Delta) {});

    sub_a.unsubscribe();
    CHECK(i->subscriber_count() == 1);

    sub_b.unsubscribe();
    CHECK(i->subscriber_count() == 0);
}

TEST_CASE("multicast - teardown releases the whole subscription tree", "[multicast]") {
    auto users = input<int>();
    auto posts = input<int>();
    auto context = input<int>(0);
    auto pipeline = users->map([](int x) { return x + 1; })
                        ->filter([](int x) { return x > 0; })
                        ->join(posts, [](const int &x) { return x; }, [](const int &x) { return x; })
                        ->with_latest(context)
                        ->flat_map([](const std::pair<std::pair<int, int>, int> &row) {
                            return Collection<int>::from({row.first.first});
                        });
    auto sub = pipeline->subscribe([](const int &, Delta) {});
    CHECK(users->subscriber_count() == 1);
    CHECK(posts->subscriber_count() == 1);
    CHECK(context->subscriber_count() == 1);

    sub.unsubscribe();

    CHECK(users->subscriber_count() == 0);
    CHECK(posts->subscriber_count() == 0);
    CHECK(context->subscriber_count() == 0);
}

TEST_CASE("multicast - a stopped node starts again cleanly", "[multicast]") {
    auto i = input<int>();
    i->insert(1);
    auto mapped = i->map([](int x) { return x * 3; });

    {
        auto sub = mapped->subscribe([](const int &, Delta) {});
    }
    i->insert(2);

    ChangeRecorder<int> rec;
    auto sub = mapped->subscribe(rec.callback());

    CHECK(rec.changes() == std::vector{insert_of(3), insert_of(6)});
}
