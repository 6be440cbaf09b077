#include <catch2/catch_test_macros.hpp>

#include "../change_recorder.h"

#include <stdexcept>
#include <vector>

using namespace deltaflow;
using deltaflow::test::ChangeRecorder;

TEST_CASE("tx - emissions are delivered together after the transaction, in call order", "[tx]") {
    auto i = input<int>();
    ChangeRecorder<int> rec;
    auto sub = i->subscribe(rec.callback());

    tx([&] {
        i->insert(1);
        i->insert(2);
        CHECK(rec.empty());
        CHECK(is_batching());
        // Membership is updated immediately
        CHECK(i->size() == 2);
    });

    CHECK(rec.changes() == std::vector{insert_of(1), insert_of(2)});
    CHECK_FALSE(is_batching());
}

TEST_CASE("tx - nested transactions flush once, at the outermost exit", "[tx]") {
    auto i = input<int>();
    ChangeRecorder<int> rec;
    auto sub = i->subscribe(rec.callback());
    auto &scheduler = TransactionScheduler::instance();

    tx([&] {
        i->insert(1);
        tx([&] {
            i->insert(2);
            CHECK(scheduler.depth() == 2);
        });
        CHECK(rec.empty());
        CHECK(scheduler.pending() == 2);
        i->insert(3);
    });

    CHECK(rec.changes() == std::vector{insert_of(1), insert_of(2), insert_of(3)});
    CHECK(scheduler.depth() == 0);
    CHECK(scheduler.pending() == 0);
}

TEST_CASE("tx - queued emissions are flushed when the body throws", "[tx]") {
    auto i = input<int>();
    ChangeRecorder<int> rec;
    auto sub = i->subscribe(rec.callback());

    CHECK_THROWS_AS(tx([&] {
        i->insert(1);
        throw std::runtime_error("boom");
    }),
                    std::runtime_error);

    CHECK(rec.changes() == std::vector{insert_of(1)});
    CHECK_FALSE(is_batching());
}

TEST_CASE("tx - the order of mutations is preserved", "[tx]") {
    auto i = input<int>();
    ChangeRecorder<int> rec;
    auto sub = i->subscribe(rec.callback());

    tx([&] {
        i->insert(1);
        i->retract(1);
        i->insert(2);
        i->replace(2, 3);
    });

    CHECK(rec.changes() ==
          std::vector{insert_of(1), retract_of(1), insert_of(2), retract_of(2), insert_of(3)});
    CHECK(rec.net().size() == 1);
    CHECK(rec.count(3) == 1);
}

TEST_CASE("tx - batches across inputs and through operators", "[tx]") {
    auto a = input<int>();
    auto b = input<int>();
    auto total = concat(a, b)->reduce(0, [](const int &s, const int &x, Delta d) { return s + x * weight(d); });
    ChangeRecorder<int> rec;
    auto sub = total->subscribe(rec.callback());

    tx([&] {
        a->insert(1);
        b->insert(2);
    });

    CHECK(rec.changes() == std::vector{insert_of(1), retract_of(1), insert_of(3)});
}

TEST_CASE("tx - mutations made by a subscriber during the flush are delivered immediately", "[tx]") {
    auto source = input<int>();
    auto echo = input<int>();
    ChangeRecorder<int> rec;
    auto echo_sub = echo->subscribe(rec.callback());
    auto sub = source->subscribe([&](const int &value, Delta delta) {
        if (delta == Delta::Insert) {
            CHECK(TransactionScheduler::instance().is_flushing());
            echo->insert(value * 10);
        }
    });

    tx([&] {
        source->insert(1);
        source->insert(2);
    });

    CHECK(rec.changes() == std::vector{insert_of(10), insert_of(20)});
    CHECK_FALSE(TransactionScheduler::instance().is_flushing());
}

TEST_CASE("TransactionScheduler - explicit begin and end", "[tx]") {
    auto &scheduler = TransactionScheduler::instance();
    auto i = input<int>();
    ChangeRecorder<int> rec;
    auto sub = i->subscribe(rec.callback());

    scheduler.begin();
    i->insert(1);
    CHECK(scheduler.is_batching());
    CHECK(rec.empty());
    scheduler.end();

    CHECK(rec.size() == 1);
    CHECK_THROWS_AS(scheduler.end(), std::logic_error);
}

TEST_CASE("tx - a subscriber attaching inside the transaction sees each queued change once", "[tx]") {
    auto i = input<int>();
    i->insert(2);
    ChangeRecorder<int> rec;
    Subscription sub;

    tx([&] {
        i->insert(1);
        i->retract(2);
        sub = i->subscribe(rec.callback());
        CHECK(rec.changes() == std::vector{insert_of(2)});
    });

    CHECK(rec.changes() == std::vector{insert_of(2), insert_of(1), retract_of(2)});
    CHECK(rec.count(1) == 1);
    CHECK(rec.count(2) == 0);
}

TEST_CASE("tx - an inner collection opened during the flush is not handed a change twice", "[tx][flat_map]") {
    auto todos = input<int>();
    auto details = input<int>();
    auto rows = todos->flat_map([details](const int &todo) {
        return details->filter([todo](const int &detail) { return detail / 10 == todo; });
    });
    ChangeRecorder<int> rec;
    auto sub = rows->subscribe(rec.callback());

    tx([&] {
        todos->insert(1);
        details->insert(10);
    });
    CHECK(rec.changes() == std::vector{insert_of(10)});

    details->retract(10);
    CHECK(rec.net().empty());
}
