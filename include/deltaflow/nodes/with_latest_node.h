#pragma once

/**
 * @file with_latest_node.h
 * @brief WithLatestNode - pair every item with the latest value of another collection.
 *
 * Only Inserts on the other collection move "latest", its Retracts are not tracked. While no
 * latest value exists upstream items are tracked but nothing is emitted. Once it exists:
 *
 * - Insert(item) emits Insert({item, latest}).
 * - Retract(item) emits Retract({item, latest}), the tuple emitted for it.
 * - A new latest value retracts the tuple of every tracked item, then inserts every tracked
 *   item paired with the new value (global re-emission, proportional to the tracked items).
 */

#include <deltaflow/types/derived_collection.h>
#include <deltaflow/types/ordered_multiset.h>

#include <optional>
#include <utility>

namespace deltaflow {

template<Element T, Element U>
class WithLatestNode final : public DerivedCollection<std::pair<T, U>> {
public:
    using value_type = std::pair<T, U>;

    WithLatestNode(collection_ptr<T> upstream, collection_ptr<U> other)
        : DerivedCollection<value_type>("with_latest"), upstream_{std::move(upstream)}, other_{std::move(other)} {}

    [[nodiscard]] const std::optional<U> &latest() const { return latest_; }

protected:
    void connect() override {
        other_subscription_ = other_->subscribe(this->template receive<U>([this](const U &value, Delta delta) {
            if (delta == Delta::Insert) { on_latest(value); }
        }));
        upstream_subscription_ = upstream_->subscribe(this->template receive<T>([this](const T &item, Delta delta) {
            if (delta == Delta::Insert) {
                on_item_inserted(item);
            } else {
                on_item_retracted(item);
            }
        }));
    }

    void disconnect() override {
        upstream_subscription_.unsubscribe();
        other_subscription_.unsubscribe();
        tracked_.clear();
        latest_.reset();
    }

private:
    void on_latest(const U &value) {
        // Downstream callbacks may change the tracked items, re-emit from a copy (first tracked first)
        const auto tracked = tracked_.expanded();
        if (latest_) {
            const U previous = *latest_;
            for (const auto &item: tracked) {
                if (!this->is_live()) { return; }
                this->emit(value_type{item, previous}, Delta::Retract);
            }
        }
        latest_ = value;
        for (const auto &item: tracked) {
            if (!this->is_live()) { return; }
            this->emit(value_type{item, value}, Delta::Insert);
        }
    }

    void on_item_inserted(const T &item) {
        tracked_.insert(item);
        if (latest_) { this->emit(value_type{item, *latest_}, Delta::Insert); }
    }

    void on_item_retracted(const T &item) {
        if (!tracked_.erase_one(item)) { return; }
        if (latest_) { this->emit(value_type{item, *latest_}, Delta::Retract); }
    }

    collection_ptr<T> upstream_;
    collection_ptr<U> other_;
    Subscription other_subscription_;
    Subscription upstream_subscription_;
    OrderedMultiset<T> tracked_;
    std::optional<U> latest_;
};

} // namespace deltaflow
