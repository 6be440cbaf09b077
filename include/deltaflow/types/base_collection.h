#pragma once

/**
 * @file base_collection.h
 * @brief BaseCollection - a collection holding its own snapshot.
 *
 * A base collection replays its snapshot to every new subscriber as a burst of Inserts (one per
 * member, snapshot order) before registering the subscriber for live changes.
 */

#include <deltaflow/types/collection.h>

#include <vector>

namespace deltaflow {

template<Element T>
class BaseCollection : public Collection<T> {
public:
    using typename Collection<T>::subscriber_type;

    [[nodiscard]] Subscription subscribe(subscriber_type on_change) override {
        // Replay from a copy, a subscriber may mutate the collection while it is being replayed to
        for (const auto &value: snapshot()) { on_change(value, Delta::Insert); }
        return this->register_subscriber(std::move(on_change));
    }

    /**
     * @brief The current membership, in replay order.
     */
    [[nodiscard]] virtual std::vector<T> snapshot() const = 0;

protected:
    explicit BaseCollection(std::string label) : Collection<T>(std::move(label), NodeKind::Base) {}
};

/**
 * @brief An immutable base collection, built by Collection<T>::from.
 */
template<Element T>
class StaticCollection final : public BaseCollection<T> {
public:
    explicit StaticCollection(std::vector<T> data) : BaseCollection<T>("from"), data_{std::move(data)} {}

    [[nodiscard]] std::vector<T> snapshot() const override { return data_; }

    [[nodiscard]] const std::vector<T> &data() const { return data_; }

private:
    std::vector<T> data_;
};

} // namespace deltaflow
