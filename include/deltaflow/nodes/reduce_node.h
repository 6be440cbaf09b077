#pragma once

/**
 * @file reduce_node.h
 * @brief ReduceNode - incremental fold to a single current answer.
 *
 * The output holds at most one row. Each upstream change computes
 * next = fold(state, item, delta); the previous answer (if one was emitted) is retracted and the
 * new one inserted. The seed is only the starting accumulator, it is never emitted, so nothing is
 * output before the first upstream change. A late subscriber is replayed Insert(current answer).
 * Stopping the node resets the accumulator to the seed.
 */

#include <deltaflow/types/derived_collection.h>

#include <functional>
#include <optional>

namespace deltaflow {

template<Element T, Element S>
class ReduceNode final : public DerivedCollection<S> {
public:
    using fold_type = std::function<S(const S &, const T &, Delta)>;

    ReduceNode(collection_ptr<T> upstream, S seed, fold_type fold)
        : DerivedCollection<S>("reduce"), upstream_{std::move(upstream)}, seed_{seed}, state_{std::move(seed)},
          fold_{std::move(fold)} {}

    /**
     * @brief The current answer, empty until the first upstream change.
     */
    [[nodiscard]] std::optional<S> current() const { return has_answer_ ? std::optional<S>{state_} : std::nullopt; }

protected:
    void connect() override {
        upstream_subscription_ = upstream_->subscribe(
                this->template receive<T>([this](const T &item, Delta delta) { on_change(item, delta); }));
    }

    void disconnect() override {
        upstream_subscription_.unsubscribe();
        state_ = seed_;
        has_answer_ = false;
    }

private:
    void on_change(const T &item, Delta delta) {
        S next = fold_(state_, item, delta);
        std::optional<S> previous;
        if (has_answer_) { previous = std::move(state_); }
        state_ = next;
        has_answer_ = true;
        if (previous) { this->emit(*previous, Delta::Retract); }
        this->emit(next, Delta::Insert);
    }

    collection_ptr<T> upstream_;
    S seed_;
    S state_;
    fold_type fold_;
    Subscription upstream_subscription_;
    bool has_answer_{false};
};

} // namespace deltaflow
