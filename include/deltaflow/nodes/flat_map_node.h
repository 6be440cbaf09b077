#pragma once

/**
 * @file flat_map_node.h
 * @brief FlatMapNode - per-item nested subscriptions.
 *
 * For every present upstream item the node holds one subscription to the inner collection
 * produced for it, together with the list of inner values that are currently live. Retracting
 * the upstream item releases the inner subscription and retracts every value still live for it,
 * so no downstream row outlives the item that produced it, whether or not the inner collection
 * retracted it itself.
 */

#include <deltaflow/types/derived_collection.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <vector>

namespace deltaflow {

/**
 * @brief Item bookkeeping shared by FlatMapNode and ContextFlatMapNode.
 */
template<Element T, Element U>
class FlatMapNodeBase : public DerivedCollection<U> {
public:
    using fn_type = std::function<collection_ptr<U>(const T &)>;

    /**
     * @brief The number of inner subscriptions currently held.
     */
    [[nodiscard]] std::size_t inner_count() const { return opened_.size(); }

protected:
    struct InnerState {
        Subscription subscription;
        std::vector<U> live;
        bool open{true};
    };

    using state_ptr = std::shared_ptr<InnerState>;
    using position_type = typename std::list<state_ptr>::iterator;

    FlatMapNodeBase(std::string label, collection_ptr<T> upstream, fn_type fn)
        : DerivedCollection<U>(std::move(label)), upstream_{std::move(upstream)}, fn_{std::move(fn)} {}

    /**
     * @brief Produce the inner collection for item and subscribe to it.
     *
     * The inner replay is forwarded during subscribe. If a downstream callback closes the item (or
     * stops the node) during that replay, the new subscription is released on return.
     */
    void open_item(const T &item) {
        auto inner = fn_(item);
        auto state = std::make_shared<InnerState>();
        opened_.push_back(state);
        items_[item].push_back(std::prev(opened_.end()));
        auto subscription = inner->subscribe(this->template receive<U>(
                [this, raw = state.get()](const U &value, Delta delta) { on_inner(*raw, value, delta); }));
        if (state->open) { state->subscription = std::move(subscription); }
    }

    /**
     * @brief Release the oldest inner subscription held for item and retract its live values.
     */
    void close_item(const T &item) {
        auto it = items_.find(item);
        if (it == items_.end() || it->second.empty()) { return; }
        auto position = it->second.front();
        it->second.erase(it->second.begin());
        if (it->second.empty()) { items_.erase(it); }
        auto state = std::move(*position);
        opened_.erase(position);
        release(*state, true);
    }

    /**
     * @brief Release every inner subscription, retracting live values when emit_retracts is set.
     *
     * Items are closed in the order they were opened.
     */
    void close_all(bool emit_retracts) {
        auto opened = std::move(opened_);
        opened_.clear();
        items_.clear();
        for (auto &state: opened) { release(*state, emit_retracts); }
    }

    collection_ptr<T> upstream_;
    fn_type fn_;

private:
    void release(InnerState &state, bool emit_retracts) {
        state.open = false;
        state.subscription.unsubscribe();
        if (!emit_retracts) { return; }
        const auto live = std::move(state.live);
        // Emitting to a stopped node is a no-op, the subscriptions above are still released
        for (const auto &value: live) { this->emit(value, Delta::Retract); }
    }

    void on_inner(InnerState &state, const U &value, Delta delta) {
        if (!state.open) { return; }
        if (delta == Delta::Insert) {
            state.live.push_back(value);
        } else if (auto it = std::find(state.live.begin(), state.live.end(), value); it != state.live.end()) {
            state.live.erase(it);
        }
        this->emit(value, delta);
    }

    // Every open inner subscription in opening order, items_ indexes it by upstream item
    std::list<state_ptr> opened_;
    ValueMap<T, std::vector<position_type>> items_;
};

/**
 * @brief flat_map without context injection.
 *
 * On upstream Insert(item) fn(item) is called and subscribed, on Retract(item) that subscription
 * is released. Inner changes are forwarded unchanged.
 */
template<Element T, Element U>
class FlatMapNode final : public FlatMapNodeBase<T, U> {
public:
    using typename FlatMapNodeBase<T, U>::fn_type;

    FlatMapNode(collection_ptr<T> upstream, fn_type fn)
        : FlatMapNodeBase<T, U>("flat_map", std::move(upstream), std::move(fn)) {}

protected:
    void connect() override {
        upstream_subscription_ = this->upstream_->subscribe(this->template receive<T>([this](const T &item, Delta delta) {
            if (delta == Delta::Insert) {
                this->open_item(item);
            } else {
                this->close_item(item);
            }
        }));
    }

    void disconnect() override {
        upstream_subscription_.unsubscribe();
        this->close_all(false);
    }

private:
    Subscription upstream_subscription_;
};

} // namespace deltaflow
