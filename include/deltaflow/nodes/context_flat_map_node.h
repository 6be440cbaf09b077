#pragma once

/**
 * @file context_flat_map_node.h
 * @brief ContextFlatMapNode - flat_map that re-runs when a captured context changes.
 *
 * Built by flat_map when contexts are registered at the time of the call. The node subscribes
 * to every captured context collection as well as to its upstream:
 *
 * - Until the first context Insert arrives, upstream changes only update the tracked item
 *   membership, fn is not called.
 * - The first context Insert opens every tracked item.
 * - Each later context Insert closes every live item (retracting its inner values) and then
 *   opens every tracked item again, re-invoking fn. The cost is proportional to the number of
 *   live items.
 * - Context Retracts are ignored, a context update arrives as Retract(old) then Insert(new).
 */

#include <deltaflow/nodes/flat_map_node.h>
#include <deltaflow/types/ordered_multiset.h>
#include <deltaflow/types/record.h>

#include <vector>

namespace deltaflow {

template<Element T, Element U>
class ContextFlatMapNode final : public FlatMapNodeBase<T, U> {
public:
    using typename FlatMapNodeBase<T, U>::fn_type;

    ContextFlatMapNode(collection_ptr<T> upstream, fn_type fn, std::vector<collection_ptr<Record>> contexts)
        : FlatMapNodeBase<T, U>("flat_map[context]", std::move(upstream), std::move(fn)),
          contexts_{std::move(contexts)} {}

    [[nodiscard]] const std::vector<collection_ptr<Record>> &contexts() const { return contexts_; }

    [[nodiscard]] bool has_context() const { return has_context_; }

protected:
    void connect() override {
        // Contexts first, so the upstream replay is processed directly when a context value exists
        context_subscriptions_.reserve(contexts_.size());
        for (const auto &context: contexts_) {
            context_subscriptions_.push_back(context->subscribe(this->template receive<Record>([this](const Record &, Delta delta) {
                if (delta == Delta::Insert) { on_context_changed(); }
            })));
        }
        upstream_subscription_ = this->upstream_->subscribe(this->template receive<T>([this](const T &item, Delta delta) {
            if (delta == Delta::Insert) {
                on_item_inserted(item);
            } else {
                on_item_retracted(item);
            }
        }));
    }

    void disconnect() override {
        upstream_subscription_.unsubscribe();
        for (auto &subscription: context_subscriptions_) { subscription.unsubscribe(); }
        context_subscriptions_.clear();
        this->close_all(false);
        tracked_.clear();
        has_context_ = false;
    }

private:
    void on_item_inserted(const T &item) {
        tracked_.insert(item);
        if (has_context_) { this->open_item(item); }
    }

    void on_item_retracted(const T &item) {
        if (!tracked_.erase_one(item)) { return; }
        if (has_context_) { this->close_item(item); }
    }

    void on_context_changed() {
        if (has_context_) {
            this->close_all(true);
        } else {
            has_context_ = true;
        }
        // fn may mutate the upstream, work from a copy of the membership
        for (const auto &item: tracked_.expanded()) {
            // A downstream subscriber leaving stops the node, which has then released everything
            if (!this->is_live()) { return; }
            this->open_item(item);
        }
    }

    std::vector<collection_ptr<Record>> contexts_;
    std::vector<Subscription> context_subscriptions_;
    Subscription upstream_subscription_;
    OrderedMultiset<T> tracked_;
    bool has_context_{false};
};

} // namespace deltaflow
