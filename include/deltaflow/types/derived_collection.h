#pragma once

/**
 * @file derived_collection.h
 * @brief DerivedCollection - base class of every operator node.
 *
 * Derived collections are multicast: one connection to the upstream collection(s) is shared by
 * all downstream subscribers, so operator state (indexes, aggregates, per-item maps) exists once
 * per node regardless of how many subscribers it has.
 *
 * - The first subscriber starts the node; the upstream replay flows through the operator to it.
 * - Later subscribers are replayed the node's current output (OutputIndex) and then go live.
 * - When the last subscriber leaves the node is stopped, which releases every upstream and
 *   nested subscription and resets all operator state. A new subscriber starts it again.
 *
 * A downstream subscriber may release the last handle on a node while reacting to one of its
 * changes. Handlers registered through receive() keep the node alive until they return, and a
 * node that has stopped neither processes upstream changes nor emits.
 */

#include <deltaflow/types/collection.h>
#include <deltaflow/types/output_index.h>
#include <deltaflow/util/lifecycle.h>

#include <functional>
#include <string>
#include <utility>

namespace deltaflow {

template<Element T>
class DerivedCollection : public Collection<T>, public ComponentLifeCycle {
public:
    using typename Collection<T>::subscriber_type;

    [[nodiscard]] Subscription subscribe(subscriber_type on_change) override {
        if (this->life_cycle_state() != LifeCycleState::Stopped) {
            for (const auto &value: output_.snapshot()) { on_change(value, Delta::Insert); }
            return this->register_subscriber(std::move(on_change));
        }

        auto subscription = this->register_subscriber(std::move(on_change));
        try {
            start_component(*this);
        } catch (...) {
            // Leave nothing half connected, the error belongs to the caller
            subscription.unsubscribe();
            stop();
            throw;
        }
        // The subscriber may have left again during the replay
        if (this->subscribers_.empty()) { stop_component(*this); }
        return subscription;
    }

    /**
     * @brief The values currently emitted and not retracted, as seen by every subscriber.
     */
    [[nodiscard]] const OutputIndex<T> &output() const { return output_; }

protected:
    using typename Collection<T>::key_type;

    explicit DerivedCollection(std::string label) : Collection<T>(std::move(label), NodeKind::Derived) {}

    /**
     * @brief Started, or starting, and not being stopped.
     */
    [[nodiscard]] bool is_live() const {
        const auto state = this->life_cycle_state();
        return state == LifeCycleState::Started || state == LifeCycleState::Starting;
    }

    /**
     * @brief Wrap handler for subscription to an upstream or nested collection of V.
     */
    template<typename V, typename F>
    [[nodiscard]] std::function<void(const V &, Delta)> receive(F handler) {
        return [this, handler = std::move(handler)](const V &value, Delta delta) {
            const auto self = this->weak_from_this().lock();
            if (!self || !is_live()) { return; }
            handler(value, delta);
        };
    }

    /**
     * @brief Subscribe to the upstream collection(s).
     */
    virtual void connect() = 0;

    /**
     * @brief Release every subscription held and reset operator state.
     */
    virtual void disconnect() = 0;

    void start() override {
        if (auto &observers = ObserverRegistry::instance(); !observers.empty()) { observers.on_start(*this); }
        connect();
    }

    void stop() override {
        disconnect();
        output_.clear();
        if (auto &observers = ObserverRegistry::instance(); !observers.empty()) { observers.on_stop(*this); }
    }

    void release_subscriber(key_type key) override {
        Collection<T>::release_subscriber(key);
        if (this->subscribers_.empty()) { stop_component(*this); }
    }

    void emit(const T &value, Delta delta) override {
        if (!is_live()) { return; }
        output_.apply(value, delta);
        Collection<T>::emit(value, delta);
    }

private:
    OutputIndex<T> output_;
};

} // namespace deltaflow
