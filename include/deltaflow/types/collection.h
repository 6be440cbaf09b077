#pragma once

/**
 * @file collection.h
 * @brief Collection - a node of the dataflow graph.
 *
 * A Collection denotes a multiset of T evolving over time, observed only through the stream of
 * Changes delivered to its subscribers. For any subscriber, folding the changes received since
 * subscribing (+1 per Insert, -1 per Retract, per distinct value) yields the collection's current
 * membership.
 *
 * Collections are always owned through std::shared_ptr. Operators hold their upstream collections,
 * a Subscription holds the collection it was issued by, so a pipeline stays alive for as long as
 * it is subscribed.
 *
 * The operator member templates are declared here and defined in nodes/operators.h, include
 * <deltaflow/deltaflow.h> to use them.
 */

#include <deltaflow/deltaflow_forward_declarations.h>
#include <deltaflow/runtime/observers/dataflow_observer.h>
#include <deltaflow/types/delta.h>
#include <deltaflow/types/node.h>
#include <deltaflow/types/subscriber_list.h>
#include <deltaflow/types/subscription.h>
#include <deltaflow/types/value_hash.h>
#include <deltaflow/util/string_utils.h>

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace deltaflow {

/// The value type produced by map(fn) over a Collection<T>
template<typename T, typename F>
using mapped_type_t = std::decay_t<std::invoke_result_t<F &, const T &>>;

/// The value type produced by flat_map(fn) over a Collection<T>, fn returning shared_ptr<SomeCollection<U>>
template<typename T, typename F>
using flat_mapped_type_t = typename std::decay_t<std::invoke_result_t<F &, const T &>>::element_type::value_type;

template<Element T>
class Collection : public Node, public std::enable_shared_from_this<Collection<T>> {
public:
    using value_type = T;
    using ptr = std::shared_ptr<Collection<T>>;
    using subscriber_type = std::function<void(const T &, Delta)>;

    // ========== Subscription Protocol ==========

    /**
     * @brief Subscribe to the change stream.
     *
     * The current membership is delivered first as a burst of Inserts, after which changes are
     * delivered live. The returned handle detaches the subscriber when released or destroyed.
     */
    [[nodiscard]] virtual Subscription subscribe(subscriber_type on_change) = 0;

    [[nodiscard]] std::size_t subscriber_count() const override { return subscribers_.size(); }

    /**
     * @brief Replace the label used in trace output.
     */
    ptr with_label(std::string label) {
        this->set_label(std::move(label));
        return this->shared_from_this();
    }

    // ========== Construction Primitives ==========

    /**
     * @brief A base collection holding items, it has no mutation API.
     */
    [[nodiscard]] static ptr from(std::vector<T> items);

    /**
     * @brief The union of every change from every source, without deduplication.
     */
    [[nodiscard]] static ptr concat(std::vector<ptr> collections);

    // ========== Operators ==========

    /// (v, d) -> (fn(v), d)
    template<typename F>
    [[nodiscard]] collection_ptr<mapped_type_t<T, F>> map(F fn);

    /// (v, d) passes when predicate(v) holds at the time of the change
    template<typename P>
    [[nodiscard]] ptr filter(P predicate);

    /**
     * @brief Subscribe to fn(item) for every present upstream item and merge their changes.
     *
     * If the calling thread's ContextRegistry holds contexts at the time of the call, the result
     * re-runs fn for every live item each time one of those contexts changes.
     */
    template<typename F>
    [[nodiscard]] collection_ptr<flat_mapped_type_t<T, F>> flat_map(F fn);

    /// As flat_map(fn), detecting contexts in registry rather than the thread's default registry
    template<typename F>
    [[nodiscard]] collection_ptr<flat_mapped_type_t<T, F>> flat_map(F fn, const ContextRegistry &registry);

    /// Pair every item with the latest value inserted into other
    template<typename C>
    [[nodiscard]] collection_ptr<std::pair<T, typename C::value_type>> with_latest(std::shared_ptr<C> other);

    /// Pass items for which predicate(item, latest context value) holds at the time of the change
    template<typename C, typename P>
    [[nodiscard]] ptr filter_by(std::shared_ptr<C> context, P predicate);

    /// Incremental equi-join on key_a(a) == key_b(b)
    template<typename C, typename KA, typename KB>
    [[nodiscard]] collection_ptr<std::pair<T, typename C::value_type>> join(std::shared_ptr<C> other, KA key_a,
                                                                          KB key_b);

    /// Incremental single-row fold, fold(state, item, delta) -> state
    template<typename S, typename F>
    [[nodiscard]] collection_ptr<S> reduce(S seed, F fold);

protected:
    using key_type = typename SubscriberList<T>::key_type;

    Collection(std::string label, NodeKind kind) : Node(std::move(label), kind) {}

    /**
     * @brief Register on_change for live delivery and hand back the handle that removes it.
     */
    Subscription register_subscriber(subscriber_type on_change) {
        auto key = subscribers_.add(std::move(on_change));
        if (auto &observers = ObserverRegistry::instance(); !observers.empty()) { observers.on_subscribe(*this); }
        return Subscription{[self = this->shared_from_this(), key] { self->release_subscriber(key); }};
    }

    virtual void release_subscriber(key_type key) {
        if (subscribers_.remove(key)) {
            if (auto &observers = ObserverRegistry::instance(); !observers.empty()) { observers.on_unsubscribe(*this); }
        }
    }

    /**
     * @brief Deliver a change to every current subscriber.
     */
    virtual void emit(const T &value, Delta delta) {
        // A subscriber may release the last handle on this collection while it is being notified
        const auto keep_alive = this->weak_from_this().lock();
        if (auto &observers = ObserverRegistry::instance(); !observers.empty()) {
            observers.on_emit(*this, delta, observers.wants_values() ? to_display_string(value) : std::string{});
        }
        subscribers_.notify(value, delta);
    }

    SubscriberList<T> subscribers_;
};

} // namespace deltaflow
