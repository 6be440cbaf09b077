#pragma once

/**
 * @file operators.h
 * @brief Definitions of the Collection<T> operator member templates.
 *
 * Each operator builds one node over the collection it is called on. Nothing is subscribed until
 * the resulting collection is subscribed to.
 */

#include <deltaflow/nodes/concat_node.h>
#include <deltaflow/nodes/context_flat_map_node.h>
#include <deltaflow/nodes/filter_by_node.h>
#include <deltaflow/nodes/filter_node.h>
#include <deltaflow/nodes/flat_map_node.h>
#include <deltaflow/nodes/join_node.h>
#include <deltaflow/nodes/map_node.h>
#include <deltaflow/nodes/reduce_node.h>
#include <deltaflow/nodes/with_latest_node.h>
#include <deltaflow/runtime/context_registry.h>
#include <deltaflow/types/base_collection.h>
#include <deltaflow/util/errors.h>

#include <stdexcept>

namespace deltaflow {

namespace detail {
    template<typename P>
    void require_collection(const P &collection, std::string_view op) {
        if (!collection) { throw_error<std::invalid_argument>("{}: collection must not be null", op); }
    }
} // namespace detail

template<Element T>
typename Collection<T>::ptr Collection<T>::from(std::vector<T> items) {
    return std::make_shared<StaticCollection<T>>(std::move(items));
}

template<Element T>
typename Collection<T>::ptr Collection<T>::concat(std::vector<ptr> collections) {
    for (const auto &collection: collections) { detail::require_collection(collection, "concat"); }
    return std::make_shared<ConcatNode<T>>(std::move(collections));
}

template<Element T>
template<typename F>
collection_ptr<mapped_type_t<T, F>> Collection<T>::map(F fn) {
    using U = mapped_type_t<T, F>;
    static_assert(Element<U>, "map must produce an Element type (equality comparable and hashable)");
    return std::make_shared<MapNode<T, U>>(this->shared_from_this(), std::move(fn));
}

template<Element T>
template<typename P>
typename Collection<T>::ptr Collection<T>::filter(P predicate) {
    return std::make_shared<FilterNode<T>>(this->shared_from_this(), std::move(predicate));
}

template<Element T>
template<typename F>
collection_ptr<flat_mapped_type_t<T, F>> Collection<T>::flat_map(F fn) {
    return flat_map(std::move(fn), ContextRegistry::instance());
}

template<Element T>
template<typename F>
collection_ptr<flat_mapped_type_t<T, F>> Collection<T>::flat_map(F fn, const ContextRegistry &registry) {
    using U = flat_mapped_type_t<T, F>;
    typename FlatMapNodeBase<T, U>::fn_type inner_fn{std::move(fn)};
    if (auto contexts = registry.snapshot(); !contexts.empty()) {
        return std::make_shared<ContextFlatMapNode<T, U>>(this->shared_from_this(), std::move(inner_fn),
                                                          std::move(contexts));
    }
    return std::make_shared<FlatMapNode<T, U>>(this->shared_from_this(), std::move(inner_fn));
}

template<Element T>
template<typename C>
collection_ptr<std::pair<T, typename C::value_type>> Collection<T>::with_latest(std::shared_ptr<C> other) {
    using U = typename C::value_type;
    detail::require_collection(other, "with_latest");
    return std::make_shared<WithLatestNode<T, U>>(this->shared_from_this(), collection_ptr<U>{std::move(other)});
}

template<Element T>
template<typename C, typename P>
typename Collection<T>::ptr Collection<T>::filter_by(std::shared_ptr<C> context, P predicate) {
    using U = typename C::value_type;
    detail::require_collection(context, "filter_by");
    return std::make_shared<FilterByNode<T, U>>(this->shared_from_this(), collection_ptr<U>{std::move(context)},
                                               std::move(predicate));
}

template<Element T>
template<typename C, typename KA, typename KB>
collection_ptr<std::pair<T, typename C::value_type>> Collection<T>::join(std::shared_ptr<C> other, KA key_a, KB key_b) {
    using U = typename C::value_type;
    using K = std::decay_t<std::invoke_result_t<KA &, const T &>>;
    static_assert(std::is_same_v<K, std::decay_t<std::invoke_result_t<KB &, const U &>>>,
                  "join key functions must produce the same key type");
    static_assert(Element<K>, "join keys must be equality comparable and hashable");
    detail::require_collection(other, "join");
    return std::make_shared<JoinNode<T, U, K>>(this->shared_from_this(), collection_ptr<U>{std::move(other)},
                                               std::move(key_a), std::move(key_b));
}

template<Element T>
template<typename S, typename F>
collection_ptr<S> Collection<T>::reduce(S seed, F fold) {
    static_assert(Element<S>, "reduce state must be equality comparable and hashable");
    return std::make_shared<ReduceNode<T, S>>(this->shared_from_this(), std::move(seed), std::move(fold));
}

/**
 * @brief Collection<T>::concat over a list of collections of possibly different concrete types.
 */
template<typename C, typename... Cs>
[[nodiscard]] collection_ptr<typename C::value_type> concat(const std::shared_ptr<C> &first,
                                                           const std::shared_ptr<Cs> &... rest) {
    using T = typename C::value_type;
    return Collection<T>::concat({collection_ptr<T>{first}, collection_ptr<T>{rest}...});
}

} // namespace deltaflow
