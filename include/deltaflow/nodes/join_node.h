#pragma once

/**
 * @file join_node.h
 * @brief JoinNode - indexed incremental equi-join.
 *
 * Each side keeps a hash index from join key to the rows currently present under that key, in
 * insertion order. A change on one side is joined against the rows indexed under the same key
 * on the other side only, so its cost is proportional to the number of matching rows.
 *
 * - Insert(a) with key k: index a under k, emit Insert({a, b}) for every b under k (B order).
 * - Retract(a) with key k: remove the first row equal to a under k, emit Retract({a, b}) for
 *   every b still under k. A retract of a row that is not indexed emits nothing.
 *
 * Side B is symmetric, its output pairs are still ordered {a, b}.
 */

#include <deltaflow/types/derived_collection.h>

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

namespace deltaflow {

template<Element T, Element U, Element K>
class JoinNode final : public DerivedCollection<std::pair<T, U>> {
public:
    using value_type = std::pair<T, U>;
    using key_a_type = std::function<K(const T &)>;
    using key_b_type = std::function<K(const U &)>;

    JoinNode(collection_ptr<T> upstream_a, collection_ptr<U> upstream_b, key_a_type key_a, key_b_type key_b)
        : DerivedCollection<value_type>("join"), upstream_a_{std::move(upstream_a)},
          upstream_b_{std::move(upstream_b)}, key_a_{std::move(key_a)}, key_b_{std::move(key_b)} {}

    /**
     * @brief Rows indexed under key on side A / side B.
     */
    [[nodiscard]] std::size_t rows_a(const K &key) const { return rows_under(index_a_, key); }

    [[nodiscard]] std::size_t rows_b(const K &key) const { return rows_under(index_b_, key); }

protected:
    void connect() override {
        subscription_a_ = upstream_a_->subscribe(this->template receive<T>([this](const T &a, Delta delta) { on_a(a, delta); }));
        subscription_b_ = upstream_b_->subscribe(this->template receive<U>([this](const U &b, Delta delta) { on_b(b, delta); }));
    }

    void disconnect() override {
        subscription_a_.unsubscribe();
        subscription_b_.unsubscribe();
        index_a_.clear();
        index_b_.clear();
    }

private:
    template<typename V>
    using Index = ValueMap<K, std::vector<V>>;

    template<typename V>
    static std::size_t rows_under(const Index<V> &index, const K &key) {
        auto it = index.find(key);
        return it == index.end() ? 0 : it->second.size();
    }

    template<typename V>
    static bool remove_row(Index<V> &index, const K &key, const V &row) {
        auto it = index.find(key);
        if (it == index.end()) { return false; }
        auto &rows = it->second;
        auto row_it = std::find(rows.begin(), rows.end(), row);
        if (row_it == rows.end()) { return false; }
        rows.erase(row_it);
        if (rows.empty()) { index.erase(it); }
        return true;
    }

    /// The rows under key, copied as downstream callbacks may mutate the index
    template<typename V>
    static std::vector<V> matches(const Index<V> &index, const K &key) {
        auto it = index.find(key);
        return it == index.end() ? std::vector<V>{} : it->second;
    }

    void on_a(const T &a, Delta delta) {
        auto key = key_a_(a);
        if (delta == Delta::Insert) {
            index_a_[key].push_back(a);
        } else if (!remove_row(index_a_, key, a)) {
            return;
        }
        for (const auto &b: matches(index_b_, key)) {
            if (!this->is_live()) { return; }
            this->emit(value_type{a, b}, delta);
        }
    }

    void on_b(const U &b, Delta delta) {
        auto key = key_b_(b);
        if (delta == Delta::Insert) {
            index_b_[key].push_back(b);
        } else if (!remove_row(index_b_, key, b)) {
            return;
        }
        for (const auto &a: matches(index_a_, key)) {
            if (!this->is_live()) { return; }
            this->emit(value_type{a, b}, delta);
        }
    }

    collection_ptr<T> upstream_a_;
    collection_ptr<U> upstream_b_;
    key_a_type key_a_;
    key_b_type key_b_;
    Subscription subscription_a_;
    Subscription subscription_b_;
    Index<T> index_a_;
    Index<U> index_b_;
};

} // namespace deltaflow
