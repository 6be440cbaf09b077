#pragma once

/**
 * @file ordered_multiset.h
 * @brief OrderedMultiset - value multiplicities kept in first-insertion order.
 *
 * Iteration visits distinct values in the order they were first inserted, and removing a value
 * leaves the order of the remaining values unchanged. A value that drops to multiplicity zero
 * and is inserted again moves to the end.
 */

#include <deltaflow/types/value_hash.h>

#include <cstddef>
#include <iterator>
#include <list>
#include <utility>
#include <vector>

namespace deltaflow {

template<Element T>
class OrderedMultiset {
public:
    using entry_type = std::pair<T, std::size_t>;
    using const_iterator = typename std::list<entry_type>::const_iterator;

    OrderedMultiset() = default;

    // The index holds iterators into entries_, copies rebuild it
    OrderedMultiset(const OrderedMultiset &other) { for (const auto &[v, n]: other) { insert(v, n); } }

    OrderedMultiset &operator=(const OrderedMultiset &other) {
        if (this != &other) {
            clear();
            for (const auto &[v, n]: other) { insert(v, n); }
        }
        return *this;
    }

    OrderedMultiset(OrderedMultiset &&) noexcept = default;
    OrderedMultiset &operator=(OrderedMultiset &&) noexcept = default;

    /**
     * @brief Add count instances of value.
     * @return The multiplicity of value afterwards
     */
    std::size_t insert(const T &value, std::size_t count = 1) {
        if (auto it = index_.find(value); it != index_.end()) { return it->second->second += count; }
        entries_.emplace_back(value, count);
        index_.emplace(value, std::prev(entries_.end()));
        return count;
    }

    /**
     * @brief Remove one instance of value.
     * @return false if value was not present
     */
    bool erase_one(const T &value) {
        auto it = index_.find(value);
        if (it == index_.end()) { return false; }
        if (--(it->second->second) == 0) {
            entries_.erase(it->second);
            index_.erase(it);
        }
        return true;
    }

    /**
     * @brief Remove every instance of value.
     * @return false if value was not present
     */
    bool erase(const T &value) {
        auto it = index_.find(value);
        if (it == index_.end()) { return false; }
        entries_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() {
        index_.clear();
        entries_.clear();
    }

    [[nodiscard]] bool contains(const T &value) const { return index_.contains(value); }

    [[nodiscard]] std::size_t count(const T &value) const {
        auto it = index_.find(value);
        return it == index_.end() ? 0 : it->second->second;
    }

    /// Number of distinct values
    [[nodiscard]] std::size_t size() const { return entries_.size(); }

    [[nodiscard]] bool empty() const { return entries_.empty(); }

    /**
     * @brief The distinct values, oldest first.
     */
    [[nodiscard]] std::vector<T> values() const {
        std::vector<T> result;
        result.reserve(entries_.size());
        for (const auto &[v, _]: entries_) { result.push_back(v); }
        return result;
    }

    /**
     * @brief One entry per instance, each distinct value repeated by its multiplicity.
     */
    [[nodiscard]] std::vector<T> expanded() const {
        std::vector<T> result;
        for (const auto &[v, n]: entries_) { result.insert(result.end(), n, v); }
        return result;
    }

    [[nodiscard]] std::vector<entry_type> entries() const { return {entries_.begin(), entries_.end()}; }

    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }

    [[nodiscard]] const_iterator end() const { return entries_.end(); }

private:
    std::list<entry_type> entries_;
    ValueMap<T, typename std::list<entry_type>::iterator> index_;
};

} // namespace deltaflow
