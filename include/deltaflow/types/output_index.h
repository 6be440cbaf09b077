#pragma once

/**
 * @file output_index.h
 * @brief OutputIndex - the materialised output of a derived collection.
 *
 * A derived collection shares one upstream connection between all of its subscribers. The
 * subscriber that starts the node sees the upstream replay as it flows through; every later
 * subscriber is brought up to date from the OutputIndex, which holds the multiplicity of every
 * value the node has emitted and not yet retracted.
 */

#include <deltaflow/types/delta.h>
#include <deltaflow/types/ordered_multiset.h>

#include <cstddef>
#include <vector>

namespace deltaflow {

template<Element T>
class OutputIndex {
public:
    /**
     * @brief Fold one emitted change into the index.
     * @return false if a Retract was applied to a value with no live Insert
     */
    bool apply(const T &value, Delta delta) {
        if (delta == Delta::Insert) {
            counts_.insert(value);
            return true;
        }
        return counts_.erase_one(value);
    }

    /**
     * @brief One entry per live instance, each distinct value repeated by its multiplicity.
     *
     * Values are listed in the order they first became live.
     */
    [[nodiscard]] std::vector<T> snapshot() const { return counts_.expanded(); }

    [[nodiscard]] std::size_t count(const T &value) const { return counts_.count(value); }

    /// Number of distinct values currently live
    [[nodiscard]] std::size_t distinct_size() const { return counts_.size(); }

    [[nodiscard]] bool empty() const { return counts_.empty(); }

    void clear() { counts_.clear(); }

private:
    OrderedMultiset<T> counts_;
};

} // namespace deltaflow
