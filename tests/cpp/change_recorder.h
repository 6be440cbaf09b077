#pragma once

/**
 * @file change_recorder.h
 * @brief Subscriber used by the tests to capture the change stream of a collection.
 */

#include <deltaflow/deltaflow.h>

#include <cstddef>
#include <functional>
#include <vector>

namespace deltaflow::test {

template<typename T>
class ChangeRecorder {
public:
    [[nodiscard]] std::function<void(const T &, Delta)> callback() {
        return [this](const T &value, Delta delta) { changes_.push_back(Change<T>{value, delta}); };
    }

    [[nodiscard]] const std::vector<Change<T>> &changes() const { return changes_; }

    [[nodiscard]] std::size_t size() const { return changes_.size(); }

    [[nodiscard]] bool empty() const { return changes_.empty(); }

    void clear() { changes_.clear(); }

    /**
     * Net multiplicity of every value seen, values folded to zero are dropped.
     */
    [[nodiscard]] ValueMap<T, int> net() const {
        ValueMap<T, int> counts;
        for (const auto &change: changes_) { counts[change.value] += weight(change.delta); }
        ValueMap<T, int> result;
        for (const auto &[value, count]: counts) {
            if (count != 0) { result.emplace(value, count); }
        }
        return result;
    }

    [[nodiscard]] int count(const T &value) const {
        auto counts = net();
        auto it = counts.find(value);
        return it == counts.end() ? 0 : it->second;
    }

private:
    std::vector<Change<T>> changes_;
};

} // namespace deltaflow::test
