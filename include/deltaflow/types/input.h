#pragma once

/**
 * @file input.h
 * @brief Input - the mutable root of a dataflow graph.
 *
 * An Input owns the ground-truth membership of a set of values (each distinct value held at
 * most once, identity by value equality, kept in insertion order). Mutations update the
 * membership immediately and hand the emission of their delta to the TransactionScheduler, so
 * inside tx() subscribers see them when the transaction ends.
 *
 * The accessors read the membership. A new subscriber is replayed the published membership
 * instead, which only takes a change when its delta is delivered: a subscriber attaching while
 * a delta is still queued receives it once, from the flush.
 *
 * Re-inserting a held value leaves the membership unchanged but still emits an Insert.
 * Retracting a value that is not held emits nothing.
 */

#include <deltaflow/runtime/transaction.h>
#include <deltaflow/types/base_collection.h>
#include <deltaflow/types/ordered_multiset.h>

#include <memory>
#include <optional>
#include <vector>

namespace deltaflow {

template<Element T>
class Input final : public BaseCollection<T> {
public:
    using ptr = std::shared_ptr<Input<T>>;

    Input() : BaseCollection<T>("input") {}

    explicit Input(T initial) : BaseCollection<T>("input") {
        members_.insert(initial);
        published_.insert(initial);
    }

    // ========== Mutation ==========

    void insert(const T &value) {
        if (!members_.contains(value)) { members_.insert(value); }
        schedule(value, Delta::Insert);
    }

    void retract(const T &value) {
        if (!members_.erase(value)) { return; }
        schedule(value, Delta::Retract);
    }

    /**
     * @brief Retract every held value, then insert value.
     */
    void set(const T &value) {
        const auto held = members_.values();
        for (const auto &v: held) { retract(v); }
        insert(value);
    }

    /**
     * @brief Replace the current value with fn(current). No-op when empty.
     */
    template<typename F>
    void update(F &&fn) {
        if (members_.empty()) { return; }
        const T current = members_.begin()->first;
        T next = std::forward<F>(fn)(current);
        retract(current);
        insert(next);
    }

    /**
     * @brief Retract previous, insert next. Values are immutable, this is how a field is updated.
     */
    void replace(const T &previous, const T &next) {
        retract(previous);
        insert(next);
    }

    // ========== Accessors ==========

    /**
     * @brief The first held value.
     */
    [[nodiscard]] std::optional<T> get() const {
        if (members_.empty()) { return std::nullopt; }
        return members_.begin()->first;
    }

    [[nodiscard]] std::vector<T> get_all() const { return members_.values(); }

    template<typename P>
    [[nodiscard]] std::optional<T> find(P &&predicate) const {
        for (const auto &v: members_.values()) {
            if (predicate(v)) { return v; }
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains(const T &value) const { return members_.contains(value); }

    [[nodiscard]] std::size_t size() const { return members_.size(); }

    [[nodiscard]] bool empty() const { return members_.empty(); }

    [[nodiscard]] std::vector<T> snapshot() const override { return published_.values(); }

private:
    void schedule(const T &value, Delta delta) {
        schedule_emit([self = std::static_pointer_cast<Input<T>>(this->shared_from_this()), value, delta] {
            self->publish(value, delta);
        });
    }

    void publish(const T &value, Delta delta) {
        if (delta == Delta::Insert) {
            if (!published_.contains(value)) { published_.insert(value); }
        } else {
            published_.erase(value);
        }
        this->emit(value, delta);
    }

    OrderedMultiset<T> members_;
    OrderedMultiset<T> published_;
};

template<Element T>
[[nodiscard]] input_ptr<T> input() {
    return std::make_shared<Input<T>>();
}

template<Element T>
[[nodiscard]] input_ptr<T> input(T initial) {
    return std::make_shared<Input<T>>(std::move(initial));
}

} // namespace deltaflow
