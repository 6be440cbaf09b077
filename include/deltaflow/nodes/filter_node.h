#pragma once

#include <deltaflow/types/derived_collection.h>

#include <functional>
#include <memory>

namespace deltaflow {

/**
 * @brief Forwards (v, d) when predicate(v) holds at the time of the change.
 *
 * The predicate is evaluated per delta and not retained, it must give the same answer for the
 * Insert and the Retract of a value.
 */
template<Element T>
class FilterNode final : public DerivedCollection<T> {
public:
    using predicate_type = std::function<bool(const T &)>;

    FilterNode(collection_ptr<T> upstream, predicate_type predicate)
        : DerivedCollection<T>("filter"), upstream_{std::move(upstream)}, predicate_{std::move(predicate)} {}

protected:
    void connect() override {
        upstream_subscription_ = upstream_->subscribe(this->template receive<T>([this](const T &value, Delta delta) {
            if (predicate_(value)) { this->emit(value, delta); }
        }));
    }

    void disconnect() override { upstream_subscription_.unsubscribe(); }

private:
    collection_ptr<T> upstream_;
    predicate_type predicate_;
    Subscription upstream_subscription_;
};

} // namespace deltaflow
