#pragma once

#include <deltaflow/types/derived_collection.h>

#include <functional>
#include <memory>

namespace deltaflow {

/**
 * @brief Emits (fn(v), d) for every upstream change (v, d).
 *
 * fn runs once per delta, results are not cached, so fn is expected to be referentially
 * transparent (a Retract must map to the value its Insert mapped to).
 */
template<Element T, Element U>
class MapNode final : public DerivedCollection<U> {
public:
    using fn_type = std::function<U(const T &)>;

    MapNode(collection_ptr<T> upstream, fn_type fn)
        : DerivedCollection<U>("map"), upstream_{std::move(upstream)}, fn_{std::move(fn)} {}

protected:
    void connect() override {
        upstream_subscription_ = upstream_->subscribe(
            this->template receive<T>([this](const T &value, Delta delta) { this->emit(fn_(value), delta); }));
    }

    void disconnect() override { upstream_subscription_.unsubscribe(); }

private:
    collection_ptr<T> upstream_;
    fn_type fn_;
    Subscription upstream_subscription_;
};

} // namespace deltaflow
