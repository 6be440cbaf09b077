#pragma once

#include <deltaflow/types/derived_collection.h>

#include <functional>
#include <optional>

namespace deltaflow {

/**
 * @brief Filter gated on the latest value of a context collection.
 *
 * Each upstream change is tested against the context value current at the time of the change.
 * Unlike with_latest, a context change does not re-evaluate items that already passed. Nothing
 * passes before the context has produced a value.
 */
template<Element T, Element U>
class FilterByNode final : public DerivedCollection<T> {
public:
    using predicate_type = std::function<bool(const T &, const U &)>;

    FilterByNode(collection_ptr<T> upstream, collection_ptr<U> context, predicate_type predicate)
        : DerivedCollection<T>("filter_by"), upstream_{std::move(upstream)}, context_{std::move(context)},
          predicate_{std::move(predicate)} {}

    [[nodiscard]] const std::optional<U> &latest() const { return latest_; }

protected:
    void connect() override {
        context_subscription_ = context_->subscribe(this->template receive<U>([this](const U &value, Delta delta) {
            if (delta == Delta::Insert) { latest_ = value; }
        }));
        upstream_subscription_ = upstream_->subscribe(this->template receive<T>([this](const T &item, Delta delta) {
            if (latest_ && predicate_(item, *latest_)) { this->emit(item, delta); }
        }));
    }

    void disconnect() override {
        upstream_subscription_.unsubscribe();
        context_subscription_.unsubscribe();
        latest_.reset();
    }

private:
    collection_ptr<T> upstream_;
    collection_ptr<U> context_;
    predicate_type predicate_;
    Subscription context_subscription_;
    Subscription upstream_subscription_;
    std::optional<U> latest_;
};

} // namespace deltaflow
