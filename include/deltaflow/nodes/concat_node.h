#pragma once

#include <deltaflow/types/derived_collection.h>

#include <memory>
#include <vector>

namespace deltaflow {

/**
 * @brief The union of the changes of all sources, no deduplication.
 *
 * A value inserted by two sources is delivered twice. Sources are subscribed (and so replayed)
 * in the order given.
 */
template<Element T>
class ConcatNode final : public DerivedCollection<T> {
public:
    explicit ConcatNode(std::vector<collection_ptr<T>> sources)
        : DerivedCollection<T>("concat"), sources_{std::move(sources)} {}

    [[nodiscard]] std::size_t source_count() const { return sources_.size(); }

protected:
    void connect() override {
        subscriptions_.reserve(sources_.size());
        for (const auto &source: sources_) {
            subscriptions_.push_back(source->subscribe(
                    this->template receive<T>([this](const T &value, Delta delta) { this->emit(value, delta); })));
        }
    }

    void disconnect() override {
        for (auto &subscription: subscriptions_) { subscription.unsubscribe(); }
        subscriptions_.clear();
    }

private:
    std::vector<collection_ptr<T>> sources_;
    std::vector<Subscription> subscriptions_;
};

} // namespace deltaflow
