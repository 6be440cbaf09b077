#include <deltaflow/types/subscription.h>

#include <utility>

namespace deltaflow {
    Subscription::Subscription(release_fn release) : release_{std::move(release)} {}

    Subscription::Subscription(Subscription &&other) noexcept : release_{std::exchange(other.release_, nullptr)} {}

    Subscription &Subscription::operator=(Subscription &&other) noexcept {
        if (this != &other) {
            unsubscribe();
            release_ = std::exchange(other.release_, nullptr);
        }
        return *this;
    }

    Subscription::~Subscription() { unsubscribe(); }

    void Subscription::unsubscribe() noexcept {
        // Clear before releasing, the release may re-enter through a subscriber that drops this handle.
        if (auto release = std::exchange(release_, nullptr); release) { release(); }
    }

    bool Subscription::active() const noexcept { return static_cast<bool>(release_); }
} // namespace deltaflow
