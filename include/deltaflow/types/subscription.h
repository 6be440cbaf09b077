#pragma once

/**
 * @file subscription.h
 * @brief Subscription - the handle returned by Collection::subscribe.
 *
 * A Subscription owns the release of one subscriber registration. Releasing it removes the
 * callback from the collection and, for derived collections that lose their last subscriber,
 * tears down the whole upstream subscription subtree. The handle releases on destruction, so
 * discarding the result of subscribe() immediately unsubscribes.
 */

#include <deltaflow/deltaflow_export.h>

#include <functional>

namespace deltaflow {

class DELTAFLOW_EXPORT Subscription {
public:
    using release_fn = std::function<void()>;

    Subscription() = default;

    explicit Subscription(release_fn release);

    // Non-copyable, movable
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    ~Subscription();

    /**
     * @brief Detach from the collection. Calling this more than once is a no-op.
     */
    void unsubscribe() noexcept;

    /**
     * @brief True until unsubscribe() has been called (or the handle was moved from).
     */
    [[nodiscard]] bool active() const noexcept;

    explicit operator bool() const noexcept { return active(); }

private:
    release_fn release_;
};

} // namespace deltaflow
