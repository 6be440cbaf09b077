#pragma once

/**
 * @file subscriber_list.h
 * @brief SubscriberList - the downstream listeners of one collection.
 *
 * Delivery is re-entrant: a callback may subscribe or unsubscribe (itself or others) while a
 * change is being fanned out. The fan-out works on a snapshot of the registrations taken when
 * it starts; registrations removed during the fan-out are skipped, registrations added during
 * it do not see the change being delivered.
 */

#include <deltaflow/types/delta.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace deltaflow {

template<typename T>
class SubscriberList {
public:
    using callback_type = std::function<void(const T &, Delta)>;
    using key_type = std::uint64_t;

    SubscriberList() = default;

    // Registrations are handed out by key, moving the list would orphan them
    SubscriberList(const SubscriberList &) = delete;
    SubscriberList &operator=(const SubscriberList &) = delete;

    ~SubscriberList() {
        for (auto &entry: entries_) { entry->active = false; }
    }

    // ========== Subscriber Management ==========

    /**
     * @brief Register a callback.
     * @return The key used to remove it again
     */
    key_type add(callback_type callback) {
        auto key = ++last_key_;
        entries_.push_back(std::make_shared<Entry>(key, std::move(callback)));
        return key;
    }

    /**
     * @brief Remove the registration for key.
     * @return true if the key was registered
     */
    bool remove(key_type key) {
        auto it = std::find_if(entries_.begin(), entries_.end(), [key](const auto &e) { return e->key == key; });
        if (it == entries_.end()) { return false; }
        (*it)->active = false;
        entries_.erase(it);
        return true;
    }

    // ========== Notification ==========

    /**
     * @brief Deliver a change to every registered callback, in registration order.
     */
    void notify(const T &value, Delta delta) const {
        if (entries_.empty()) { return; }
        if (entries_.size() == 1) {
            // Hold the entry, the callback may remove itself
            auto entry = entries_.front();
            entry->callback(value, delta);
            return;
        }
        auto snapshot = entries_;
        for (const auto &entry: snapshot) {
            if (entry->active) { entry->callback(value, delta); }
        }
    }

    // ========== Accessors ==========

    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] std::size_t size() const { return entries_.size(); }

private:
    struct Entry {
        Entry(key_type key_, callback_type callback_) : key{key_}, callback{std::move(callback_)} {}

        key_type key;
        callback_type callback;
        bool active{true};
    };

    std::vector<std::shared_ptr<Entry>> entries_;
    key_type last_key_{0};
};

} // namespace deltaflow
