#include <deltaflow/runtime/observers/dataflow_observer.h>

#include <algorithm>

namespace deltaflow {

    ObserverRegistry &ObserverRegistry::instance() {
        thread_local ObserverRegistry registry;
        return registry;
    }

    void ObserverRegistry::add(DataflowObserver::s_ptr observer) {
        if (!observer) { return; }
        _observers.push_back(std::move(observer));
    }

    void ObserverRegistry::remove(const DataflowObserver::s_ptr &observer) {
        auto it = std::find(_observers.begin(), _observers.end(), observer);
        if (it != _observers.end()) { _observers.erase(it); }
    }

    void ObserverRegistry::clear() { _observers.clear(); }

    bool ObserverRegistry::wants_values() const {
        return std::any_of(_observers.begin(), _observers.end(),
                           [](const auto &observer) { return observer->wants_values(); });
    }

    // Observers may install or remove observers from within a hook, so notify over a copy.

    void ObserverRegistry::on_subscribe(const Node &node) const {
        for (const auto observers = _observers; const auto &observer: observers) { observer->on_subscribe(node); }
    }

    void ObserverRegistry::on_unsubscribe(const Node &node) const {
        for (const auto observers = _observers; const auto &observer: observers) { observer->on_unsubscribe(node); }
    }

    void ObserverRegistry::on_start(const Node &node) const {
        for (const auto observers = _observers; const auto &observer: observers) { observer->on_start(node); }
    }

    void ObserverRegistry::on_stop(const Node &node) const {
        for (const auto observers = _observers; const auto &observer: observers) { observer->on_stop(node); }
    }

    void ObserverRegistry::on_emit(const Node &node, Delta delta, std::string_view value) const {
        for (const auto observers = _observers; const auto &observer: observers) { observer->on_emit(node, delta, value); }
    }

    void ObserverRegistry::on_transaction_begin(std::size_t depth) const {
        for (const auto observers = _observers; const auto &observer: observers) { observer->on_transaction_begin(depth); }
    }

    void ObserverRegistry::on_transaction_flush(std::size_t pending) const {
        for (const auto observers = _observers; const auto &observer: observers) {
            observer->on_transaction_flush(pending);
        }
    }
} // namespace deltaflow
