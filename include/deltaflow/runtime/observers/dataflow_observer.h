#pragma once

#include <deltaflow/deltaflow_export.h>
#include <deltaflow/types/delta.h>
#include <deltaflow/types/node.h>

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace deltaflow {

    /**
     * @brief Receives notifications about the activity of the engine.
     *
     * All hooks default to no-ops, implementations override what they are interested in. Observers are
     * installed on the ObserverRegistry of the thread that drives the collections.
     */
    struct DataflowObserver {
        using ptr = DataflowObserver *;
        using s_ptr = std::shared_ptr<DataflowObserver>;

        virtual ~DataflowObserver() = default;

        /**
         * When any installed observer returns true, emitted values are rendered to text and passed to on_emit.
         * Rendering is skipped otherwise.
         */
        [[nodiscard]] virtual bool wants_values() const { return false; }

        virtual void on_subscribe(const Node &) {
        };

        virtual void on_unsubscribe(const Node &) {
        };

        virtual void on_start(const Node &) {
        };

        virtual void on_stop(const Node &) {
        };

        virtual void on_emit(const Node &, Delta, std::string_view) {
        };

        virtual void on_transaction_begin(std::size_t) {
        };

        virtual void on_transaction_flush(std::size_t) {
        };
    };

    /**
     * @brief The observers installed on the current thread.
     */
    class DELTAFLOW_EXPORT ObserverRegistry {
    public:
        static ObserverRegistry &instance();

        void add(DataflowObserver::s_ptr observer);

        void remove(const DataflowObserver::s_ptr &observer);

        void clear();

        [[nodiscard]] bool empty() const { return _observers.empty(); }

        [[nodiscard]] std::size_t size() const { return _observers.size(); }

        /**
         * Asked on every emission, so an observer may change its answer after it was installed.
         */
        [[nodiscard]] bool wants_values() const;

        void on_subscribe(const Node &node) const;

        void on_unsubscribe(const Node &node) const;

        void on_start(const Node &node) const;

        void on_stop(const Node &node) const;

        void on_emit(const Node &node, Delta delta, std::string_view value) const;

        void on_transaction_begin(std::size_t depth) const;

        void on_transaction_flush(std::size_t pending) const;

    private:
        std::vector<DataflowObserver::s_ptr> _observers;
    };

} // namespace deltaflow
