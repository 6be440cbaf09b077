#pragma once

#include <deltaflow/runtime/observers/dataflow_observer.h>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <string>

namespace deltaflow {

    /**
     * @brief Counts the work done by the engine, per node and in total.
     *
     * Useful to confirm that the work performed for a change is proportional to the change and to track down
     * subscriptions that are never released.
     */
    class DELTAFLOW_EXPORT DeltaStatistics : public DataflowObserver {
    public:
        struct Counts {
            std::size_t inserts{0};
            std::size_t retracts{0};
            std::size_t subscribes{0};
            std::size_t unsubscribes{0};
            std::size_t starts{0};
            std::size_t stops{0};

            [[nodiscard]] std::size_t emitted() const { return inserts + retracts; }
        };

        void on_subscribe(const Node &node) override;
        void on_unsubscribe(const Node &node) override;
        void on_start(const Node &node) override;
        void on_stop(const Node &node) override;
        void on_emit(const Node &node, Delta delta, std::string_view value) override;
        void on_transaction_flush(std::size_t pending) override;

        /**
         * Counts for a single node, all zero when the node has not been seen.
         */
        [[nodiscard]] Counts node(const Node &node) const;

        [[nodiscard]] const Counts &totals() const { return _totals; }

        [[nodiscard]] std::size_t flushes() const { return _flushes; }

        [[nodiscard]] std::size_t flushed_emissions() const { return _flushed_emissions; }

        void reset();

        /**
         * Renders the per node counts as a table, ordered by node id.
         */
        [[nodiscard]] std::string report() const;

    private:
        Counts &_counts_for(const Node &node);

        ankerl::unordered_dense::map<std::uint64_t, Counts> _nodes;
        ankerl::unordered_dense::map<std::uint64_t, std::string> _names;
        Counts _totals;
        std::size_t _flushes{0};
        std::size_t _flushed_emissions{0};
    };

} // namespace deltaflow
