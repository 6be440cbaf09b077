#pragma once

#include <deltaflow/runtime/observers/dataflow_observer.h>

#include <optional>
#include <string>

namespace deltaflow {

    /**
     * @brief Logs out the activity of the engine as it happens.
     *
     * This is voluminous but can be helpful tracing down unexpected behaviour, every subscription, node start
     * and stop, emitted delta and transaction flush is reported.
     */
    class DELTAFLOW_EXPORT DeltaTrace : public DataflowObserver {
    public:
        /**
         * @brief Construct a new Delta Trace object
         *
         * @param filter Used to restrict which nodes are reported (substring match on the node label)
         * @param subscribe Log subscribe / unsubscribe events
         * @param lifecycle Log node start / stop events
         * @param emit Log emitted deltas
         * @param transaction Log transaction events
         */
        explicit DeltaTrace(const std::optional<std::string> &filter = std::nullopt, bool subscribe = true,
                            bool lifecycle = true, bool emit = true, bool transaction = true);

        [[nodiscard]] bool wants_values() const override { return _emit && _print_all_values; }

        void on_subscribe(const Node &node) override;
        void on_unsubscribe(const Node &node) override;
        void on_start(const Node &node) override;
        void on_stop(const Node &node) override;
        void on_emit(const Node &node, Delta delta, std::string_view value) override;
        void on_transaction_begin(std::size_t depth) override;
        void on_transaction_flush(std::size_t pending) override;

        // Static configuration
        static void set_print_all_values(bool value);
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _subscribe;
        bool _lifecycle;
        bool _emit;
        bool _transaction;

        static bool _print_all_values;
        static bool _use_logger;

        void _print(const std::string &msg) const;
        void _print_node(const Node &node, const std::string &msg) const;
        [[nodiscard]] bool _should_log_node(const Node &node) const;
    };

} // namespace deltaflow
