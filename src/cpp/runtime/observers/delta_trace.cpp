#include <deltaflow/runtime/observers/delta_trace.h>

#include <fmt/format.h>

#include <cstdio>

namespace deltaflow {

    // Static member initialization
    bool DeltaTrace::_print_all_values = false;
    bool DeltaTrace::_use_logger = true;

    DeltaTrace::DeltaTrace(const std::optional<std::string> &filter, bool subscribe, bool lifecycle, bool emit,
                           bool transaction)
        : _filter(filter), _subscribe(subscribe), _lifecycle(lifecycle), _emit(emit), _transaction(transaction) {
    }

    void DeltaTrace::set_print_all_values(bool value) {
        _print_all_values = value;
    }

    void DeltaTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void DeltaTrace::_print(const std::string &msg) const {
        // The logger is stderr, the alternative is stdout so trace can be interleaved with program output
        fmt::print(_use_logger ? stderr : stdout, "[deltaflow] {}\n", msg);
    }

    void DeltaTrace::_print_node(const Node &node, const std::string &msg) const {
        _print(fmt::format("[{}] {}", node.name(), msg));
    }

    bool DeltaTrace::_should_log_node(const Node &node) const {
        return !_filter.has_value() || node.label().find(*_filter) != std::string::npos;
    }

    void DeltaTrace::on_subscribe(const Node &node) {
        if (_subscribe && _should_log_node(node)) {
            _print_node(node, fmt::format("Subscribed ({} subscribers)", node.subscriber_count()));
        }
    }

    void DeltaTrace::on_unsubscribe(const Node &node) {
        if (_subscribe && _should_log_node(node)) {
            _print_node(node, fmt::format("Unsubscribed ({} subscribers)", node.subscriber_count()));
        }
    }

    void DeltaTrace::on_start(const Node &node) {
        if (_lifecycle && _should_log_node(node)) { _print_node(node, "Starting"); }
    }

    void DeltaTrace::on_stop(const Node &node) {
        if (_lifecycle && _should_log_node(node)) { _print_node(node, "Stopped"); }
    }

    void DeltaTrace::on_emit(const Node &node, Delta delta, std::string_view value) {
        if (!_emit || !_should_log_node(node)) { return; }
        if (_print_all_values) {
            _print_node(node, fmt::format("{} {}", delta, value));
        } else {
            _print_node(node, fmt::format("{}", delta));
        }
    }

    void DeltaTrace::on_transaction_begin(std::size_t depth) {
        if (_transaction) { _print(fmt::format("Transaction begin (depth {})", depth)); }
    }

    void DeltaTrace::on_transaction_flush(std::size_t pending) {
        if (_transaction) { _print(fmt::format("Transaction flush ({} emissions)", pending)); }
    }

} // namespace deltaflow
