#include <deltaflow/runtime/observers/delta_statistics.h>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <vector>

namespace deltaflow {

    DeltaStatistics::Counts &DeltaStatistics::_counts_for(const Node &node) {
        auto [it, inserted] = _nodes.try_emplace(node.id());
        if (inserted) { _names.emplace(node.id(), node.name()); }
        return it->second;
    }

    void DeltaStatistics::on_subscribe(const Node &node) {
        ++_counts_for(node).subscribes;
        ++_totals.subscribes;
    }

    void DeltaStatistics::on_unsubscribe(const Node &node) {
        ++_counts_for(node).unsubscribes;
        ++_totals.unsubscribes;
    }

    void DeltaStatistics::on_start(const Node &node) {
        ++_counts_for(node).starts;
        ++_totals.starts;
    }

    void DeltaStatistics::on_stop(const Node &node) {
        ++_counts_for(node).stops;
        ++_totals.stops;
    }

    void DeltaStatistics::on_emit(const Node &node, Delta delta, std::string_view) {
        auto &counts = _counts_for(node);
        if (delta == Delta::Insert) {
            ++counts.inserts;
            ++_totals.inserts;
        } else {
            ++counts.retracts;
            ++_totals.retracts;
        }
    }

    void DeltaStatistics::on_transaction_flush(std::size_t pending) {
        ++_flushes;
        _flushed_emissions += pending;
    }

    DeltaStatistics::Counts DeltaStatistics::node(const Node &node) const {
        if (auto it = _nodes.find(node.id()); it != _nodes.end()) { return it->second; }
        return {};
    }

    void DeltaStatistics::reset() {
        _nodes.clear();
        _names.clear();
        _totals = {};
        _flushes = 0;
        _flushed_emissions = 0;
    }

    std::string DeltaStatistics::report() const {
        std::vector<std::uint64_t> ids;
        ids.reserve(_nodes.size());
        std::ranges::transform(_nodes, std::back_inserter(ids), [](const auto &entry) { return entry.first; });
        std::ranges::sort(ids);

        std::string out;
        auto it = std::back_inserter(out);
        fmt::format_to(it, "{:<32} {:>8} {:>8} {:>6} {:>6} {:>6} {:>6}\n", "node", "insert", "retract", "sub", "unsub",
                       "start", "stop");
        for (auto id : ids) {
            const auto &c = _nodes.at(id);
            fmt::format_to(it, "{:<32} {:>8} {:>8} {:>6} {:>6} {:>6} {:>6}\n", _names.at(id), c.inserts, c.retracts,
                           c.subscribes, c.unsubscribes, c.starts, c.stops);
        }
        fmt::format_to(it, "{:<32} {:>8} {:>8} {:>6} {:>6} {:>6} {:>6}\n", "total", _totals.inserts, _totals.retracts,
                       _totals.subscribes, _totals.unsubscribes, _totals.starts, _totals.stops);
        fmt::format_to(it, "flushes: {} ({} emissions)\n", _flushes, _flushed_emissions);
        return out;
    }

} // namespace deltaflow
