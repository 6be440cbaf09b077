#include <deltaflow/types/node.h>

#include <fmt/format.h>

#include <atomic>

namespace deltaflow {
    namespace {
        std::uint64_t next_node_id() {
            static std::atomic<std::uint64_t> counter{0};
            return ++counter;
        }
    } // namespace

    std::string_view to_string(NodeKind kind) noexcept {
        switch (kind) {
            case NodeKind::Base:
                return "base";
            case NodeKind::Derived:
                return "derived";
        }
        return "unknown";
    }

    Node::Node(std::string label, NodeKind kind) : id_{next_node_id()}, label_{std::move(label)}, kind_{kind} {}

    std::string Node::name() const { return fmt::format("{}#{}", label_, id_); }
} // namespace deltaflow
