#pragma once

/**
 * @file node.h
 * @brief Node - the untyped identity shared by every collection.
 *
 * Observers see collections through this interface only, so tracing and statistics do not
 * depend on the value type carried by the collection.
 */

#include <deltaflow/deltaflow_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace deltaflow {

enum class NodeKind : std::uint8_t {
    Base,    ///< Holds its own snapshot and replays it to new subscribers
    Derived  ///< Re-derives its output from its upstream collections
};

[[nodiscard]] DELTAFLOW_EXPORT std::string_view to_string(NodeKind kind) noexcept;

class DELTAFLOW_EXPORT Node {
public:
    using ptr = Node *;

    explicit Node(std::string label, NodeKind kind);

    Node(const Node &) = delete;
    Node &operator=(const Node &) = delete;

    virtual ~Node() = default;

    /**
     * @brief Process unique, monotonically assigned identifier.
     */
    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

    [[nodiscard]] const std::string &label() const noexcept { return label_; }

    [[nodiscard]] NodeKind kind() const noexcept { return kind_; }

    [[nodiscard]] virtual std::size_t subscriber_count() const = 0;

    /**
     * @brief "label#id", used in trace output.
     */
    [[nodiscard]] std::string name() const;

protected:
    void set_label(std::string label) { label_ = std::move(label); }

private:
    std::uint64_t id_;
    std::string label_;
    NodeKind kind_;
};

} // namespace deltaflow
