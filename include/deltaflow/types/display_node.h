#pragma once

/**
 * @file display_node.h
 * @brief DisplayNode - the element type a view tree is expressed in.
 *
 * A renderer subscribes to a Collection<DisplayNode> and patches its output as nodes are
 * inserted and retracted. Nodes refer to their parent by id and are ordered among their
 * siblings by index, so the tree can be rebuilt from an unordered multiset of nodes.
 */

#include <deltaflow/deltaflow_export.h>
#include <deltaflow/deltaflow_forward_declarations.h>
#include <deltaflow/types/record.h>
#include <deltaflow/types/value_hash.h>

#include <fmt/format.h>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace deltaflow {

class Component;

/// A component producing a subtree from its props, compared by identity
using ComponentFn = std::shared_ptr<const Component>;

/// An event handler attached to a node, compared by identity
using Handler = std::shared_ptr<const std::function<void(const Record &)>>;

struct DELTAFLOW_EXPORT DisplayNode {
    using tag_type = std::variant<std::string, ComponentFn>;
    using handlers_type = std::map<std::string, Handler, std::less<>>;

    std::string id;
    std::optional<std::string> parent_id;
    std::size_t index{0};
    tag_type tag;
    Record props;
    handlers_type handlers;
    std::optional<std::string> text;

    [[nodiscard]] bool is_component() const noexcept { return std::holds_alternative<ComponentFn>(tag); }

    [[nodiscard]] bool is_text() const noexcept { return text.has_value(); }

    bool operator==(const DisplayNode &) const = default;
};

template<>
struct value_hash<DisplayNode> {
    [[nodiscard]] DELTAFLOW_EXPORT std::uint64_t operator()(const DisplayNode &node) const;
};

class DELTAFLOW_EXPORT Component {
public:
    using render_fn = std::function<collection_ptr<DisplayNode>(const Record &)>;

    explicit Component(render_fn render, std::string name = "component");

    [[nodiscard]] collection_ptr<DisplayNode> operator()(const Record &props) const;

    [[nodiscard]] const std::string &name() const noexcept { return name_; }

private:
    render_fn render_;
    std::string name_;
};

[[nodiscard]] DELTAFLOW_EXPORT ComponentFn make_component(Component::render_fn render,
                                                          std::string name = "component");

[[nodiscard]] DELTAFLOW_EXPORT Handler make_handler(std::function<void(const Record &)> fn);

struct DisplayNodeOptions {
    DisplayNode::tag_type tag;
    Record props{};
    std::optional<std::string> text{};
    std::optional<std::string> parent_id{};
    std::size_t index{0};
    DisplayNode::handlers_type handlers{};
};

/**
 * @brief Build a node, using props["key"] as its id or else the next automatic id (__auto_<n>).
 */
[[nodiscard]] DELTAFLOW_EXPORT DisplayNode make_display_node(DisplayNodeOptions options);

/**
 * @brief Restart automatic ids from __auto_1.
 */
DELTAFLOW_EXPORT void reset_auto_id() noexcept;

[[nodiscard]] DELTAFLOW_EXPORT std::string to_string(const DisplayNode &node);

} // namespace deltaflow

template<>
struct fmt::formatter<deltaflow::DisplayNode> : fmt::formatter<std::string> {
    auto format(const deltaflow::DisplayNode &node, fmt::format_context &ctx) const {
        return fmt::formatter<std::string>::format(deltaflow::to_string(node), ctx);
    }
};
