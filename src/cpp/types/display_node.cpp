#include <deltaflow/types/display_node.h>
#include <deltaflow/types/collection.h>
#include <deltaflow/util/errors.h>

#include <atomic>
#include <stdexcept>

namespace deltaflow {
    namespace {
        std::atomic<std::uint64_t> &auto_id_counter() {
            static std::atomic<std::uint64_t> counter{0};
            return counter;
        }

        std::string key_of(const Value &key) {
            if (const auto *s = std::get_if<std::string>(&key)) { return *s; }
            return to_string(key);
        }
    } // namespace

    Component::Component(render_fn render, std::string name) : render_{std::move(render)}, name_{std::move(name)} {
        if (!render_) { throw_error<std::invalid_argument>("Component '{}' has no render function", name_); }
    }

    collection_ptr<DisplayNode> Component::operator()(const Record &props) const { return render_(props); }

    ComponentFn make_component(Component::render_fn render, std::string name) {
        return std::make_shared<const Component>(std::move(render), std::move(name));
    }

    Handler make_handler(std::function<void(const Record &)> fn) {
        return std::make_shared<const std::function<void(const Record &)>>(std::move(fn));
    }

    DisplayNode make_display_node(DisplayNodeOptions options) {
        std::string id;
        if (auto key = options.props.value_or_none("key"); !std::holds_alternative<std::monostate>(key)) {
            id = key_of(key);
        } else {
            id = fmt::format("__auto_{}", ++auto_id_counter());
        }
        return DisplayNode{
            .id = std::move(id),
            .parent_id = std::move(options.parent_id),
            .index = options.index,
            .tag = std::move(options.tag),
            .props = std::move(options.props),
            .handlers = std::move(options.handlers),
            .text = std::move(options.text),
        };
    }

    void reset_auto_id() noexcept { auto_id_counter().store(0); }

    std::string to_string(const DisplayNode &node) {
        const std::string tag = std::visit(
            [](const auto &t) -> std::string {
                if constexpr (std::is_same_v<std::decay_t<decltype(t)>, std::string>) {
                    return t;
                } else {
                    return t ? t->name() : std::string{"<null>"};
                }
            },
            node.tag);
        std::string out = fmt::format("<{} id={}", tag, node.id);
        if (node.parent_id) { out += fmt::format(" parent={}", *node.parent_id); }
        out += fmt::format(" index={}", node.index);
        if (!node.props.empty()) { out += fmt::format(" props={}", node.props); }
        if (node.text) { out += fmt::format(" text='{}'", *node.text); }
        out += ">";
        return out;
    }

    std::uint64_t value_hash<DisplayNode>::operator()(const DisplayNode &node) const {
        std::uint64_t seed = value_hash<std::string>{}(node.id);
        seed = hash_combine(seed, node.parent_id ? value_hash<std::string>{}(*node.parent_id) : 0U);
        seed = hash_combine(seed, node.index);
        seed = hash_combine(seed, node.tag.index());
        if (const auto *name = std::get_if<std::string>(&node.tag)) {
            seed = hash_combine(seed, value_hash<std::string>{}(*name));
        } else {
            seed = hash_combine(seed, value_hash<ComponentFn>{}(std::get<ComponentFn>(node.tag)));
        }
        seed = hash_combine(seed, value_hash<Record>{}(node.props));
        for (const auto &[name, handler]: node.handlers) {
            seed = hash_combine(seed, value_hash<std::string>{}(name));
            seed = hash_combine(seed, value_hash<Handler>{}(handler));
        }
        seed = hash_combine(seed, node.text ? value_hash<std::string>{}(*node.text) : 0U);
        return seed;
    }
} // namespace deltaflow
