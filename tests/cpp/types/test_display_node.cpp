#include <catch2/catch_test_macros.hpp>

#include "../change_recorder.h"

#include <stdexcept>
#include <string>

using namespace deltaflow;
using deltaflow::test::ChangeRecorder;

TEST_CASE("DisplayNode - created with the required fields", "[display_node]") {
    reset_auto_id();
    auto node = make_display_node({.tag = std::string{"div"}, .props = Record{{"class", std::string{"foo"}}}});

    CHECK(node.id == "__auto_1");
    CHECK_FALSE(node.parent_id.has_value());
    CHECK(node.index == 0);
    CHECK(std::get<std::string>(node.tag) == "div");
    CHECK(node.props == Record{{"class", std::string{"foo"}}});
    CHECK_FALSE(node.is_component());
}

TEST_CASE("DisplayNode - the key prop is used as id", "[display_node]") {
    auto node = make_display_node({.tag = std::string{"div"}, .props = Record{{"key", std::string{"my-key"}}}});
    CHECK(node.id == "my-key");
}

TEST_CASE("DisplayNode - automatic ids count up until reset", "[display_node]") {
    reset_auto_id();
    auto a = make_display_node({.tag = std::string{"li"}});
    auto b = make_display_node({.tag = std::string{"li"}});
    CHECK(a.id == "__auto_1");
    CHECK(b.id == "__auto_2");

    reset_auto_id();
    CHECK(make_display_node({.tag = std::string{"li"}}).id == "__auto_1");
}

TEST_CASE("DisplayNode - text node", "[display_node]") {
    auto node = make_display_node({.tag = std::string{"#text"}, .text = std::string{"Hello"}, .parent_id = "root", .index = 2});

    CHECK(node.is_text());
    CHECK(node.text == "Hello");
    CHECK(node.parent_id == "root");
    CHECK(node.index == 2);
}

TEST_CASE("DisplayNode - components and handlers compare by identity", "[display_node]") {
    auto render = [](const Record &props) {
        return Collection<DisplayNode>::from({make_display_node({.tag = std::string{"span"}, .props = props})});
    };
    auto first = make_component(render, "Label");
    auto second = make_component(render, "Label");
    auto click = make_handler([](const Record &) {});

    auto a = make_display_node({.tag = first, .props = Record{{"key", std::string{"k"}}}, .handlers = {{"click", click}}});
    auto b = a;
    auto c = a;
    c.tag = second;

    CHECK(a == b);
    CHECK(value_hash<DisplayNode>{}(a) == value_hash<DisplayNode>{}(b));
    CHECK(a != c);
    CHECK(a.is_component());

    b.handlers["click"] = make_handler([](const Record &) {});
    CHECK(a != b);
}

TEST_CASE("DisplayNode - a component renders a collection of nodes", "[display_node]") {
    auto label = make_component(
        [](const Record &props) {
            return Collection<DisplayNode>::from(
                {make_display_node({.tag = std::string{"#text"}, .props = Record{{"key", std::string{"t"}}},
                                    .text = props.get<std::string>("text")})});
        },
        "Label");

    ChangeRecorder<DisplayNode> rec;
    auto sub = (*label)(Record{{"text", std::string{"hi"}}})->subscribe(rec.callback());

    REQUIRE(rec.size() == 1);
    CHECK(rec.changes()[0].value.text == "hi");
    CHECK(rec.changes()[0].value.id == "t");
    CHECK_THROWS_AS(make_component(nullptr), std::invalid_argument);
}

TEST_CASE("DisplayNode - travels through operators", "[display_node]") {
    auto nodes = input<DisplayNode>();
    auto ids = nodes->map([](const DisplayNode &n) { return n.id; });
    ChangeRecorder<std::string> rec;
    auto sub = ids->subscribe(rec.callback());

    auto node = make_display_node({.tag = std::string{"p"}, .props = Record{{"key", std::string{"para"}}}});
    nodes->insert(node);
    nodes->retract(node);

    CHECK(rec.changes() == std::vector{insert_of(std::string{"para"}), retract_of(std::string{"para"})});
    CHECK(to_string(node) == "<p id=para index=0 props={key: 'para'}>");
}
