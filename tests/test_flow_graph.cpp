// tests/test_flow_graph.cpp
#include <catch2/catch.hpp>
#include "agentflow/core/flow_graph.h"
#include "agentflow/core/types/action.h"
#include "agentflow/core/types/errors.h"
#include "test_helpers.h"

using namespace agentflow;
using agentflow::testing::make_agent;

TEST_CASE("get_next_node resolves exact, then default, then nothing", "[graph][resolve]") {
    FlowGraph graph;
    auto branch = graph.add(make_agent("branch"));
    auto exact = graph.add(make_agent("exact"));
    auto fallback = graph.add(make_agent("fallback"));

    SECTION("Exact match wins over default") {
        branch.on("complex", exact);
        branch.on_default(fallback);
        REQUIRE(branch.get_next_node("complex") == exact);
    }

    SECTION("Unknown action falls back to default") {
        branch.on("complex", exact);
        branch.on_default(fallback);
        REQUIRE(branch.get_next_node("simple") == fallback);
    }

    SECTION("No match and no default is absent") {
        branch.on("complex", exact);
        REQUIRE_FALSE(branch.get_next_node("simple").has_value());
    }
}

TEST_CASE("Default chain builds a linear path", "[graph][builder]") {
    FlowGraph chained;
    auto a = chained.add(make_agent("a"));
    auto b = chained.add(make_agent("b"));
    auto c = chained.add(make_agent("c"));
    auto last = a.on_default(b).on_default(c);
    REQUIRE(last == c);

    FlowGraph explicit_graph;
    auto ea = explicit_graph.add(make_agent("a"));
    auto eb = explicit_graph.add(make_agent("b"));
    auto ec = explicit_graph.add(make_agent("c"));
    ea.next(eb, "default");
    eb.next(ec, "default");

    for (NodeId id = 0; id < 3; ++id) {
        CHECK(chained.successors(id) == explicit_graph.successors(id));
    }
    CHECK(chained.successors(a.id()).at("default") == b.id());
    CHECK(chained.successors(c.id()).empty());
}

TEST_CASE("Conditional chain matches explicit next", "[graph][builder]") {
    FlowGraph bound;
    auto a = bound.add(make_agent("a"));
    auto b = bound.add(make_agent("b"));
    auto returned = a.on("x").to(b);
    REQUIRE(returned == b);

    FlowGraph explicit_graph;
    auto ea = explicit_graph.add(make_agent("a"));
    auto eb = explicit_graph.add(make_agent("b"));
    ea.next(eb, "x");

    CHECK(bound.successors(a.id()) == explicit_graph.successors(ea.id()));
    CHECK(bound.successors(a.id()).count("default") == 0);

    auto binder = a.on("y");
    CHECK(binder.source() == a);
    CHECK(binder.label() == "y");
}

TEST_CASE("Re-registering an action replaces the successor", "[graph][builder]") {
    FlowGraph graph;
    auto a = graph.add(make_agent("a"));
    auto b = graph.add(make_agent("b"));
    auto c = graph.add(make_agent("c"));

    a.on("go", b);
    a.on("go", c);
    REQUIRE(graph.successors(a.id()).size() == 1);
    REQUIRE(a.get_next_node("go") == c);
}

TEST_CASE("Nodes can be shared and cycles are representable", "[graph][topology]") {
    FlowGraph graph;
    auto shared = make_agent("shared");
    auto first = graph.add(shared);
    auto second = graph.add(shared);
    CHECK(&first.unit() == &second.unit());
    CHECK(first.id() != second.id());

    auto loop = graph.add(make_agent("loop"));
    loop.on("again", loop);
    REQUIRE(loop.get_next_node("again") == loop);

    REQUIRE(graph.find("loop") == loop);
    REQUIRE_FALSE(graph.find("missing").has_value());
}

TEST_CASE("Builder misuse is rejected", "[graph][errors]") {
    FlowGraph g1;
    FlowGraph g2;
    auto a = g1.add(make_agent("a"));
    auto b = g2.add(make_agent("b"));

    REQUIRE_THROWS_AS(a.next(b), GraphError);
    REQUIRE_THROWS_AS(a.on("", a), GraphError);
    REQUIRE_THROWS_AS(a.on(""), GraphError);
    REQUIRE_THROWS_AS(g1.add(nullptr), GraphError);
    REQUIRE_THROWS_AS(g1.connect(a.id(), 42), GraphError);
    REQUIRE_THROWS_AS(g1.handle(7), GraphError);

    NodeHandle invalid;
    CHECK_FALSE(invalid.valid());
    CHECK_FALSE(invalid.get_next_node("default").has_value());
    REQUIRE_THROWS_AS(invalid.next(a), GraphError);
}

TEST_CASE("Actions derive from metadata", "[graph][action]") {
    auto complex = action_from_metadata(Value{{"action", "complex"}});
    CHECK(complex.label == "complex");
    CHECK(complex.kind == ActionKind::CUSTOM);
    CHECK(action_from_metadata(Value::object()).kind == ActionKind::DEFAULT);
    CHECK(action_from_metadata(nullptr).label == "default");
    CHECK(action_from_metadata(Value{{"other", 1}}).label == "default");
    CHECK(action_from_metadata(Value{{"action", 3}}).label == "3");
    CHECK(action_from_metadata(Value{{"action", "failure"}}).kind == ActionKind::FAILURE);

    CHECK(has_explicit_action(Value{{"action", "default"}}));
    CHECK_FALSE(has_explicit_action(Value{{"result", "x"}}));

    CHECK(Action::parse("default").kind == ActionKind::DEFAULT);
    CHECK(Action::parse("success").kind == ActionKind::SUCCESS);
    CHECK(Action::parse("failure").kind == ActionKind::FAILURE);
    auto custom = Action::parse("needs_review");
    CHECK(custom.kind == ActionKind::CUSTOM);
    CHECK(custom.label == "needs_review");

    CHECK(Action::from_kind(ActionKind::FAILURE).label == "failure");
    REQUIRE_THROWS_AS(Action::from_kind(ActionKind::CUSTOM), std::invalid_argument);
}
