// tests/test_context_store.cpp
#include <catch2/catch.hpp>
#include "agentflow/core/context_store.h"
#include <string>

using namespace agentflow;

TEST_CASE("record_flow_step is append-only", "[context][history]") {
    ContextStore ctx;
    REQUIRE(ctx.flow_history().empty());
    REQUIRE_FALSE(ctx.current_agent().has_value());

    ctx.record_flow_step("planner", "complex", "plan-a", Value{{"action", "complex"}});
    ctx.record_flow_step("coder", "default", Value{{"files", 2}});
    ctx.record_flow_step("planner", "success", nullptr, Value{{"note", "again"}});

    const auto& history = ctx.flow_history();
    REQUIRE(history.size() == 3);

    CHECK(history[0].step == 0);
    CHECK(history[0].agent_name == "planner");
    CHECK(history[0].action == "complex");
    CHECK(history[0].result == "plan-a");
    CHECK(history[0].metadata["action"] == "complex");

    CHECK(history[1].step == 1);
    CHECK(history[1].agent_name == "coder");
    CHECK(history[1].result["files"] == 2);
    CHECK(history[1].metadata.is_object());
    CHECK(history[1].metadata.empty());

    CHECK(history[2].step == 2);
    CHECK(history[2].result.is_null());
    CHECK(history[2].metadata["note"] == "again");

    REQUIRE(ctx.current_agent() == std::optional<std::string>("planner"));
    REQUIRE(ctx.branch_decisions() == std::vector<std::string>{"complex", "default", "success"});
}

TEST_CASE("Flow summary is read-only and aggregates visits", "[context][summary]") {
    ContextStore ctx;
    auto empty = ctx.get_flow_summary();
    CHECK(empty.total_steps == 0);
    CHECK_FALSE(empty.current_agent.has_value());
    CHECK(empty.agents_visited.empty());

    ctx.record_flow_step("a", "default", 1);
    ctx.record_flow_step("b", "x", 2);
    ctx.record_flow_step("a", "default", 3);

    auto summary = ctx.get_flow_summary();
    CHECK(summary.total_steps == 3);
    CHECK(summary.current_agent == std::optional<std::string>("a"));
    CHECK(summary.branch_decisions == std::vector<std::string>{"default", "x", "default"});
    CHECK(summary.agents_visited == std::vector<std::string>{"a", "b"});
    CHECK(summary.action_counts.at("default") == 2);
    CHECK(summary.action_counts.at("x") == 1);
    CHECK(summary.kind_counts.at(ActionKind::DEFAULT) == 2);
    CHECK(summary.kind_counts.at(ActionKind::CUSTOM) == 1);
    CHECK(ctx.flow_history()[1].action_kind == ActionKind::CUSTOM);

    // 返回的是副本
    summary.branch_decisions.clear();
    CHECK(ctx.branch_decisions().size() == 3);
    CHECK(ctx.get_flow_summary().total_steps == 3);

    auto j = to_json(ctx.get_flow_summary());
    CHECK(j["total_steps"] == 3);
    CHECK(j["current_agent"] == "a");
    CHECK(j["action_counts"]["x"] == 1);
    CHECK(j["kind_counts"]["custom"] == 1);
    CHECK(j["kind_counts"]["default"] == 2);
}

TEST_CASE("reset_flow clears history but keeps flow params", "[context][reset]") {
    ContextStore ctx(Params{{"model", "qwen"}, {"temperature", 0.2}});
    ctx.record_flow_step("a", "default", "r1");
    ctx.record_flow_step("b", "done", "r2");

    ctx.reset_flow();

    CHECK(ctx.flow_history().empty());
    CHECK(ctx.branch_decisions().empty());
    CHECK_FALSE(ctx.current_agent().has_value());
    CHECK(ctx.get_flow_params()["model"] == "qwen");
    CHECK(ctx.get_flow_params()["temperature"] == 0.2);

    // reset 之后重新开始编号
    ctx.record_flow_step("c", "default", "r3");
    REQUIRE(ctx.flow_history().size() == 1);
    CHECK(ctx.flow_history()[0].step == 0);
}

TEST_CASE("Flow params must be an object", "[context][params]") {
    ContextStore ctx;
    ctx.set_flow_params(nullptr);
    CHECK(ctx.get_flow_params().is_object());
    REQUIRE_THROWS_AS(ctx.set_flow_params(Value::array({1, 2})), std::invalid_argument);

    ctx.set_flow_params(Params{{"k", "v"}});
    CHECK(ctx.get_flow_params()["k"] == "v");
}

TEST_CASE("History exports to JSON in execution order", "[context][export]") {
    ContextStore ctx;
    ctx.record_flow_step("first", "go", Value{{"n", 1}}, Value{{"action", "go"}});
    ctx.record_flow_step("second", "default", "done");

    auto j = ctx.history_to_json();
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    CHECK(j[0]["agent_name"] == "first");
    CHECK(j[0]["action"] == "go");
    CHECK(j[0]["result"]["n"] == 1);
    CHECK(j[0]["metadata"]["action"] == "go");
    CHECK(j[1]["step"] == 1);
    CHECK(j[1].contains("recorded_at_ms"));
}
