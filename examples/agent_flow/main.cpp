// examples/agent_flow/main.cpp
#include "agentflow/agents/branch_agent.h"
#include "agentflow/agents/function_agent.h"
#include "agentflow/agents/tool_agent.h"
#include "agentflow/core/engine_config.h"
#include "agentflow/core/flow_orchestrator.h"
#include "agentflow/tools/registry.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

using namespace agentflow;

int main(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [query] [engine_config.(json|yaml)]\n";
        return 1;
    }

    try {
        // 1. 加载配置
        EngineConfig config;
        if (argc == 3) {
            config = EngineConfig::from_file(argv[2]);
        }
        config.input_mode = InputMode::CHAINED;

        // 2. 注册工具
        ToolRegistry registry;
        registry.register_tool("calculate", [](const ToolArgs& args) -> nlohmann::json {
            auto a_it = args.find("a");
            auto b_it = args.find("b");
            if (a_it == args.end() || b_it == args.end()) {
                return nlohmann::json{{"error", "Missing arguments: a, b"}};
            }
            return nlohmann::json{{"result", std::stod(a_it->second) * std::stod(b_it->second)}};
        });
        registry.register_tool("echo", [](const ToolArgs& args) -> nlohmann::json {
            auto it = args.find("text");
            return nlohmann::json{{"echo", it != args.end() ? it->second : ""}};
        });

        // 3. 子流程：拆分任务 → 计算
        auto compute_flow = std::make_shared<FlowOrchestrator>("compute_flow");
        compute_flow->set_options(config.flow_options());
        auto& cg = compute_flow->graph();
        auto split = cg.add(std::make_shared<FunctionAgent>("split", [](const PlanResult& plan) {
            AgentOutput out;
            out.result = {{"task", plan.plan}, {"parts", 2}};
            out.metadata["action"] = "default";
            return out;
        }));
        compute_flow->start(split).on_default(cg.add(std::make_shared<ToolAgent>(
            "multiply", registry, "calculate",
            std::unordered_map<std::string, std::string>{
                {"a", "{{ parameters.factor }}"},
                {"b", "{{ context.previous_result.parts }}"}})));
        compute_flow->set_params(Params{{"factor", 21}});

        // 4. 主流程：分类 → complex 走子流程，simple 走 echo
        auto main_flow = std::make_shared<FlowOrchestrator>("main_flow");
        main_flow->set_options(config.flow_options());
        auto& g = main_flow->graph();
        auto classify = g.add(std::make_shared<BranchAgent>(
            "classify", std::vector<BranchAgent::Route>{{"{{ length(query) > 24 }}", "complex"}}, "simple"));
        auto compute = g.add(compute_flow);
        auto echo = g.add(std::make_shared<ToolAgent>(
            "echo", registry, "echo", std::unordered_map<std::string, std::string>{{"text", "{{ query }}"}}));
        auto report = g.add(std::make_shared<FunctionAgent>("report", [](const PlanResult& plan) {
            AgentOutput out;
            out.result = plan.metadata["context"].value("previous_result", nlohmann::json());
            out.metadata["action"] = "done";
            return out;
        }));
        auto apologize = g.add(std::make_shared<FunctionAgent>("apologize", [](const PlanResult&) {
            AgentOutput out;
            out.result = "The computation failed.";
            out.metadata["action"] = "done";
            return out;
        }));

        main_flow->start(classify);
        classify.on("complex").to(compute).on("success", report);
        compute.on("failure", apologize);
        classify.on("simple", echo);

        // 5. 执行
        ContextStore context;
        config.apply(context);

        AgentInput input;
        input.query = argc >= 2 ? argv[1] : "compute the answer to everything please";
        auto output = main_flow->run_async(context, input).get();

        std::cout << "[SUCCESS]\n";
        std::cout << "Result:\n" << output.result.dump(2) << "\n\n";
        std::cout << "Summary:\n" << to_json(context.get_flow_summary()).dump(2) << "\n";

        // 6. 导出执行历史
        std::ofstream history_file("flow_history.json");
        history_file << context.history_to_json().dump(2) << std::endl;
        std::cout << "History exported to flow_history.json (" << context.flow_history().size() << " records)\n";

    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
