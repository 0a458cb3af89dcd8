// modules/executor/node_executor.cpp
#include "modules/executor/node_executor.h"
#include "common/utils/log.h"
#include "core/types/errors.h"
#include "modules/template/template_resolver.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

namespace agentflow {

namespace {
constexpr std::chrono::milliseconds kToolPollInterval{10};
} // namespace

const ToolBinding* NodeDescriptor::find_tool(const std::string& name) const {
    for (const auto& t : tools) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

NodeExecutor::NodeExecutor(LlmClient& llm, const ToolInvoker& tools, const CostEstimator& costs)
    : llm_(llm), tools_(tools), costs_(costs) {}

NodeResult NodeExecutor::execute(const NodeDescriptor& node, const StateRecord& snapshot,
                                 ExecutionBudget& budget) const {
    auto started = std::chrono::steady_clock::now();
    budget.check("node '" + node.id + "'");

    NodeResult result;
    result.node_id = node.id;

    LlmRequest request;
    request.node_id = node.id;
    request.settings = node.llm;
    request.budget = &budget;
    request.messages.push_back(ChatMessage{"user", TemplateResolver::resolve(node.prompt, snapshot), {}, "", ""});

    if (!node.tools.empty()) {
        run_tool_loop(node, request, result.metrics, budget);
    }
    result.delta = extract_structured(node, request, result.metrics, budget);

    result.metrics.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return result;
}

void NodeExecutor::before_llm_call(const NodeDescriptor& node, ExecutionBudget& budget) const {
    budget.check("node '" + node.id + "'");
    if (!budget.try_consume_llm_call()) {
        throw NodeExecutionError(node.id, "LLM call budget exhausted (max_llm_calls=" +
                                          std::to_string(budget.max_llm_calls) + ")");
    }
}

void NodeExecutor::account(const NodeDescriptor& node, const TokenUsage& usage, NodeMetrics& metrics) const {
    metrics.llm_calls += 1;
    metrics.input_tokens += usage.input_tokens;
    metrics.output_tokens += usage.output_tokens;
    metrics.cost_usd += costs_.estimate_cost(node.llm.model.value_or(""), usage.input_tokens, usage.output_tokens);
}

void NodeExecutor::run_tool_loop(const NodeDescriptor& node, LlmRequest& request,
                                 NodeMetrics& metrics, ExecutionBudget& budget) const {
    for (int iteration = 0; iteration < node.max_tool_iterations; ++iteration) {
        before_llm_call(node, budget);
        LlmResponse response;
        try {
            response = llm_.invoke_with_tools(request, node.tool_specs);
        } catch (const LlmError& e) {
            throw NodeExecutionError(node.id, e.what());
        }
        // A call that outlived the deadline is discarded
        budget.check("node '" + node.id + "'");
        account(node, response.usage, metrics);
        metrics.tool_iterations = iteration + 1;

        ChatMessage assistant{"assistant", response.content, response.tool_calls, "", ""};
        request.messages.push_back(std::move(assistant));

        if (response.tool_calls.empty()) {
            return;
        }
        for (const auto& call : response.tool_calls) {
            request.messages.push_back(call_tool(node, call, metrics, budget));
        }
    }
    log_warning("node '" + node.id + "' reached the tool iteration cap (" +
                std::to_string(node.max_tool_iterations) + "), continuing with structured output");
}

ChatMessage NodeExecutor::call_tool(const NodeDescriptor& node, const ToolCall& call,
                                    NodeMetrics& metrics, ExecutionBudget& budget) const {
    budget.check("tool '" + call.name + "' in node '" + node.id + "'");
    ChatMessage observation{"tool", "", {}, call.id, call.name};

    const ToolBinding* binding = node.find_tool(call.name);
    if (!binding) {
        log_warning("node '" + node.id + "' requested unbound tool '" + call.name + "'");
        observation.content = Value{{"error", "tool '" + call.name + "' is not available to this node"}}.dump();
        return observation;
    }

    metrics.tool_calls += 1;
    try {
        Value output = run_tool(node, call, budget);
        observation.content = output.is_string() ? output.get<std::string>() : output.dump();
    } catch (const ToolExecutionError& e) {
        if (binding->on_error == ToolErrorPolicy::FAIL) {
            throw;
        }
        log_warning("node '" + node.id + "': " + std::string(e.what()));
        observation.content = Value{{"error", e.what()}}.dump();
    }
    return observation;
}

Value NodeExecutor::run_tool(const NodeDescriptor& node, const ToolCall& call, ExecutionBudget& budget) const {
    // 工具线程只持有自己的拷贝；超时后被放弃的调用在后台自行结束
    auto outcome = std::make_shared<std::promise<Value>>();
    std::future<Value> pending = outcome->get_future();
    std::thread([fn = tools_.bind(call.name), args = call.arguments, outcome]() {
        try {
            outcome->set_value(fn(args));
        } catch (...) {
            outcome->set_exception(std::current_exception());
        }
    }).detach();

    const std::string where = "tool '" + call.name + "' in node '" + node.id + "'";
    while (pending.wait_for(kToolPollInterval) != std::future_status::ready) {
        budget.check(where);
    }
    return pending.get();
}

Value NodeExecutor::extract_structured(const NodeDescriptor& node, LlmRequest& request,
                                       NodeMetrics& metrics, ExecutionBudget& budget) const {
    const int attempts = 1 + std::max(0, node.max_retries);
    std::vector<std::string> last_errors;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        before_llm_call(node, budget);
        StructuredResponse response;
        try {
            response = llm_.invoke_structured(request, node.contract.json_schema());
        } catch (const LlmError& e) {
            throw NodeExecutionError(node.id, e.what());
        }
        budget.check("node '" + node.id + "'");
        account(node, response.usage, metrics);

        OutputValidation validation = node.contract.validate(response.raw);
        if (validation.ok) {
            return validation.delta;
        }

        last_errors = validation.errors;
        if (attempt < attempts) {
            metrics.retries += 1;
            log_debug("node '" + node.id + "' structured output rejected (attempt " +
                      std::to_string(attempt) + "), retrying");
            std::string correction = kCorrectionPrompt;
            for (const auto& err : validation.errors) correction += "\n- " + err;
            request.messages.push_back(ChatMessage{"assistant", response.raw.dump(), {}, "", ""});
            request.messages.push_back(ChatMessage{"user", correction, {}, "", ""});
        }
    }
    throw OutputValidationError(node.id, attempts, last_errors);
}

} // namespace agentflow
