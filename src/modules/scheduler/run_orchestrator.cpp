#include "modules/scheduler/run_orchestrator.h"
#include "common/utils/expression_evaluator.h"
#include "common/utils/log.h"
#include "core/types/errors.h"
#include "modules/executor/node_executor.h"
#include "modules/graph/graph_compiler.h"
#include "modules/quality/quality_gates.h"
#include "modules/validator/config_validator.h"
#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <random>
#include <sstream>

namespace agentflow {

namespace {

// Internal carrier for the one fatal error that ends a run.
class RunAbort : public std::runtime_error {
public:
    explicit RunAbort(RunError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const RunError& error() const { return error_; }

private:
    RunError error_;
};

RunError make_error(const AgentFlowError& e, std::optional<NodeId> node_id = std::nullopt) {
    RunError error;
    error.code = e.code();
    error.message = e.what();
    error.node_id = std::move(node_id);
    if (auto* validation = dynamic_cast<const OutputValidationError*>(&e)) {
        error.details["attempts"] = validation->attempts();
        error.details["errors"] = validation->errors();
    } else if (auto* tool = dynamic_cast<const ToolExecutionError*>(&e)) {
        error.details["tool"] = tool->tool();
    } else if (auto* tmpl = dynamic_cast<const TemplateError*>(&e)) {
        error.details["field"] = tmpl->field();
    }
    return error;
}

RunError make_validation_error(const ConfigValidationError& e) {
    RunError error;
    error.code = e.code();
    error.message = e.what();
    Value list = Value::array();
    for (const auto& v : e.violations()) {
        Value item = {{"code", v.code}, {"message", v.message}, {"location", v.location}};
        if (!v.suggestion.empty()) item["suggestion"] = v.suggestion;
        list.push_back(std::move(item));
    }
    error.details["violations"] = std::move(list);
    return error;
}

std::string local_run_id() {
    static std::atomic<unsigned long> counter{0};
    std::random_device rd;
    std::ostringstream ss;
    ss << "local-" << std::hex << rd() << "-" << std::dec << ++counter;
    return ss.str();
}

// Collaborator calls never affect the run.
template <typename Fn>
void best_effort(const std::string& what, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        log_warning(what + " failed: " + e.what());
    }
}

} // namespace

struct RunOrchestrator::RunContext {
    const ExecutionPlan& plan;
    ExecutionBudget& budget;
    const NodeExecutor& executor;
    std::string run_id;
    InjaExpressionEvaluator evaluator;

    std::mutex fatal_mutex;
    std::optional<RunError> first_fatal;

    RunContext(const ExecutionPlan& p, ExecutionBudget& b, const NodeExecutor& e, std::string id)
        : plan(p), budget(b), executor(e), run_id(std::move(id)) {}

    // 记录首个致命错误并通知所有分支停止
    [[noreturn]] void abort(RunError error) {
        {
            std::lock_guard<std::mutex> lock(fatal_mutex);
            if (!first_fatal) first_fatal = error;
        }
        budget.halt();
        throw RunAbort(std::move(error));
    }
};

RunOrchestrator::RunOrchestrator(LlmClient& llm, const ToolInvoker& tools, Collaborators collaborators)
    : llm_(llm), tools_(tools), collaborators_(collaborators) {}

RunOutcome RunOrchestrator::run(const Value& document, const Value& inputs) {
    auto started = std::chrono::steady_clock::now();
    RunOutcome outcome;
    outcome.phase = RunPhase::LOADED;

    std::optional<WorkflowConfig> config;
    try {
        config = ConfigValidator(&tools_).validate(document);
    } catch (const ConfigValidationError& e) {
        log_error("workflow validation failed: " + std::string(e.what()));
        outcome.error = make_validation_error(e);
    } catch (const AgentFlowError& e) {
        log_error("workflow load failed: " + std::string(e.what()));
        outcome.error = make_error(e);
    } catch (const std::exception& e) {
        outcome.error = RunError{"ConfigLoadError", e.what(), std::nullopt, Value::object()};
    }
    if (!config) {
        outcome.status = RunStatus::FAILED;
        outcome.run_id = local_run_id();
        return outcome;
    }
    outcome.phase = RunPhase::VALIDATED;
    return execute(*config, inputs, std::move(outcome), started);
}

RunOutcome RunOrchestrator::run(const WorkflowConfig& config, const Value& inputs) {
    auto started = std::chrono::steady_clock::now();
    RunOutcome outcome;
    outcome.phase = RunPhase::LOADED;

    auto violations = ConfigValidator(&tools_).check_business_rules(config);
    if (!violations.empty()) {
        ConfigValidationError e(std::move(violations));
        log_error("workflow validation failed: " + std::string(e.what()));
        outcome.error = make_validation_error(e);
        outcome.run_id = local_run_id();
        return outcome;
    }
    outcome.phase = RunPhase::VALIDATED;
    return execute(config, inputs, std::move(outcome), started);
}

RunOutcome RunOrchestrator::execute(const WorkflowConfig& config, const Value& inputs, RunOutcome outcome,
                                    std::chrono::steady_clock::time_point started) {
    if (auto level = parse_log_level(config.config.observability.log_level)) {
        set_log_level(*level);
    }

    auto finish_failed = [&](RunError error) {
        outcome.status = RunStatus::FAILED;
        outcome.error = std::move(error);
        outcome.metrics.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        if (outcome.run_id.empty()) outcome.run_id = local_run_id();
        return outcome;
    };

    // State initialization + compilation: still no model call on failure.
    std::optional<StateRecord> initial;
    std::optional<ExecutionPlan> plan;
    try {
        auto state_type = StateRecordType::build(config.state);
        initial.emplace(StateRecord::create(state_type, inputs));
        outcome.phase = RunPhase::STATE_INITIALIZED;
        outcome.state = initial->to_json();
        plan.emplace(GraphCompiler(&tools_).compile(config, state_type));
    } catch (const AgentFlowError& e) {
        log_error("run setup failed: " + std::string(e.what()));
        return finish_failed(make_error(e));
    } catch (const std::exception& e) {
        log_error("run setup failed: " + std::string(e.what()));
        return finish_failed(RunError{"StateInitializationError", e.what(), std::nullopt, Value::object()});
    }

    if (collaborators_.repository) {
        RunRecord record{config.flow.name, config.flow.version, inputs, std::chrono::system_clock::now()};
        best_effort("run repository create", [&] {
            outcome.run_id = collaborators_.repository->create(record);
        });
    }
    if (outcome.run_id.empty()) outcome.run_id = local_run_id();

    outcome.phase = RunPhase::RUNNING;
    log_info("run " + outcome.run_id + " started: workflow '" + config.flow.name + "'");

    ExecutionBudget budget(plan->execution());
    NodeExecutor executor(llm_, tools_, costs_);
    RunContext ctx(*plan, budget, executor, outcome.run_id);
    Scope root{*initial};

    try {
        drive(ctx, root, START_NODE, END_NODE);
        outcome.status = RunStatus::COMPLETED;
    } catch (const RunAbort& abort) {
        outcome.status = RunStatus::FAILED;
        std::lock_guard<std::mutex> lock(ctx.fatal_mutex);
        outcome.error = ctx.first_fatal ? *ctx.first_fatal : abort.error();
    } catch (const std::exception& e) {
        outcome.status = RunStatus::FAILED;
        outcome.error = RunError{"NodeExecutionError", e.what(), std::nullopt, Value::object()};
    }

    outcome.state = root.state.to_json();
    for (const auto& result : root.results) outcome.metrics.add(result.metrics);
    // 失败的节点也算一次执行
    outcome.metrics.node_executions = budget.nodes_used.load();
    outcome.node_results = std::move(root.results);
    outcome.node_errors = std::move(root.node_errors);
    outcome.loops = std::move(root.loops);
    outcome.metrics.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (outcome.succeeded() && !plan->gates().gates.empty()) {
        outcome.gate_results = check_gates(plan->gates().gates, outcome.metrics.to_json());
        auto decision = apply_gate_action(plan->gates().on_fail, outcome.gate_results,
                                          "workflow '" + config.flow.name + "'");
        outcome.deploy_blocked = decision.block_deploy;
        if (decision.fail_run) {
            outcome.status = RunStatus::FAILED;
            outcome.error = make_error(QualityGateError(decision.summary));
        }
    }

    outcome.phase = outcome.succeeded() ? RunPhase::COMPLETED : RunPhase::FAILED;
    if (outcome.succeeded()) {
        log_info("run " + outcome.run_id + " completed in " + std::to_string(outcome.metrics.duration_ms) + "ms");
    } else {
        log_error("run " + outcome.run_id + " failed: " + outcome.error->message);
    }

    if (collaborators_.repository) {
        best_effort("run repository update", [&] {
            collaborators_.repository->update(outcome.run_id, outcome);
        });
    }
    if (collaborators_.tracker) {
        best_effort("observability record_run_end", [&] {
            collaborators_.tracker->record_run_end(outcome.run_id, outcome);
        });
    }
    return outcome;
}

NodeId RunOrchestrator::drive(RunContext& ctx, Scope& scope, NodeId current, const NodeId& stop_at) {
    while (current != END_NODE && current != stop_at) {
        if (current != START_NODE) {
            execute_node(ctx, scope, current);
        }

        const EdgeDescriptor& edge = ctx.plan.edge_from(current);
        switch (edge.kind) {
            case EdgeKind::LINEAR:
                current = edge.target;
                break;
            case EdgeKind::CONDITIONAL:
                current = select_route(ctx, edge, scope);
                break;
            case EdgeKind::LOOP:
                current = route_loop(edge, scope);
                break;
            case EdgeKind::FORK_JOIN:
                run_fork(ctx, scope, edge);
                current = edge.join;
                break;
        }
    }
    return current;
}

void RunOrchestrator::execute_node(RunContext& ctx, Scope& scope, const NodeId& node_id) {
    try {
        ctx.budget.check("node '" + node_id + "'");
    } catch (const AgentFlowError& e) {
        ctx.abort(make_error(e, node_id));
    }
    if (!ctx.budget.try_consume_node()) {
        ctx.abort(make_error(ControlFlowError(
            "node execution limit (" + std::to_string(ctx.budget.max_node_executions) +
            ") reached at '" + node_id + "'"), node_id));
    }

    if (collaborators_.tracker) {
        best_effort("observability record_node_start", [&] {
            collaborators_.tracker->record_node_start(ctx.run_id, node_id);
        });
    }
    log_debug("executing node '" + node_id + "'");

    auto record_end = [&](const NodeMetrics& metrics, const std::string& status) {
        if (!collaborators_.tracker) return;
        best_effort("observability record_node_end", [&] {
            collaborators_.tracker->record_node_end(ctx.run_id, node_id, metrics, status);
        });
    };

    std::optional<RunError> failure;
    bool interrupted = false;
    try {
        NodeResult result = ctx.executor.execute(ctx.plan.node(node_id), scope.state, ctx.budget);
        scope.state.apply(result.delta);
        merge_pending(scope.pending, result.delta, scope.state.type());
        record_end(result.metrics, "success");
        scope.results.push_back(std::move(result));
        return;
    } catch (const TimeoutError& e) {
        failure = make_error(e, node_id);
        interrupted = true;
    } catch (const RunCancelledError& e) {
        failure = make_error(e, node_id);
        interrupted = true;
    } catch (const AgentFlowError& e) {
        failure = make_error(e, node_id);
    } catch (const std::invalid_argument& e) {
        // delta rejected by the state record
        failure = make_error(NodeExecutionError(node_id, e.what()), node_id);
    }

    record_end(NodeMetrics{}, interrupted ? "cancelled" : "failed");

    const EdgeDescriptor& edge = ctx.plan.edge_from(node_id);
    if (!interrupted && edge.on_error == EdgeErrorPolicy::CONTINUE) {
        log_warning("node '" + node_id + "' failed, continuing: " + failure->message);
        scope.node_errors.push_back(std::move(*failure));
        return;
    }
    log_error("node '" + node_id + "' failed: " + failure->message);
    ctx.abort(std::move(*failure));
}

NodeId RunOrchestrator::select_route(RunContext& ctx, const EdgeDescriptor& edge, const Scope& scope) {
    Value data = {{"state", scope.state.to_json()}};
    const RouteDescriptor* fallback = nullptr;

    for (const auto& route : edge.routes) {
        if (route.is_default()) {
            if (!fallback) fallback = &route;
            continue;
        }
        try {
            if (ctx.evaluator.evaluate(route.condition, data)) {
                log_debug("route '" + route.condition + "' taken: " + edge.from + " -> " + route.target);
                return route.target;
            }
        } catch (const ControlFlowError& e) {
            log_warning("route condition '" + route.condition + "' at '" + edge.from +
                        "' could not be evaluated, treated as false: " + e.what());
        }
    }

    if (fallback) {
        log_debug("default route taken: " + edge.from + " -> " + fallback->target);
        return fallback->target;
    }
    ctx.abort(make_error(ControlFlowError("no route matched after '" + edge.from + "' and no default route"),
                         edge.from));
}

NodeId RunOrchestrator::route_loop(const EdgeDescriptor& edge, Scope& scope) {
    int& count = scope.loop_counters[edge.from];
    ++count;

    const Value& flag = scope.state.get(edge.condition_field);
    bool done = flag.is_boolean() && flag.get<bool>();
    bool cap_hit = !done && count >= edge.max_iterations;
    if (!done && !cap_hit) {
        return edge.from;
    }

    if (cap_hit) {
        log_info("loop '" + edge.from + "' reached max_iterations (" + std::to_string(edge.max_iterations) +
                 "), exiting to '" + edge.exit_to + "'");
    }
    scope.loops.push_back(LoopReport{edge.from, count, cap_hit});
    scope.loop_counters.erase(edge.from);
    return edge.exit_to;
}

void RunOrchestrator::run_fork(RunContext& ctx, Scope& scope, const EdgeDescriptor& edge) {
    log_debug("fork at '" + edge.from + "': " + std::to_string(edge.branches.size()) +
              " branches, join '" + edge.join + "'");

    std::vector<Scope> branches;
    branches.reserve(edge.branches.size());
    for (size_t i = 0; i < edge.branches.size(); ++i) {
        Scope branch{scope.state};
        branch.loop_counters = scope.loop_counters;
        branches.push_back(std::move(branch));
    }

    std::vector<std::future<void>> tasks;
    tasks.reserve(branches.size());
    for (size_t i = 0; i < branches.size(); ++i) {
        tasks.push_back(std::async(std::launch::async, [this, &ctx, &branches, &edge, i] {
            drive(ctx, branches[i], edge.branches[i], edge.join);
        }));
    }

    // 所有分支都必须结束后才能继续
    bool failed = false;
    for (size_t i = 0; i < tasks.size(); ++i) {
        try {
            tasks[i].get();
        } catch (const RunAbort&) {
            failed = true;
        } catch (const std::exception& e) {
            failed = true;
            std::lock_guard<std::mutex> lock(ctx.fatal_mutex);
            if (!ctx.first_fatal) {
                ctx.first_fatal = RunError{"NodeExecutionError", e.what(), edge.branches[i], Value::object()};
            }
            ctx.budget.halt();
        }
    }

    // Metrics and errors are kept even when a branch failed.
    for (auto& branch : branches) {
        for (auto& result : branch.results) scope.results.push_back(std::move(result));
        for (auto& error : branch.node_errors) scope.node_errors.push_back(std::move(error));
        for (auto& loop : branch.loops) scope.loops.push_back(loop);
    }

    if (failed) {
        std::lock_guard<std::mutex> lock(ctx.fatal_mutex);
        throw RunAbort(*ctx.first_fatal);
    }

    // Deterministic merge in declaration order: lists concatenate, scalars
    // written by several branches resolve to the later-declared branch.
    const StateRecordType& type = scope.state.type();
    std::map<std::string, std::vector<NodeId>> scalar_writers;
    for (size_t i = 0; i < branches.size(); ++i) {
        const Value& delta = branches[i].pending;
        for (auto it = delta.begin(); it != delta.end(); ++it) {
            if (type.slot(it.key()).policy == MergePolicy::LAST_WRITE_WINS) {
                scalar_writers[it.key()].push_back(edge.branches[i]);
            }
        }
        try {
            scope.state.apply(delta);
        } catch (const std::invalid_argument& e) {
            ctx.abort(make_error(NodeExecutionError(edge.branches[i], e.what()), edge.branches[i]));
        }
        merge_pending(scope.pending, delta, type);
    }

    for (const auto& [field, writers] : scalar_writers) {
        if (writers.size() < 2) continue;
        std::string names;
        for (const auto& w : writers) names += (names.empty() ? "'" : ", '") + w + "'";
        log_warning("field '" + field + "' written by parallel branches " + names +
                    " before join '" + edge.join + "'; keeping the value from '" + writers.back() + "'");
    }
}

void RunOrchestrator::merge_pending(Value& pending, const Value& delta, const StateRecordType& type) {
    for (auto it = delta.begin(); it != delta.end(); ++it) {
        const FieldSlot& slot = type.slot(it.key());
        if (slot.policy != MergePolicy::ARRAY_CONCAT) {
            pending[it.key()] = it.value();
            continue;
        }
        if (it.value().is_null()) continue;
        Value& list = pending[it.key()];
        if (!list.is_array()) list = Value::array();
        if (it.value().is_array()) {
            for (const auto& item : it.value()) list.push_back(item);
        } else {
            list.push_back(it.value());
        }
    }
}

} // namespace agentflow
