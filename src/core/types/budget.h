#ifndef AGENTFLOW_TYPES_BUDGET_H
#define AGENTFLOW_TYPES_BUDGET_H

#include "config.h"
#include "errors.h"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace agentflow {

// 单次运行的执行预算：截止时间、调用计数与协作式取消标志。
// Shared by reference between the orchestrator and every branch task.
struct ExecutionBudget {
    int max_llm_calls = -1;           // -1 表示无限制
    int max_node_executions = -1;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    mutable std::atomic<int> llm_calls_used{0};
    mutable std::atomic<int> nodes_used{0};
    std::atomic<bool> halted{false};
    std::chrono::steady_clock::time_point start_time;

    ExecutionBudget() : start_time(std::chrono::steady_clock::now()) {}

    explicit ExecutionBudget(const ExecutionConfig& config)
        : max_llm_calls(config.max_llm_calls),
          max_node_executions(config.max_node_executions),
          start_time(std::chrono::steady_clock::now()) {
        if (config.timeout_sec > 0) {
            deadline = start_time + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(config.timeout_sec));
        }
    }

    // 禁止拷贝
    ExecutionBudget(const ExecutionBudget&) = delete;
    ExecutionBudget& operator=(const ExecutionBudget&) = delete;

    bool deadline_passed() const {
        return deadline && std::chrono::steady_clock::now() >= *deadline;
    }

    // True once the run should stop: deadline reached or a fatal error elsewhere.
    bool cancelled() const {
        return halted.load() || deadline_passed();
    }

    void halt() { halted.store(true); }

    // Cooperative checkpoint; throws when in-flight work must be abandoned.
    void check(const std::string& where) const {
        if (deadline_passed()) {
            throw TimeoutError("execution timeout exceeded at " + where);
        }
        if (halted.load()) {
            throw RunCancelledError("run cancelled at " + where);
        }
    }

    bool try_consume_node() {
        int current = nodes_used.load();
        do {
            if (max_node_executions >= 0 && current >= max_node_executions) return false;
        } while (!nodes_used.compare_exchange_weak(current, current + 1));
        return true;
    }

    bool try_consume_llm_call() {
        int current = llm_calls_used.load();
        do {
            if (max_llm_calls >= 0 && current >= max_llm_calls) return false;
        } while (!llm_calls_used.compare_exchange_weak(current, current + 1));
        return true;
    }

    long long elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
    }
};

} // namespace agentflow

#endif // AGENTFLOW_TYPES_BUDGET_H
