// core/engine.h
#ifndef AGENTFLOW_CORE_ENGINE_H
#define AGENTFLOW_CORE_ENGINE_H

#include "common/llm/cost_estimator.h"
#include "common/llm/llm_client.h"
#include "common/tools/registry.h"
#include "core/types/config.h"
#include "core/types/result.h"
#include "modules/storage/memory_run_repository.h"
#include "modules/trace/trace_exporter.h"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace agentflow {

// One loaded workflow document plus everything a run needs. The document is
// re-validated on every run, so tools registered later are taken into account.
class WorkflowEngine {
public:
    // Throw ConfigLoadError when the document cannot be read or parsed.
    static std::unique_ptr<WorkflowEngine> from_string(const std::string& text, std::unique_ptr<LlmClient> llm);
    static std::unique_ptr<WorkflowEngine> from_file(const std::string& file_path, std::unique_ptr<LlmClient> llm);

    WorkflowEngine(Value document, std::unique_ptr<LlmClient> llm);

    // Never throws for workflow, input or node problems: see RunOutcome::error.
    RunOutcome run(const Value& inputs = Value::object());

    // Throws ConfigValidationError.
    WorkflowConfig validate() const;
    // Validates and compiles without calling the model.
    Value describe() const;

    template <typename Func>
    void register_tool(std::string_view name, Func&& func) {
        tool_registry_.register_tool(std::string(name), std::forward<Func>(func));
    }

    template <typename Func>
    void register_tool(ToolSpec spec, Func&& func) {
        tool_registry_.register_tool(std::move(spec), std::forward<Func>(func));
    }

    void set_cost_estimator(CostEstimator costs) { costs_ = std::move(costs); }

    const ToolRegistry& tools() const { return tool_registry_; }
    const InMemoryRunRepository& runs() const { return repository_; }
    const TraceExporter& tracer() const { return tracer_; }
    std::vector<TraceRecord> get_last_traces() const { return last_traces_; }

private:
    Value document_;
    std::unique_ptr<LlmClient> llm_;
    ToolRegistry tool_registry_;          // ← 成员变量（非单例）
    CostEstimator costs_;
    InMemoryRunRepository repository_;
    TraceExporter tracer_;
    std::vector<TraceRecord> last_traces_;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_ENGINE_H
