// core/engine.cpp
#include "core/engine.h"
#include "common/utils/log.h"
#include "core/types/errors.h"
#include "modules/graph/graph_compiler.h"
#include "modules/parser/config_parser.h"
#include "modules/scheduler/run_orchestrator.h"
#include "modules/state/state_record.h"
#include "modules/validator/config_validator.h"
#include <stdexcept>

namespace agentflow {

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_string(const std::string& text,
                                                            std::unique_ptr<LlmClient> llm) {
    return std::make_unique<WorkflowEngine>(ConfigParser::parse_text(text), std::move(llm));
}

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_file(const std::string& file_path,
                                                          std::unique_ptr<LlmClient> llm) {
    return std::make_unique<WorkflowEngine>(ConfigParser::parse_file(file_path), std::move(llm));
}

WorkflowEngine::WorkflowEngine(Value document, std::unique_ptr<LlmClient> llm)
    : document_(std::move(document)), llm_(std::move(llm)) {
    if (!llm_) {
        throw std::invalid_argument("WorkflowEngine requires an LlmClient");
    }
}

RunOutcome WorkflowEngine::run(const Value& inputs) {
    RunOrchestrator orchestrator(*llm_, tool_registry_, {&repository_, &tracer_});
    orchestrator.set_cost_estimator(costs_);
    RunOutcome outcome = orchestrator.run(document_, inputs);
    last_traces_ = tracer_.get_traces(outcome.run_id);
    return outcome;
}

WorkflowConfig WorkflowEngine::validate() const {
    return ConfigValidator(&tool_registry_).validate(document_);
}

Value WorkflowEngine::describe() const {
    WorkflowConfig config = validate();
    auto plan = GraphCompiler(&tool_registry_).compile(config, StateRecordType::build(config.state));
    return plan.describe();
}

} // namespace agentflow
