// modules/quality/quality_gates.h
#ifndef AGENTFLOW_MODULES_QUALITY_QUALITY_GATES_H
#define AGENTFLOW_MODULES_QUALITY_QUALITY_GATES_H

#include "core/types/config.h"
#include "core/types/context.h"
#include "core/types/result.h"
#include <string>
#include <vector>

namespace agentflow {

// Checks each gate against a flat metrics document (RunMetrics::to_json()).
// A metric is looked up as "<m>", "<m>_avg", then "avg_<m>"; a missing one fails its gate.
std::vector<GateResult> check_gates(const std::vector<QualityGate>& gates, const Value& metrics);

struct GateDecision {
    bool fail_run = false;
    bool block_deploy = false;
    std::string summary;   // empty when every gate passed
};

// Logs failed gates and maps them onto the configured action.
GateDecision apply_gate_action(GateAction action, const std::vector<GateResult>& results,
                               const std::string& context);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_QUALITY_QUALITY_GATES_H
