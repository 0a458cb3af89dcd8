// modules/quality/quality_gates.cpp
#include "modules/quality/quality_gates.h"
#include "common/utils/log.h"
#include <sstream>

namespace agentflow {

namespace {

std::string format_number(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

const Value* find_metric(const Value& metrics, const std::string& name) {
    for (const auto& key : {name, name + "_avg", "avg_" + name}) {
        auto it = metrics.find(key);
        if (it != metrics.end() && it->is_number()) return &*it;
    }
    return nullptr;
}

} // anonymous namespace

std::vector<GateResult> check_gates(const std::vector<QualityGate>& gates, const Value& metrics) {
    std::vector<GateResult> results;
    results.reserve(gates.size());

    for (const auto& gate : gates) {
        GateResult r;
        r.metric = gate.metric;
        r.min = gate.min;
        r.max = gate.max;

        const Value* value = find_metric(metrics, gate.metric);
        if (!value) {
            log_warning("gate metric not found in run metrics: " + gate.metric);
            r.passed = false;
            r.message = "metric '" + gate.metric + "' not found in execution metrics";
            results.push_back(std::move(r));
            continue;
        }

        double actual = value->get<double>();
        r.actual = actual;
        if (gate.max && actual > *gate.max) {
            r.passed = false;
            r.message = "value " + format_number(actual) + " exceeds maximum " + format_number(*gate.max);
        } else if (gate.min && actual < *gate.min) {
            r.passed = false;
            r.message = "value " + format_number(actual) + " below minimum " + format_number(*gate.min);
        } else {
            r.message = "passed";
        }
        results.push_back(std::move(r));
    }
    return results;
}

GateDecision apply_gate_action(GateAction action, const std::vector<GateResult>& results,
                               const std::string& context) {
    GateDecision decision;
    std::vector<const GateResult*> failed;
    for (const auto& r : results) {
        if (!r.passed) failed.push_back(&r);
    }
    if (failed.empty()) return decision;

    std::ostringstream summary;
    summary << "quality gates failed for " << context << ": " << failed.size() << " gate(s)";
    for (const auto* r : failed) {
        summary << "\n  - " << r->metric << ": " << r->message;
    }
    decision.summary = summary.str();

    switch (action) {
        case GateAction::WARN:
            log_warning(decision.summary + "\n(continuing, on_fail=warn)");
            break;
        case GateAction::FAIL:
            log_error(decision.summary);
            decision.fail_run = true;
            break;
        case GateAction::BLOCK_DEPLOY:
            log_warning(decision.summary + "\n(deployment blocked)");
            decision.block_deploy = true;
            break;
    }
    return decision;
}

} // namespace agentflow
