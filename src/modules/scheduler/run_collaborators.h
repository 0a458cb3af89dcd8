// modules/scheduler/run_collaborators.h
#ifndef AGENTFLOW_MODULES_SCHEDULER_RUN_COLLABORATORS_H
#define AGENTFLOW_MODULES_SCHEDULER_RUN_COLLABORATORS_H

#include "core/types/context.h"
#include "core/types/result.h"
#include <chrono>
#include <string>

namespace agentflow {

struct RunRecord {
    std::string workflow_name;
    std::string workflow_version;
    Value inputs = Value::object();
    std::chrono::system_clock::time_point started_at;
};

// Persistence of run history. Calls are best-effort: the orchestrator logs
// and swallows any std::exception they throw.
class RunRepository {
public:
    virtual ~RunRepository() = default;
    virtual std::string create(const RunRecord& run) = 0;
    virtual void update(const std::string& run_id, const RunOutcome& outcome) = 0;
};

// Same best-effort contract. May be called from several branch threads at once.
class ObservabilityTracker {
public:
    virtual ~ObservabilityTracker() = default;
    virtual void record_node_start(const std::string& run_id, const NodeId& node_id) = 0;
    virtual void record_node_end(const std::string& run_id, const NodeId& node_id,
                                 const NodeMetrics& metrics, const std::string& status) = 0;
    virtual void record_run_end(const std::string& run_id, const RunOutcome& outcome) = 0;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEDULER_RUN_COLLABORATORS_H
