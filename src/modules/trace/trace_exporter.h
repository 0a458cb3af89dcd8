// modules/trace/trace_exporter.h
#ifndef AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/context.h"
#include "core/types/result.h"
#include "modules/scheduler/run_collaborators.h"
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentflow {

struct TraceRecord {
    std::string trace_id;            // run id
    NodeId node_id;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status;              // "running", "success", "failed", "cancelled"
    nlohmann::json metrics = nlohmann::json::object();
};

struct RunTrace {
    std::string trace_id;
    std::string status;
    nlohmann::json metrics = nlohmann::json::object();
    nlohmann::json error;
};

// In-process ObservabilityTracker: keeps per-node records for export.
class TraceExporter : public ObservabilityTracker {
public:
    void record_node_start(const std::string& run_id, const NodeId& node_id) override;
    void record_node_end(const std::string& run_id, const NodeId& node_id,
                         const NodeMetrics& metrics, const std::string& status) override;
    void record_run_end(const std::string& run_id, const RunOutcome& outcome) override;

    std::vector<TraceRecord> get_traces() const;
    std::vector<TraceRecord> get_traces(const std::string& run_id) const;
    std::vector<RunTrace> get_runs() const;
    void clear_traces();

    nlohmann::json export_json() const;

private:
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;
    std::vector<RunTrace> runs_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H
