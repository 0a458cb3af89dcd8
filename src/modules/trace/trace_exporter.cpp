// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>
#include <iterator>

namespace agentflow {

namespace {

long long to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // anonymous namespace

void TraceExporter::record_node_start(const std::string& run_id, const NodeId& node_id) {
    TraceRecord record;
    record.trace_id = run_id;
    record.node_id = node_id;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running";

    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(record));
}

void TraceExporter::record_node_end(const std::string& run_id, const NodeId& node_id,
                                    const NodeMetrics& metrics, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Latest still-running record of this node in this run
    auto it = std::find_if(traces_.rbegin(), traces_.rend(), [&](const TraceRecord& r) {
        return r.trace_id == run_id && r.node_id == node_id && r.status == "running";
    });
    if (it == traces_.rend()) {
        TraceRecord record;
        record.trace_id = run_id;
        record.node_id = node_id;
        record.start_time = std::chrono::system_clock::now();
        traces_.push_back(std::move(record));
        it = traces_.rbegin();
    }
    it->end_time = std::chrono::system_clock::now();
    it->status = status;
    it->metrics = metrics.to_json();
}

void TraceExporter::record_run_end(const std::string& run_id, const RunOutcome& outcome) {
    RunTrace run;
    run.trace_id = run_id;
    run.status = to_string(outcome.status);
    run.metrics = outcome.metrics.to_json();
    run.error = outcome.error ? outcome.error->to_json() : nlohmann::json(nullptr);

    std::lock_guard<std::mutex> lock(mutex_);
    runs_.push_back(std::move(run));
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

std::vector<TraceRecord> TraceExporter::get_traces(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TraceRecord> out;
    std::copy_if(traces_.begin(), traces_.end(), std::back_inserter(out),
                 [&](const TraceRecord& r) { return r.trace_id == run_id; });
    return out;
}

std::vector<RunTrace> TraceExporter::get_runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_;
}

void TraceExporter::clear_traces() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
    runs_.clear();
}

nlohmann::json TraceExporter::export_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out;
    out["runs"] = nlohmann::json::array();
    for (const auto& r : runs_) {
        out["runs"].push_back({{"trace_id", r.trace_id}, {"status", r.status},
                               {"metrics", r.metrics}, {"error", r.error}});
    }
    out["nodes"] = nlohmann::json::array();
    for (const auto& t : traces_) {
        out["nodes"].push_back({
            {"trace_id", t.trace_id},
            {"node_id", t.node_id},
            {"status", t.status},
            {"start_ms", to_epoch_ms(t.start_time)},
            {"end_ms", to_epoch_ms(t.end_time)},
            {"metrics", t.metrics}
        });
    }
    return out;
}

} // namespace agentflow
