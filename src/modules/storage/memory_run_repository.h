// modules/storage/memory_run_repository.h
#ifndef AGENTFLOW_MODULES_STORAGE_MEMORY_RUN_REPOSITORY_H
#define AGENTFLOW_MODULES_STORAGE_MEMORY_RUN_REPOSITORY_H

#include "modules/scheduler/run_collaborators.h"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

struct StoredRun {
    std::string run_id;
    RunRecord record;
    std::string status = "running";   // "running" | "completed" | "failed"
    std::optional<RunOutcome> outcome;
};

// Process-local run history, thread-safe.
class InMemoryRunRepository : public RunRepository {
public:
    std::string create(const RunRecord& run) override;
    // Throws std::out_of_range for unknown ids.
    void update(const std::string& run_id, const RunOutcome& outcome) override;

    std::optional<StoredRun> get(const std::string& run_id) const;
    std::vector<std::string> list_runs() const;

private:
    static std::string generate_id();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoredRun> runs_;
    std::vector<std::string> order_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_STORAGE_MEMORY_RUN_REPOSITORY_H
