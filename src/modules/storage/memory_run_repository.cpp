// modules/storage/memory_run_repository.cpp
#include "modules/storage/memory_run_repository.h"
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace agentflow {

std::string InMemoryRunRepository::generate_id() {
    static std::atomic<uint64_t> counter{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};

    std::ostringstream oss;
    oss << "run-" << std::hex << std::setw(12) << std::setfill('0') << (rng() & 0xffffffffffffULL)
        << "-" << std::dec << ++counter;
    return oss.str();
}

std::string InMemoryRunRepository::create(const RunRecord& run) {
    StoredRun stored;
    stored.run_id = generate_id();
    stored.record = run;

    std::lock_guard<std::mutex> lock(mutex_);
    order_.push_back(stored.run_id);
    std::string id = stored.run_id;
    runs_.emplace(id, std::move(stored));
    return id;
}

void InMemoryRunRepository::update(const std::string& run_id, const RunOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        throw std::out_of_range("unknown run id: " + run_id);
    }
    it->second.status = to_string(outcome.status);
    it->second.outcome = outcome;
}

std::optional<StoredRun> InMemoryRunRepository::get(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> InMemoryRunRepository::list_runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

} // namespace agentflow
