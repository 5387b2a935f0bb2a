#pragma once

#include <map>
#include <mutex>
#include "job_store.hpp"

// In-process store for single-process deployments and tests.
// The version check and the write happen under one mutex, which is the
// in-memory equivalent of UPDATE ... WHERE version = ?.
class MemoryJobStore : public JobStore {
public:
    MemoryJobStore() = default;

    MemoryJobStore(const MemoryJobStore&) = delete;
    MemoryJobStore& operator=(const MemoryJobStore&) = delete;

    Result<JobRecord> load(const std::string& id) override;
    Result<CasOutcome> conditional_update(const std::string& id,
                                          int64_t expected_version,
                                          const JobMutation& mutation,
                                          TimePoint now) override;
    Result<void> insert(const JobRecord& record) override;
    Result<std::vector<JobRecord>> find_by_status(JobStatus status,
                                                  std::size_t limit = DEFAULT_LIST_LIMIT) override;
    Result<StatusCounts> count_by_status() override;
    Result<std::vector<JobRecord>> find_stale_running(TimePoint started_before) override;
    Result<void> ping() override { return Result<void>::Ok(); }

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, JobRecord> rows_;
};
