#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <cstddef>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "job_record.hpp"

// Row count per status. Every status is present, zero when no rows match.
using StatusCounts = std::map<JobStatus, std::size_t>;

// Durable table of job rows with a per-row version counter.
//
// Every implementation must be safe for unlimited concurrent callers.
// conditional_update is the only synchronization primitive the rest of the
// system relies on: it must check the version and write the mutation as one
// atomic step, never as a read followed by a write.
class JobStore {
public:
    virtual ~JobStore() = default;

    // Point read, no locking. Fails with ErrorCode::NotFound if absent.
    virtual Result<JobRecord> load(const std::string& id) = 0;

    // Apply `mutation` iff the persisted version equals expected_version, and
    // in the same step set version = expected_version + 1 and touch updated_at.
    // A version mismatch returns Ok with applied == false; nothing is written.
    // A missing id is ErrorCode::NotFound.
    virtual Result<CasOutcome> conditional_update(const std::string& id,
                                                  int64_t expected_version,
                                                  const JobMutation& mutation,
                                                  TimePoint now) = 0;

    // Submission path only: create a row. Must be pending at version 1.
    virtual Result<void> insert(const JobRecord& record) = 0;

    // Rows in the given status, oldest first.
    virtual Result<std::vector<JobRecord>> find_by_status(JobStatus status,
                                                          std::size_t limit = DEFAULT_LIST_LIMIT) = 0;

    virtual Result<StatusCounts> count_by_status() = 0;

    // Running rows whose started_at is strictly before the cutoff.
    virtual Result<std::vector<JobRecord>> find_stale_running(TimePoint started_before) = 0;

    // Health check: can the backing store answer a trivial query.
    virtual Result<void> ping() = 0;
};

// StatusCounts with every status at zero.
StatusCounts empty_status_counts();

// Shared insert precondition for all backends.
Result<void> validate_new_record(const JobRecord& record);

// Build the backend named by the config (sqlite file or in-process memory).
Result<std::shared_ptr<JobStore>> open_job_store(const StoreConfig& config);
