#include "job_store.hpp"
#include "memory_job_store.hpp"
#include "sqlite_job_store.hpp"
#include <fmt/format.h>

StatusCounts empty_status_counts() {
    return {{JobStatus::Pending, 0}, {JobStatus::Running, 0}, {JobStatus::Completed, 0},
            {JobStatus::Failed, 0}, {JobStatus::Cancelled, 0}};
}

Result<void> validate_new_record(const JobRecord& record) {
    if (record.id.empty()) {
        return Result<void>::Err("Job id must not be empty", ErrorCode::InvalidArgument);
    }
    if (record.status != JobStatus::Pending) {
        return Result<void>::Err(
            fmt::format("Job '{}' must be created pending, got {}", record.id, to_string(record.status)),
            ErrorCode::InvalidArgument);
    }
    if (record.version != INITIAL_JOB_VERSION) {
        return Result<void>::Err(
            fmt::format("Job '{}' must be created at version {}, got {}",
                        record.id, INITIAL_JOB_VERSION, record.version),
            ErrorCode::InvalidArgument);
    }
    if (record.started_at || record.completed_at || record.result ||
        record.error_info || record.cancel_reason) {
        return Result<void>::Err(
            fmt::format("Job '{}' carries lifecycle fields at creation", record.id),
            ErrorCode::InvalidArgument);
    }
    return Result<void>::Ok();
}

Result<std::shared_ptr<JobStore>> open_job_store(const StoreConfig& config) {
    using R = Result<std::shared_ptr<JobStore>>;

    if (config.backend == StoreBackend::Memory) {
        return R::Ok(std::make_shared<MemoryJobStore>());
    }

    auto opened = SqliteJobStore::open(config.path, config.busy_timeout_ms);
    if (opened.is_err()) return forward_error<std::shared_ptr<JobStore>>(opened);
    return R::Ok(std::shared_ptr<JobStore>(std::move(opened.value)));
}
