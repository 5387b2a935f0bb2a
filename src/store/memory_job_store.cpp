#include "memory_job_store.hpp"
#include <fmt/format.h>
#include <algorithm>

Result<JobRecord> MemoryJobStore::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) {
        return Result<JobRecord>::Err(fmt::format("Job '{}' not found", id), ErrorCode::NotFound);
    }
    return Result<JobRecord>::Ok(it->second);
}

Result<CasOutcome> MemoryJobStore::conditional_update(const std::string& id,
                                                      int64_t expected_version,
                                                      const JobMutation& mutation,
                                                      TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) {
        return Result<CasOutcome>::Err(fmt::format("Job '{}' not found", id), ErrorCode::NotFound);
    }

    JobRecord& row = it->second;
    if (row.version != expected_version) {
        return Result<CasOutcome>::Ok(CasOutcome{false, row.version});
    }

    mutation.apply_to(row);
    row.version = expected_version + 1;
    row.updated_at = now;
    return Result<CasOutcome>::Ok(CasOutcome{true, row.version});
}

Result<void> MemoryJobStore::insert(const JobRecord& record) {
    auto valid = validate_new_record(record);
    if (valid.is_err()) return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    if (rows_.count(record.id)) {
        return Result<void>::Err(fmt::format("Job '{}' already exists", record.id),
                                 ErrorCode::InvalidArgument);
    }
    JobRecord row = record;
    row.updated_at = record.created_at;
    rows_.emplace(row.id, std::move(row));
    return Result<void>::Ok();
}

Result<std::vector<JobRecord>> MemoryJobStore::find_by_status(JobStatus status, std::size_t limit) {
    std::vector<JobRecord> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, row] : rows_) {
            if (row.status == status) out.push_back(row);
        }
    }
    std::sort(out.begin(), out.end(), [](const JobRecord& a, const JobRecord& b) {
        return a.created_at < b.created_at;
    });
    if (out.size() > limit) out.resize(limit);
    return Result<std::vector<JobRecord>>::Ok(std::move(out));
}

Result<StatusCounts> MemoryJobStore::count_by_status() {
    StatusCounts counts = empty_status_counts();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, row] : rows_) counts[row.status]++;
    return Result<StatusCounts>::Ok(std::move(counts));
}

Result<std::vector<JobRecord>> MemoryJobStore::find_stale_running(TimePoint started_before) {
    std::vector<JobRecord> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, row] : rows_) {
        if (row.status == JobStatus::Running && row.started_at &&
            *row.started_at < started_before) {
            out.push_back(row);
        }
    }
    return Result<std::vector<JobRecord>>::Ok(std::move(out));
}

std::size_t MemoryJobStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}
