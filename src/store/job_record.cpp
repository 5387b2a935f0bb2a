#include "job_record.hpp"
#include <core/utils.hpp>

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<JobStatus> parse_job_status(const std::string& raw) {
    std::string text = to_lower(raw);
    if (text == "pending")   return JobStatus::Pending;
    if (text == "running")   return JobStatus::Running;
    if (text == "completed") return JobStatus::Completed;
    if (text == "failed")    return JobStatus::Failed;
    if (text == "cancelled") return JobStatus::Cancelled;
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed ||
           status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

std::optional<std::chrono::milliseconds> JobRecord::execution_time() const {
    if (!started_at || !completed_at) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::milliseconds>(*completed_at - *started_at);
}

void JobMutation::apply_to(JobRecord& record) const {
    if (status) record.status = *status;
    if (worker_ref) record.worker_ref = *worker_ref;
    if (started_at) record.started_at = started_at;
    if (completed_at) record.completed_at = completed_at;
    if (result) record.result = result;
    if (error_info) record.error_info = error_info;
    if (cancel_reason) record.cancel_reason = cancel_reason;
}
