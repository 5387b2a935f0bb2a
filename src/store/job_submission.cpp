#include "job_submission.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <cctype>

std::string generate_job_id(const std::string& model_type) {
    std::string slug;
    for (char c : model_type) {
        unsigned char u = static_cast<unsigned char>(c);
        slug += std::isalnum(u) ? static_cast<char>(std::tolower(u)) : '-';
    }
    if (slug.empty()) slug = "job";
    return fmt::format("{}__{}__{}", now_compact_stamp(), slug, random_hex(8));
}

Result<JobRecord> submit_job(JobStore& store,
                             const std::string& model_type,
                             const std::string& parameters,
                             TimePoint now) {
    if (model_type.empty()) {
        return Result<JobRecord>::Err("Model type must not be empty", ErrorCode::InvalidArgument);
    }

    JobRecord record;
    record.id = generate_job_id(model_type);
    record.status = JobStatus::Pending;
    record.version = INITIAL_JOB_VERSION;
    record.model_type = model_type;
    record.parameters = parameters;
    record.created_at = now;
    record.updated_at = now;

    auto inserted = store.insert(record);
    if (inserted.is_err()) return forward_error<JobRecord>(inserted);

    coord_log(fmt::format("submit: created {} ({})", record.id, model_type));
    append_job_log(record.id, fmt::format("Submitted ({})", model_type));
    return Result<JobRecord>::Ok(std::move(record));
}
