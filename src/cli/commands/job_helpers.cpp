#include "job_helpers.hpp"
#include "../theme.hpp"
#include <core/time_utils.hpp>
#include <iostream>
#include <fmt/format.h>

std::string status_label(JobStatus status, int width) {
    // Pad before colouring so escape codes do not break table columns
    std::string s = fmt::format("{:<{}}", to_string(status), width);
    switch (status) {
        case JobStatus::Pending:   return theme::dim(s);
        case JobStatus::Running:   return theme::blue(s);
        case JobStatus::Completed: return theme::green(s);
        case JobStatus::Failed:    return theme::red(s);
        case JobStatus::Cancelled: return theme::yellow(s);
    }
    return s;
}

void print_job_detail(const JobRecord& job, TimePoint now) {
    std::cout << theme::section(job.id);
    std::cout << theme::kv("status", status_label(job.status));
    std::cout << theme::kv("version", std::to_string(job.version));
    std::cout << theme::kv("model", job.model_type);
    if (!job.parameters.empty()) std::cout << theme::kv("parameters", job.parameters);
    if (!job.worker_ref.empty()) std::cout << theme::kv("worker", job.worker_ref);
    std::cout << theme::kv("created", to_iso(job.created_at));
    std::cout << theme::kv("updated", to_iso(job.updated_at));
    std::cout << theme::kv("started", to_iso(job.started_at));
    std::cout << theme::kv("completed", to_iso(job.completed_at));
    if (job.started_at) {
        std::cout << theme::kv("elapsed", format_elapsed(job.started_at, job.completed_at, now));
    }
    if (job.result) std::cout << theme::kv("result", *job.result);
    if (job.error_info) std::cout << theme::kv("error", *job.error_info);
    if (job.cancel_reason) std::cout << theme::kv("reason", *job.cancel_reason);
    std::cout << "\n";
}

void print_job_table(const std::vector<JobRecord>& jobs, TimePoint now) {
    std::cout << "\n";
    std::cout << theme::color::DIM
              << fmt::format("  {:<44} {:<10} {:<4} {:<10} {}", "JOB ID", "STATUS", "VER",
                             "ELAPSED", "WORKER")
              << theme::color::RESET << "\n";

    for (const auto& job : jobs) {
        std::cout << fmt::format("  {:<44} ", job.id)
                  << status_label(job.status, 10)
                  << fmt::format(" {:<4} {:<10} {}\n", job.version,
                                 format_elapsed(job.started_at, job.completed_at, now),
                                 job.worker_ref.empty() ? "-" : job.worker_ref);
    }
    std::cout << "\n";
}

std::string join_args(const std::vector<std::string>& args, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i) {
        if (!out.empty()) out += " ";
        out += args[i];
    }
    return out;
}
