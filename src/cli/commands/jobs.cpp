#include "job_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <store/job_submission.hpp>
#include <iostream>
#include <fmt/format.h>

static int do_submit(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: submit <model> [parameters]");
        return 1;
    }
    if (!cli.require_store()) return 1;

    auto submitted = submit_job(*cli.store, args[0], join_args(args, 1));
    if (submitted.is_err()) {
        std::cout << theme::fail(submitted.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Submitted {}", theme::bold(submitted.value.id)));
    return 0;
}

static int do_status(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: status <job-id>");
        return 1;
    }
    if (!cli.require_store()) return 1;

    auto job = cli.coordinator->get(args[0]);
    if (job.is_err()) {
        std::cout << theme::fail(job.error);
        return job.is(ErrorCode::NotFound) ? 2 : 1;
    }
    print_job_detail(job.value, cli.coordinator->now());
    return 0;
}

static int do_list(BaseCLI& cli, const std::vector<std::string>& args) {
    std::vector<JobStatus> statuses;
    std::size_t limit = DEFAULT_LIST_LIMIT;

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--limit" && i + 1 < args.size()) {
            int n = safe_stoi(args[++i], 0);
            if (n <= 0) {
                std::cout << theme::fail("--limit must be a positive number");
                return 1;
            }
            limit = static_cast<std::size_t>(n);
        } else if (auto status = parse_job_status(args[i])) {
            statuses.push_back(*status);
        } else {
            std::cout << theme::fail("Unknown status: " + args[i]);
            std::cout << theme::step("One of: pending, running, completed, failed, cancelled");
            return 1;
        }
    }
    if (statuses.empty()) {
        statuses = {JobStatus::Pending, JobStatus::Running, JobStatus::Completed,
                    JobStatus::Failed, JobStatus::Cancelled};
    }

    if (!cli.require_store()) return 1;

    std::vector<JobRecord> rows;
    for (auto status : statuses) {
        auto found = cli.store->find_by_status(status, limit);
        if (found.is_err()) {
            std::cout << theme::fail(found.error);
            return 1;
        }
        rows.insert(rows.end(), found.value.begin(), found.value.end());
    }

    if (rows.empty()) {
        std::cout << theme::dim("  No jobs found.") << "\n";
        return 0;
    }
    print_job_table(rows, cli.coordinator->now());
    return 0;
}

static int do_cancel(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: cancel <job-id> [reason]");
        return 1;
    }
    if (!cli.require_store()) return 1;

    const std::string& id = args[0];
    std::string reason = args.size() > 1 ? join_args(args, 1) : "cancelled by operator";

    auto job = cli.coordinator->get(id);
    if (job.is_err()) {
        std::cout << theme::fail(job.error);
        return job.is(ErrorCode::NotFound) ? 2 : 1;
    }
    if (is_terminal(job.value.status)) {
        std::cout << theme::fail(fmt::format("Job {} is already {}", id, to_string(job.value.status)));
        return 1;
    }

    auto cancelled = cli.coordinator->cancel(id, job.value.version, reason);
    if (cancelled.is_err()) {
        std::cout << theme::fail(fmt::format("Failed to cancel: {}", cancelled.error));
        if (cancelled.is(ErrorCode::ConcurrencyConflict)) {
            std::cout << theme::step("The job changed while cancelling. Check 'status' and retry.");
        }
        return 1;
    }

    std::cout << theme::ok(fmt::format("Cancelled job {} (v{})", id, cancelled.value));
    if (job.value.status == JobStatus::Running) {
        std::cout << theme::info(fmt::format("Worker {} stops at its next cancellation check",
                                             job.value.worker_ref));
    }
    return 0;
}

void register_jobs_commands(BaseCLI& cli) {
    cli.add_command("submit", do_submit, "<model> [params]", "Queue a new pending job");
    cli.add_command("status", do_status, "<job-id>", "Show one job record");
    cli.add_command("list", do_list, "[status...] [--limit N]", "List jobs by status");
    cli.add_command("cancel", do_cancel, "<job-id> [reason]", "Cancel a pending or running job");
}
