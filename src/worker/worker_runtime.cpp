#include "worker_runtime.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

const char* to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::NotClaimed: return "not-claimed";
        case RunOutcome::Completed:  return "completed";
        case RunOutcome::Failed:     return "failed";
        case RunOutcome::Cancelled:  return "cancelled";
        case RunOutcome::Conflict:   return "conflict";
        case RunOutcome::Error:      return "error";
    }
    return "unknown";
}

// ── JobContext ──────────────────────────────────────────────

JobContext::JobContext(JobCoordinator& coordinator, JobRecord job, int64_t claim_version,
                       std::string worker_ref)
    : coordinator_(coordinator),
      job_(std::move(job)),
      claim_version_(claim_version),
      worker_ref_(std::move(worker_ref)),
      last_status_(job_.status),
      last_version_(job_.version) {
    if (last_status_ == JobStatus::Cancelled) cancel_observed_ = true;
}

void JobContext::refresh() {
    auto current = coordinator_.get(job_.id);
    if (current.is_err()) {
        coord_log(fmt::format("worker: {} could not poll job {}: {}",
                              worker_ref_, job_.id, current.error));
        return;
    }
    last_status_ = current.value.status;
    last_version_ = current.value.version;
    if (last_status_ == JobStatus::Cancelled) cancel_observed_ = true;
}

bool JobContext::cancel_requested() {
    refresh();
    return cancel_observed_;
}

bool JobContext::ownership_lost() {
    refresh();
    return last_version_ != claim_version_;
}

void JobContext::throw_if_cancelled() {
    if (cancel_requested()) throw JobCancelled(job_.id);
}

// ── FinalizationGuard ───────────────────────────────────────

FinalizationGuard::FinalizationGuard(JobCoordinator& coordinator, std::string job_id,
                                     int64_t version)
    : coordinator_(coordinator), job_id_(std::move(job_id)), version_(version) {}

FinalizationGuard::~FinalizationGuard() {
    if (finalized_) return;
    finalized_ = true;
    try {
        auto r = coordinator_.fail(job_id_, version_,
                                   nlohmann::json{{"message", UNFINALIZED_EXIT_REASON}}.dump());
        if (r.is_err()) {
            coord_log(fmt::format("worker: unfinalized job {} could not be failed: {}",
                                  job_id_, r.error));
        }
    } catch (const std::exception& e) {
        coord_log(fmt::format("worker: exception while failing unfinalized job {}: {}",
                              job_id_, e.what()));
    }
}

Result<int64_t> FinalizationGuard::already_finalized() const {
    return Result<int64_t>::Err(fmt::format("Job '{}' already finalized by this worker", job_id_),
                                ErrorCode::InvalidArgument);
}

Result<int64_t> FinalizationGuard::complete(const std::string& result) {
    if (finalized_) return already_finalized();
    finalized_ = true;
    return coordinator_.complete(job_id_, version_, result);
}

Result<int64_t> FinalizationGuard::fail(const std::string& error_info) {
    if (finalized_) return already_finalized();
    finalized_ = true;
    return coordinator_.fail(job_id_, version_, error_info);
}

void FinalizationGuard::acknowledge_cancel() {
    finalized_ = true;
}

// ── WorkerRuntime ───────────────────────────────────────────

WorkerRuntime::WorkerRuntime(JobCoordinator& coordinator, std::string worker_node,
                             FailurePolicy policy)
    : coordinator_(coordinator),
      worker_node_(worker_node.empty() ? platform::host_name() : std::move(worker_node)),
      policy_(policy) {}

std::string WorkerRuntime::next_worker_ref() {
    uint64_t seq = sequence_.fetch_add(1) + 1;
    return fmt::format("{}:{}-{}", worker_node_, platform::process_id(), seq);
}

RunReport WorkerRuntime::finish_with_failure(FinalizationGuard& guard, RunReport report,
                                             const std::string& message) {
    nlohmann::json info = {{"message", message}, {"worker", report.worker_ref}};
    auto failed = guard.fail(info.dump());
    if (failed.is_ok()) {
        report.outcome = RunOutcome::Failed;
        report.final_version = failed.value;
        report.detail = message;
    } else if (failed.is(ErrorCode::ConcurrencyConflict)) {
        report.outcome = RunOutcome::Conflict;
        report.detail = failed.error;
    } else {
        report.outcome = RunOutcome::Error;
        report.detail = failed.error;
    }
    return report;
}

RunReport WorkerRuntime::run(const std::string& job_id, const UnitOfWork& work) {
    RunReport report;
    report.job_id = job_id;
    report.worker_ref = next_worker_ref();

    auto claim = coordinator_.claim(job_id, report.worker_ref);
    if (claim.is_err()) {
        report.outcome = RunOutcome::Error;
        report.detail = claim.error;
        return report;
    }
    if (!claim.value.claimed) {
        report.outcome = RunOutcome::NotClaimed;
        return report;
    }

    FinalizationGuard guard(coordinator_, job_id, claim.value.version);
    report.final_version = claim.value.version;

    auto loaded = coordinator_.get(job_id);
    if (loaded.is_err()) {
        return finish_with_failure(guard, report, "claimed job could not be loaded: " + loaded.error);
    }
    JobContext ctx(coordinator_, std::move(loaded.value), claim.value.version, report.worker_ref);

    std::string result;
    try {
        result = work(ctx);
    } catch (const JobCancelled& e) {
        if (ctx.cancel_observed() || ctx.cancel_requested()) {
            guard.acknowledge_cancel();
            coord_log(fmt::format("worker: {} stopped job {} on cancel", report.worker_ref, job_id));
            report.outcome = RunOutcome::Cancelled;
            report.detail = e.what();
            return report;
        }
        report = finish_with_failure(guard, report, e.what());
        if (policy_ == FailurePolicy::Rethrow) throw;
        return report;
    } catch (const std::exception& e) {
        coord_log(fmt::format("worker: {} job {} threw: {}", report.worker_ref, job_id, e.what()));
        report = finish_with_failure(guard, report, e.what());
        if (policy_ == FailurePolicy::Rethrow) throw;
        return report;
    } catch (...) {
        coord_log(fmt::format("worker: {} job {} threw a non-standard exception",
                              report.worker_ref, job_id));
        report = finish_with_failure(guard, report, UNKNOWN_EXCEPTION_REASON);
        if (policy_ == FailurePolicy::Rethrow) throw;
        return report;
    }

    if (ctx.cancel_requested()) {
        guard.acknowledge_cancel();
        coord_log(fmt::format("worker: {} finished job {} after it was cancelled; result dropped",
                              report.worker_ref, job_id));
        report.outcome = RunOutcome::Cancelled;
        return report;
    }

    auto done = guard.complete(result);
    if (done.is_ok()) {
        report.outcome = RunOutcome::Completed;
        report.final_version = done.value;
    } else if (done.is(ErrorCode::ConcurrencyConflict)) {
        // A cancel honored mid-flight that the unit never polled for is not an anomaly.
        report.outcome = ctx.cancel_requested() ? RunOutcome::Cancelled : RunOutcome::Conflict;
        report.detail = done.error;
    } else {
        report.outcome = RunOutcome::Error;
        report.detail = done.error;
    }
    return report;
}
