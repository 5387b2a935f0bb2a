#include "coordinator.hpp"
#include "job_state_machine.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

CoordinatorHooks chain_hooks(CoordinatorHooks first, CoordinatorHooks second) {
    CoordinatorHooks out;
    if (first.on_claim_lost || second.on_claim_lost) {
        out.on_claim_lost = [a = first.on_claim_lost, b = second.on_claim_lost]
                            (const std::string& id, const std::string& ref) {
            if (a) a(id, ref);
            if (b) b(id, ref);
        };
    }
    if (first.on_conflict || second.on_conflict) {
        out.on_conflict = [a = first.on_conflict, b = second.on_conflict]
                          (const ConflictEvent& e) {
            if (a) a(e);
            if (b) b(e);
        };
    }
    if (first.on_transition || second.on_transition) {
        out.on_transition = [a = first.on_transition, b = second.on_transition]
                            (const std::string& id, JobStatus from, JobStatus to, int64_t v) {
            if (a) a(id, from, to, v);
            if (b) b(id, from, to, v);
        };
    }
    return out;
}

JobCoordinator::JobCoordinator(std::shared_ptr<JobStore> store,
                               CoordinatorHooks hooks,
                               NowFn now)
    : store_(std::move(store)), hooks_(std::move(hooks)), now_(std::move(now)) {}

// ── Core primitive ──────────────────────────────────────────

Result<JobCoordinator::TransitionOutcome> JobCoordinator::transition(
        const std::string& id,
        std::optional<int64_t> expected_version,
        std::initializer_list<JobStatus> from,
        JobStatus to,
        const JobMutation& mutation) {
    using R = Result<TransitionOutcome>;

    auto loaded = store_->load(id);
    if (loaded.is_err()) return forward_error<TransitionOutcome>(loaded);
    const JobRecord& row = loaded.value;

    int64_t expected = expected_version.value_or(row.version);

    // Caller's view is already stale: report the miss without a write.
    if (row.version != expected) {
        return R::Ok(TransitionOutcome{false, row.version, row.status});
    }

    bool in_from_set = std::find(from.begin(), from.end(), row.status) != from.end();
    if (!in_from_set) {
        return R::Err(fmt::format("Job '{}': {} -> {} is not allowed here",
                                  id, to_string(row.status), to_string(to)),
                      ErrorCode::InvalidTransition);
    }
    auto valid = JobStateMachine::validate_transition(row.status, to);
    if (valid.is_err()) {
        return R::Err(fmt::format("Job '{}': {}", id, valid.error), valid.code);
    }

    auto cas = store_->conditional_update(id, expected, mutation, now_());
    if (cas.is_err()) return forward_error<TransitionOutcome>(cas);
    if (!cas.value.applied) {
        return R::Ok(TransitionOutcome{false, cas.value.new_version, row.status});
    }

    if (hooks_.on_transition) hooks_.on_transition(id, row.status, to, cas.value.new_version);
    return R::Ok(TransitionOutcome{true, cas.value.new_version, row.status});
}

Result<int64_t> JobCoordinator::finalize(const char* operation,
                                         const std::string& id,
                                         int64_t expected_version,
                                         std::initializer_list<JobStatus> from,
                                         JobStatus to,
                                         const JobMutation& mutation) {
    auto outcome = transition(id, expected_version, from, to, mutation);
    if (outcome.is_err()) {
        coord_log(fmt::format("{}: job {} rejected ({}): {}",
                              operation, id, to_string(outcome.code), outcome.error));
        return forward_error<int64_t>(outcome);
    }

    if (!outcome.value.applied) {
        ConflictEvent event{operation, id, expected_version, outcome.value.version};
        coord_alert(fmt::format(
            "{}: job {} version conflict (held v{}, row at v{}); ownership was lost",
            operation, id, expected_version, outcome.value.version));
        append_job_log(id, fmt::format("{} rejected: version conflict (held v{}, row at v{})",
                                       operation, expected_version, outcome.value.version));
        if (hooks_.on_conflict) hooks_.on_conflict(event);
        return Result<int64_t>::Err(
            fmt::format("Job '{}' was modified concurrently (expected v{}, found v{})",
                        id, expected_version, outcome.value.version),
            ErrorCode::ConcurrencyConflict);
    }

    coord_log(fmt::format("{}: job {} -> {} at v{}", operation, id, to_string(to),
                          outcome.value.version));
    append_job_log(id, fmt::format("{} -> {} (v{})", to_string(outcome.value.from),
                                   to_string(to), outcome.value.version));
    return Result<int64_t>::Ok(outcome.value.version);
}

// ── Public operations ───────────────────────────────────────

Result<ClaimOutcome> JobCoordinator::claim(const std::string& id, const std::string& worker_ref) {
    using R = Result<ClaimOutcome>;

    if (worker_ref.empty()) {
        return R::Err("Claim requires a worker reference", ErrorCode::InvalidArgument);
    }

    JobMutation m;
    m.status = JobStatus::Running;
    m.worker_ref = worker_ref;
    m.started_at = now_();

    auto outcome = transition(id, std::nullopt, {JobStatus::Pending}, JobStatus::Running, m);

    // Already running or finished: someone else owns (or owned) it.
    bool not_claimable = outcome.is(ErrorCode::InvalidTransition);
    if (outcome.is_err() && !not_claimable) return forward_error<ClaimOutcome>(outcome);

    if (not_claimable || !outcome.value.applied) {
        coord_log(fmt::format("claim: {} lost job {}", worker_ref, id));
        if (hooks_.on_claim_lost) hooks_.on_claim_lost(id, worker_ref);
        return R::Ok(ClaimOutcome{false, 0, worker_ref});
    }

    coord_log(fmt::format("claim: {} owns job {} at v{}", worker_ref, id, outcome.value.version));
    append_job_log(id, fmt::format("Claimed by {} (v{})", worker_ref, outcome.value.version));
    return R::Ok(ClaimOutcome{true, outcome.value.version, worker_ref});
}

Result<int64_t> JobCoordinator::complete(const std::string& id, int64_t expected_version,
                                         const std::string& result) {
    JobMutation m;
    m.status = JobStatus::Completed;
    m.result = result;
    m.completed_at = now_();
    return finalize("complete", id, expected_version, {JobStatus::Running},
                    JobStatus::Completed, m);
}

Result<int64_t> JobCoordinator::fail(const std::string& id, int64_t expected_version,
                                     const std::string& error_info) {
    JobMutation m;
    m.status = JobStatus::Failed;
    m.error_info = error_info;
    m.completed_at = now_();
    return finalize("fail", id, expected_version, {JobStatus::Running},
                    JobStatus::Failed, m);
}

Result<int64_t> JobCoordinator::cancel(const std::string& id, int64_t expected_version,
                                       const std::string& reason) {
    JobMutation m;
    m.status = JobStatus::Cancelled;
    m.cancel_reason = reason;
    m.completed_at = now_();
    return finalize("cancel", id, expected_version, {JobStatus::Pending, JobStatus::Running},
                    JobStatus::Cancelled, m);
}

Result<JobRecord> JobCoordinator::get(const std::string& id) {
    return store_->load(id);
}
