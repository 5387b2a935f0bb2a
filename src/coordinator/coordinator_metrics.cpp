#include "coordinator_metrics.hpp"
#include <fmt/format.h>

CoordinatorHooks CoordinatorMetrics::hooks() {
    CoordinatorHooks h;
    h.on_claim_lost = [this](const std::string&, const std::string&) {
        claims_lost_.fetch_add(1, std::memory_order_relaxed);
    };
    h.on_conflict = [this](const ConflictEvent&) {
        conflicts_.fetch_add(1, std::memory_order_relaxed);
    };
    h.on_transition = [this](const std::string&, JobStatus, JobStatus to, int64_t) {
        switch (to) {
            case JobStatus::Running:   claims_won_.fetch_add(1, std::memory_order_relaxed); break;
            case JobStatus::Completed: completed_.fetch_add(1, std::memory_order_relaxed); break;
            case JobStatus::Failed:    failed_.fetch_add(1, std::memory_order_relaxed); break;
            case JobStatus::Cancelled: cancelled_.fetch_add(1, std::memory_order_relaxed); break;
            case JobStatus::Pending:   break;
        }
    };
    return h;
}

CoordinatorMetrics::Snapshot CoordinatorMetrics::snapshot() const {
    Snapshot s;
    s.claims_won = claims_won_.load();
    s.claims_lost = claims_lost_.load();
    s.completed = completed_.load();
    s.failed = failed_.load();
    s.cancelled = cancelled_.load();
    s.conflicts = conflicts_.load();
    s.reaped = reaped_.load();
    return s;
}

std::string CoordinatorMetrics::summary() const {
    auto s = snapshot();
    return fmt::format("claims won={} lost={} | completed={} failed={} cancelled={} | "
                       "conflicts={} reaped={}",
                       s.claims_won, s.claims_lost, s.completed, s.failed, s.cancelled,
                       s.conflicts, s.reaped);
}
