#include <gtest/gtest.h>
#include <coordinator/coordinator.hpp>
#include <coordinator/coordinator_metrics.hpp>
#include <store/memory_job_store.hpp>
#include <store/sqlite_job_store.hpp>
#include "test_support.hpp"
#include <array>
#include <thread>
#include <vector>

using namespace std::chrono;

class CoordinatorTest : public ::testing::Test {
protected:
    ManualClock clock;
    std::shared_ptr<MemoryJobStore> store = std::make_shared<MemoryJobStore>();

    std::vector<std::pair<std::string, std::string>> claims_lost;
    std::vector<ConflictEvent> conflicts;
    std::vector<int64_t> transition_versions;

    std::unique_ptr<JobCoordinator> coord;

    void SetUp() override {
        CoordinatorHooks hooks;
        hooks.on_claim_lost = [this](const std::string& id, const std::string& ref) {
            claims_lost.emplace_back(id, ref);
        };
        hooks.on_conflict = [this](const ConflictEvent& e) { conflicts.push_back(e); };
        hooks.on_transition = [this](const std::string&, JobStatus, JobStatus, int64_t v) {
            transition_versions.push_back(v);
        };
        coord = std::make_unique<JobCoordinator>(store, hooks, clock.fn());
        ASSERT_TRUE(store->insert(make_pending("job-1", clock.now())).is_ok());
    }
};

// Two workers race; the winner completes; stale finalizations conflict.
TEST_F(CoordinatorTest, ClaimCompleteScenario) {
    auto a = coord->claim("job-1", "worker-a");
    auto b = coord->claim("job-1", "worker-b");
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_TRUE(a.value.claimed);
    EXPECT_EQ(a.value.version, 2);
    EXPECT_FALSE(b.value.claimed);

    auto running = coord->get("job-1").value;
    EXPECT_EQ(running.status, JobStatus::Running);
    EXPECT_EQ(running.worker_ref, "worker-a");
    EXPECT_EQ(running.started_at, clock.now());

    clock.advance(seconds(30));
    auto done = coord->complete("job-1", 2, "{\"peak\":\"42\"}");
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value, 3);

    auto row = coord->get("job-1").value;
    EXPECT_EQ(row.status, JobStatus::Completed);
    EXPECT_EQ(row.version, 3);
    EXPECT_EQ(row.completed_at, clock.now());
    EXPECT_TRUE(row.result.has_value());
    EXPECT_FALSE(row.error_info.has_value());
    EXPECT_FALSE(row.cancel_reason.has_value());

    auto again = coord->complete("job-1", 2, "dup");
    EXPECT_TRUE(again.is(ErrorCode::ConcurrencyConflict));
    auto late_fail = coord->fail("job-1", 2, "{}");
    EXPECT_TRUE(late_fail.is(ErrorCode::ConcurrencyConflict));

    row = coord->get("job-1").value;
    EXPECT_EQ(row.version, 3);
    EXPECT_EQ(row.status, JobStatus::Completed);
    EXPECT_EQ(*row.result, "{\"peak\":\"42\"}");

    ASSERT_EQ(claims_lost.size(), 1u);
    EXPECT_EQ(claims_lost[0].second, "worker-b");
    ASSERT_EQ(conflicts.size(), 2u);
    EXPECT_EQ(conflicts[0].operation, "complete");
    EXPECT_EQ(conflicts[0].expected_version, 2);
    EXPECT_EQ(conflicts[0].observed_version, 3);
    EXPECT_EQ(conflicts[1].operation, "fail");
}

TEST_F(CoordinatorTest, VersionsIncreaseByExactlyOne) {
    auto claim = coord->claim("job-1", "w");
    ASSERT_TRUE(claim.value.claimed);
    auto failed = coord->fail("job-1", claim.value.version, "{\"message\":\"boom\"}");
    ASSERT_TRUE(failed.is_ok());

    EXPECT_EQ(transition_versions, (std::vector<int64_t>{2, 3}));
}

TEST_F(CoordinatorTest, StaleFinalizationNeverMutates) {
    ASSERT_TRUE(coord->claim("job-1", "w").value.claimed);
    auto before = coord->get("job-1").value;

    EXPECT_TRUE(coord->complete("job-1", 1, "r").is(ErrorCode::ConcurrencyConflict));
    EXPECT_TRUE(coord->fail("job-1", 1, "e").is(ErrorCode::ConcurrencyConflict));
    EXPECT_TRUE(coord->cancel("job-1", 1, "c").is(ErrorCode::ConcurrencyConflict));
    EXPECT_TRUE(coord->complete("job-1", 9, "r").is(ErrorCode::ConcurrencyConflict));

    auto after = coord->get("job-1").value;
    EXPECT_EQ(after.version, before.version);
    EXPECT_EQ(after.status, JobStatus::Running);
    EXPECT_FALSE(after.result || after.error_info || after.cancel_reason);
    EXPECT_EQ(conflicts.size(), 4u);
}

TEST_F(CoordinatorTest, CompleteOnPendingIsInvalidTransition) {
    auto r = coord->complete("job-1", 1, "r");
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.is(ErrorCode::InvalidTransition));
    EXPECT_TRUE(conflicts.empty());
    EXPECT_EQ(coord->get("job-1").value.version, 1);
}

TEST_F(CoordinatorTest, NothingLeavesTerminalState) {
    auto claim = coord->claim("job-1", "w");
    auto done = coord->complete("job-1", claim.value.version, "r");
    ASSERT_TRUE(done.is_ok());

    EXPECT_TRUE(coord->fail("job-1", done.value, "e").is(ErrorCode::InvalidTransition));
    EXPECT_TRUE(coord->cancel("job-1", done.value, "c").is(ErrorCode::InvalidTransition));
    EXPECT_TRUE(coord->complete("job-1", done.value, "r").is(ErrorCode::InvalidTransition));
}

TEST_F(CoordinatorTest, ClaimOnTerminalJobIsLostNotError) {
    ASSERT_TRUE(coord->cancel("job-1", 1, "user").is_ok());
    auto claim = coord->claim("job-1", "w");
    ASSERT_TRUE(claim.is_ok());
    EXPECT_FALSE(claim.value.claimed);
    EXPECT_EQ(claims_lost.size(), 1u);
}

TEST_F(CoordinatorTest, CancelPendingAndRunning) {
    auto c = coord->cancel("job-1", 1, "no longer needed");
    ASSERT_TRUE(c.is_ok());
    auto row = coord->get("job-1").value;
    EXPECT_EQ(row.status, JobStatus::Cancelled);
    EXPECT_EQ(row.cancel_reason, std::optional<std::string>("no longer needed"));
    EXPECT_FALSE(row.started_at.has_value());

    ASSERT_TRUE(store->insert(make_pending("job-2", clock.now())).is_ok());
    auto claim = coord->claim("job-2", "w");
    ASSERT_TRUE(claim.value.claimed);
    ASSERT_TRUE(coord->cancel("job-2", claim.value.version, "operator").is_ok());
    EXPECT_EQ(coord->get("job-2").value.status, JobStatus::Cancelled);
    EXPECT_EQ(coord->get("job-2").value.worker_ref, "w");
}

TEST_F(CoordinatorTest, UnknownIdIsNotFound) {
    EXPECT_TRUE(coord->claim("ghost", "w").is(ErrorCode::NotFound));
    EXPECT_TRUE(coord->complete("ghost", 1, "r").is(ErrorCode::NotFound));
    EXPECT_TRUE(coord->get("ghost").is(ErrorCode::NotFound));
    EXPECT_TRUE(claims_lost.empty());
}

TEST_F(CoordinatorTest, EmptyWorkerRefRejected) {
    EXPECT_TRUE(coord->claim("job-1", "").is(ErrorCode::InvalidArgument));
    EXPECT_EQ(coord->get("job-1").value.status, JobStatus::Pending);
}

TEST(CoordinatorRace, ManyThreadsOneWinner) {
    auto store = std::make_shared<MemoryJobStore>();
    CoordinatorMetrics metrics;
    JobCoordinator coord(store, metrics.hooks());

    constexpr int JOBS = 20;
    constexpr int THREADS = 8;
    for (int j = 0; j < JOBS; ++j) {
        ASSERT_TRUE(store->insert(make_pending("job-" + std::to_string(j), system_now())).is_ok());
    }

    std::array<std::atomic<int>, JOBS> winners{};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            for (int j = 0; j < JOBS; ++j) {
                auto r = coord.claim("job-" + std::to_string(j), "w" + std::to_string(t));
                if (r.is_ok() && r.value.claimed) winners[j]++;
            }
        });
    }
    for (auto& th : threads) th.join();

    for (int j = 0; j < JOBS; ++j) {
        EXPECT_EQ(winners[j].load(), 1) << "job-" << j;
        EXPECT_EQ(store->load("job-" + std::to_string(j)).value.version, 2);
    }

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.claims_won, static_cast<uint64_t>(JOBS));
    EXPECT_EQ(snap.claims_lost, static_cast<uint64_t>(JOBS * (THREADS - 1)));
    EXPECT_EQ(snap.conflicts, 0u);
}

TEST(CoordinatorRace, SqliteConnectionsOneWinner) {
    TempDir dir;
    std::string path = dir.file("race.db").string();
    auto seed = SqliteJobStore::open(path);
    ASSERT_TRUE(seed.is_ok()) << seed.error;
    ASSERT_TRUE(seed.value->insert(make_pending("job-1", system_now())).is_ok());

    constexpr int WORKERS = 6;
    std::atomic<int> winners{0};
    std::atomic<int> errors{0};
    std::vector<std::thread> threads;
    for (int w = 0; w < WORKERS; ++w) {
        threads.emplace_back([&, w] {
            // One connection per worker, as separate processes would have
            auto opened = SqliteJobStore::open(path);
            if (opened.is_err()) {
                errors++;
                return;
            }
            JobCoordinator coord(std::shared_ptr<JobStore>(std::move(opened.value)));
            auto r = coord.claim("job-1", "w" + std::to_string(w));
            if (r.is_err()) {
                errors++;
            } else if (r.value.claimed) {
                winners++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(seed.value->load("job-1").value.version, 2);
}

TEST(CoordinatorHooksChain, BothHookSetsFire) {
    int a = 0, b = 0;
    CoordinatorHooks first;
    first.on_claim_lost = [&](const std::string&, const std::string&) { a++; };
    CoordinatorHooks second;
    second.on_claim_lost = [&](const std::string&, const std::string&) { b++; };
    second.on_conflict = [&](const ConflictEvent&) { b += 10; };

    auto chained = chain_hooks(first, second);
    ASSERT_TRUE(chained.on_claim_lost);
    ASSERT_TRUE(chained.on_conflict);
    EXPECT_FALSE(chained.on_transition);

    chained.on_claim_lost("id", "ref");
    chained.on_conflict(ConflictEvent{});
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 11);
}

TEST(CoordinatorMetricsTest, CountsTerminalTransitions) {
    auto store = std::make_shared<MemoryJobStore>();
    CoordinatorMetrics metrics;
    JobCoordinator coord(store, metrics.hooks());
    for (const char* id : {"a", "b", "c"}) {
        ASSERT_TRUE(store->insert(make_pending(id, system_now())).is_ok());
    }

    auto ca = coord.claim("a", "w");
    ASSERT_TRUE(coord.complete("a", ca.value.version, "r").is_ok());
    auto cb = coord.claim("b", "w");
    ASSERT_TRUE(coord.fail("b", cb.value.version, "e").is_ok());
    ASSERT_TRUE(coord.cancel("c", 1, "x").is_ok());
    EXPECT_TRUE(coord.fail("b", cb.value.version, "e").is(ErrorCode::ConcurrencyConflict));
    metrics.add_reaped(2);

    auto s = metrics.snapshot();
    EXPECT_EQ(s.claims_won, 2u);
    EXPECT_EQ(s.completed, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.cancelled, 1u);
    EXPECT_EQ(s.conflicts, 1u);
    EXPECT_EQ(s.reaped, 2u);
    EXPECT_NE(metrics.summary().find("conflicts=1"), std::string::npos);
}
