#include <gtest/gtest.h>
#include <reaper/stuck_job_reaper.hpp>
#include <store/memory_job_store.hpp>
#include <store/sqlite_job_store.hpp>
#include "test_support.hpp"
#include <functional>
#include <thread>

using namespace std::chrono;

namespace {

// Delegates to a MemoryJobStore and runs `after_scan` once the stale scan
// has been answered: the window in which a worker can still finish.
class ScanHookStore : public JobStore {
public:
    MemoryJobStore inner;
    std::function<void()> after_scan;

    Result<JobRecord> load(const std::string& id) override { return inner.load(id); }
    Result<CasOutcome> conditional_update(const std::string& id, int64_t expected,
                                          const JobMutation& m, TimePoint now) override {
        return inner.conditional_update(id, expected, m, now);
    }
    Result<void> insert(const JobRecord& r) override { return inner.insert(r); }
    Result<std::vector<JobRecord>> find_by_status(JobStatus s,
                                                  std::size_t limit = DEFAULT_LIST_LIMIT) override {
        return inner.find_by_status(s, limit);
    }
    Result<StatusCounts> count_by_status() override { return inner.count_by_status(); }
    Result<std::vector<JobRecord>> find_stale_running(TimePoint before) override {
        auto rows = inner.find_stale_running(before);
        if (after_scan) after_scan();
        return rows;
    }
    Result<void> ping() override { return Result<void>::Ok(); }
};

} // namespace

class StuckJobReaperTest : public ::testing::Test {
protected:
    ManualClock clock;
    std::shared_ptr<ScanHookStore> store = std::make_shared<ScanHookStore>();
    std::unique_ptr<JobCoordinator> coord;
    int64_t claim_version = 0;

    void SetUp() override {
        coord = std::make_unique<JobCoordinator>(store, CoordinatorHooks{}, clock.fn());
        ASSERT_TRUE(store->insert(make_pending("job-1", clock.now())).is_ok());
        auto claim = coord->claim("job-1", "node-a:1-1");
        ASSERT_TRUE(claim.value.claimed);
        claim_version = claim.value.version;
    }
};

// Claimed 3h ago, deadline 2h: reaped once, the late worker loses.
TEST_F(StuckJobReaperTest, ReapsStaleJobAndLateWorkerConflicts) {
    clock.advance(hours(3));
    StuckJobReaper reaper(*coord, minutes(1), hours(2));

    auto report = reaper.sweep_once();
    EXPECT_EQ(report.scanned, 1u);
    EXPECT_EQ(report.reaped, 1u);
    EXPECT_EQ(report.lost_races, 0u);

    auto row = coord->get("job-1").value;
    EXPECT_EQ(row.status, JobStatus::Failed);
    EXPECT_EQ(row.version, 3);
    ASSERT_TRUE(row.error_info.has_value());
    EXPECT_NE(row.error_info->find("\"reason\":\"worker timeout\""), std::string::npos);
    EXPECT_EQ(row.completed_at, clock.now());

    auto late = coord->complete("job-1", claim_version, "result");
    EXPECT_TRUE(late.is(ErrorCode::ConcurrencyConflict));
    EXPECT_EQ(coord->get("job-1").value.status, JobStatus::Failed);

    // Nothing left to reap on the next pass
    auto second = reaper.sweep_once();
    EXPECT_EQ(second.scanned, 0u);
    EXPECT_EQ(second.reaped, 0u);
}

TEST_F(StuckJobReaperTest, LeavesJobsWithinDeadline) {
    clock.advance(minutes(90));
    StuckJobReaper reaper(*coord, minutes(1), hours(2));

    auto report = reaper.sweep_once();
    EXPECT_EQ(report.scanned, 0u);
    EXPECT_EQ(coord->get("job-1").value.status, JobStatus::Running);
}

TEST_F(StuckJobReaperTest, IgnoresPendingAndTerminalJobs) {
    ASSERT_TRUE(store->insert(make_pending("job-2", clock.now())).is_ok());
    ASSERT_TRUE(coord->complete("job-1", claim_version, "done").is_ok());
    clock.advance(hours(10));

    StuckJobReaper reaper(*coord, minutes(1), hours(2));
    auto report = reaper.sweep_once();
    EXPECT_EQ(report.scanned, 0u);
    EXPECT_EQ(coord->get("job-2").value.status, JobStatus::Pending);
    EXPECT_EQ(coord->get("job-1").value.status, JobStatus::Completed);
}

TEST_F(StuckJobReaperTest, WorkerFinishingAfterScanWins) {
    clock.advance(hours(3));
    store->after_scan = [&] {
        EXPECT_TRUE(coord->complete("job-1", claim_version, "{\"ok\":\"1\"}").is_ok());
    };

    StuckJobReaper reaper(*coord, minutes(1), hours(2));
    auto report = reaper.sweep_once();
    EXPECT_EQ(report.scanned, 1u);
    EXPECT_EQ(report.reaped, 0u);
    EXPECT_EQ(report.lost_races, 1u);
    EXPECT_EQ(report.errors, 0u);

    auto row = coord->get("job-1").value;
    EXPECT_EQ(row.status, JobStatus::Completed);
    EXPECT_EQ(row.version, 3);
    EXPECT_FALSE(row.error_info.has_value());
}

TEST_F(StuckJobReaperTest, SweepAtExplicitInstant) {
    StuckJobReaper reaper(*coord, minutes(1), hours(2));
    EXPECT_EQ(reaper.sweep_once(clock.now() + hours(1)).reaped, 0u);
    EXPECT_EQ(reaper.sweep_once(clock.now() + hours(3)).reaped, 1u);
}

TEST_F(StuckJobReaperTest, BackgroundThreadReapsAndStops) {
    clock.advance(hours(3));
    std::atomic<int> sweeps{0};
    StuckJobReaper reaper(*coord, seconds(1), hours(2),
                          [&](const ReapReport&) { sweeps++; });

    ASSERT_TRUE(reaper.start());
    EXPECT_TRUE(reaper.is_running());

    auto deadline = steady_clock::now() + seconds(5);
    while (coord->get("job-1").value.status == JobStatus::Running &&
           steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(20));
    }
    reaper.stop();

    EXPECT_FALSE(reaper.is_running());
    EXPECT_EQ(coord->get("job-1").value.status, JobStatus::Failed);
    EXPECT_GE(sweeps.load(), 1);
}

// Two reapers on separate SQLite connections sweep the same stale jobs.
TEST(StuckJobReaperRace, ConcurrentReapersFailEachJobOnce) {
    TempDir dir;
    ManualClock clock;
    std::string path = dir.file("reap.db").string();

    auto seed = SqliteJobStore::open(path);
    ASSERT_TRUE(seed.is_ok()) << seed.error;
    std::shared_ptr<JobStore> seed_store(std::move(seed.value));
    JobCoordinator seeder(seed_store, CoordinatorHooks{}, clock.fn());

    constexpr int JOBS = 10;
    for (int i = 0; i < JOBS; ++i) {
        std::string id = "job-" + std::to_string(i);
        ASSERT_TRUE(seed_store->insert(make_pending(id, clock.now())).is_ok());
        ASSERT_TRUE(seeder.claim(id, "crashed-worker").value.claimed);
    }
    clock.advance(hours(3));

    std::atomic<std::size_t> reaped{0};
    std::atomic<std::size_t> lost{0};
    std::atomic<std::size_t> errors{0};
    std::vector<std::thread> threads;
    for (int r = 0; r < 2; ++r) {
        threads.emplace_back([&] {
            auto opened = SqliteJobStore::open(path);
            if (opened.is_err()) {
                errors++;
                return;
            }
            JobCoordinator coord(std::shared_ptr<JobStore>(std::move(opened.value)),
                                 CoordinatorHooks{}, clock.fn());
            StuckJobReaper reaper(coord, minutes(1), hours(2));
            auto report = reaper.sweep_once();
            reaped += report.reaped;
            lost += report.lost_races;
            errors += report.errors;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(errors.load(), 0u);
    EXPECT_EQ(reaped.load(), static_cast<std::size_t>(JOBS));
    for (int i = 0; i < JOBS; ++i) {
        auto row = seed_store->load("job-" + std::to_string(i)).value;
        EXPECT_EQ(row.status, JobStatus::Failed);
        EXPECT_EQ(row.version, 3);
    }
}
