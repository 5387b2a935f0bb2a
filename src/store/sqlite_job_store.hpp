#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "job_store.hpp"

struct sqlite3;

// Durable job table in a SQLite file shared by any number of worker
// processes. The conditional update is one statement:
//
//   UPDATE jobs SET ..., version = version + 1 WHERE id = ? AND version = ?
//
// and a lost race is detected as zero rows changed.
//
// Thread Safety:
// - One connection per instance. connection_mutex_ serializes use of the
//   handle (so sqlite3_changes() reads our own statement); it does not
//   protect rows. Cross-process and cross-instance exclusion comes from
//   the WHERE clause alone.
class SqliteJobStore : public JobStore {
public:
    // Open or create the database at `path` (":memory:" for a private db).
    static Result<std::unique_ptr<SqliteJobStore>> open(const std::string& path,
                                                        int busy_timeout_ms = SQLITE_DEFAULT_BUSY_MS);
    ~SqliteJobStore() override;

    SqliteJobStore(const SqliteJobStore&) = delete;
    SqliteJobStore& operator=(const SqliteJobStore&) = delete;

    Result<JobRecord> load(const std::string& id) override;
    Result<CasOutcome> conditional_update(const std::string& id,
                                          int64_t expected_version,
                                          const JobMutation& mutation,
                                          TimePoint now) override;
    Result<void> insert(const JobRecord& record) override;
    Result<std::vector<JobRecord>> find_by_status(JobStatus status,
                                                  std::size_t limit = DEFAULT_LIST_LIMIT) override;
    Result<StatusCounts> count_by_status() override;
    Result<std::vector<JobRecord>> find_stale_running(TimePoint started_before) override;
    Result<void> ping() override;

    const std::string& path() const { return path_; }

private:
    SqliteJobStore(sqlite3* db, std::string path);

    Result<void> exec(const char* sql);
    Result<void> create_schema();
    Result<JobRecord> load_locked(const std::string& id);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex connection_mutex_;
};
