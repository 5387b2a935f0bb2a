#include "sqlite_job_store.hpp"
#include <core/time_utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <sqlite3.h>
#include <vector>

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

constexpr const char* SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS jobs (
        id            TEXT PRIMARY KEY,
        status        TEXT NOT NULL
                      CHECK (status IN ('pending', 'running', 'completed', 'failed', 'cancelled')),
        version       INTEGER NOT NULL DEFAULT 1,
        worker_ref    TEXT NOT NULL DEFAULT '',
        model_type    TEXT NOT NULL DEFAULT '',
        parameters    TEXT NOT NULL DEFAULT '',
        created_at    INTEGER NOT NULL,
        updated_at    INTEGER NOT NULL,
        started_at    INTEGER,
        completed_at  INTEGER,
        result        TEXT,
        error_info    TEXT,
        cancel_reason TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_jobs_status_started ON jobs(status, started_at);
    CREATE INDEX IF NOT EXISTS idx_jobs_status_created ON jobs(status, created_at);
)";

// Column order shared by every SELECT and read_row().
constexpr const char* SELECT_COLUMNS =
    "id, status, version, worker_ref, model_type, parameters, created_at, updated_at, "
    "started_at, completed_at, result, error_info, cancel_reason";

std::string errmsg(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "no database handle";
}

Result<Statement> prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return Result<Statement>::Err("Failed to prepare statement: " + errmsg(db));
    }
    return Result<Statement>::Ok(Statement(raw));
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

void bind_optional_time(sqlite3_stmt* stmt, int idx, const std::optional<TimePoint>& tp) {
    if (tp) {
        sqlite3_bind_int64(stmt, idx, to_epoch_ms(*tp));
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

std::optional<std::string> get_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return get_text_column(stmt, col);
}

std::optional<TimePoint> get_optional_time(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return from_epoch_ms(sqlite3_column_int64(stmt, col));
}

Result<JobRecord> read_row(sqlite3_stmt* stmt) {
    JobRecord r;
    r.id = get_text_column(stmt, 0);

    std::string status_text = get_text_column(stmt, 1);
    auto status = parse_job_status(status_text);
    if (!status) {
        return Result<JobRecord>::Err(
            fmt::format("Job '{}' has unknown status '{}'", r.id, status_text));
    }
    r.status = *status;

    r.version = sqlite3_column_int64(stmt, 2);
    r.worker_ref = get_text_column(stmt, 3);
    r.model_type = get_text_column(stmt, 4);
    r.parameters = get_text_column(stmt, 5);
    r.created_at = from_epoch_ms(sqlite3_column_int64(stmt, 6));
    r.updated_at = from_epoch_ms(sqlite3_column_int64(stmt, 7));
    r.started_at = get_optional_time(stmt, 8);
    r.completed_at = get_optional_time(stmt, 9);
    r.result = get_optional_text(stmt, 10);
    r.error_info = get_optional_text(stmt, 11);
    r.cancel_reason = get_optional_text(stmt, 12);
    return Result<JobRecord>::Ok(std::move(r));
}

Result<std::vector<JobRecord>> read_rows(sqlite3* db, sqlite3_stmt* stmt) {
    std::vector<JobRecord> out;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto row = read_row(stmt);
        if (row.is_err()) return forward_error<std::vector<JobRecord>>(row);
        out.push_back(std::move(row.value));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<JobRecord>>::Err("Query failed: " + errmsg(db));
    }
    return Result<std::vector<JobRecord>>::Ok(std::move(out));
}

} // namespace

// ── Construction ────────────────────────────────────────────

Result<std::unique_ptr<SqliteJobStore>> SqliteJobStore::open(const std::string& path,
                                                             int busy_timeout_ms) {
    using R = Result<std::unique_ptr<SqliteJobStore>>;

    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        std::string msg = fmt::format("Failed to open job database '{}': {}", path, errmsg(db));
        sqlite3_close_v2(db);
        return R::Err(msg);
    }

    std::unique_ptr<SqliteJobStore> store(new SqliteJobStore(db, path));
    sqlite3_busy_timeout(db, busy_timeout_ms);

    if (path != ":memory:") {
        auto wal = store->exec("PRAGMA journal_mode=WAL;");
        if (wal.is_err()) return forward_error<std::unique_ptr<SqliteJobStore>>(wal);
    }

    auto schema = store->create_schema();
    if (schema.is_err()) return forward_error<std::unique_ptr<SqliteJobStore>>(schema);

    coord_log(fmt::format("store: opened sqlite job table at {}", path));
    return R::Ok(std::move(store));
}

SqliteJobStore::SqliteJobStore(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

SqliteJobStore::~SqliteJobStore() {
    if (db_) sqlite3_close_v2(db_);
}

Result<void> SqliteJobStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : errmsg(db_);
        sqlite3_free(err);
        return Result<void>::Err("SQL failed: " + msg);
    }
    return Result<void>::Ok();
}

Result<void> SqliteJobStore::create_schema() {
    return exec(SCHEMA_SQL);
}

// ── Reads ───────────────────────────────────────────────────

Result<JobRecord> SqliteJobStore::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    return load_locked(id);
}

Result<JobRecord> SqliteJobStore::load_locked(const std::string& id) {
    auto stmt = prepare(db_, fmt::format("SELECT {} FROM jobs WHERE id = ?", SELECT_COLUMNS));
    if (stmt.is_err()) return forward_error<JobRecord>(stmt);

    bind_text(stmt.value.get(), 1, id);
    int rc = sqlite3_step(stmt.value.get());
    if (rc == SQLITE_ROW) return read_row(stmt.value.get());
    if (rc == SQLITE_DONE) {
        return Result<JobRecord>::Err(fmt::format("Job '{}' not found", id), ErrorCode::NotFound);
    }
    return Result<JobRecord>::Err(fmt::format("Failed to load job '{}': {}", id, errmsg(db_)));
}

Result<std::vector<JobRecord>> SqliteJobStore::find_by_status(JobStatus status, std::size_t limit) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    auto stmt = prepare(db_, fmt::format(
        "SELECT {} FROM jobs WHERE status = ? ORDER BY created_at ASC LIMIT ?", SELECT_COLUMNS));
    if (stmt.is_err()) return forward_error<std::vector<JobRecord>>(stmt);

    sqlite3_bind_text(stmt.value.get(), 1, to_string(status), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.value.get(), 2, static_cast<sqlite3_int64>(limit));
    return read_rows(db_, stmt.value.get());
}

Result<StatusCounts> SqliteJobStore::count_by_status() {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    auto stmt = prepare(db_, "SELECT status, COUNT(*) FROM jobs GROUP BY status");
    if (stmt.is_err()) return forward_error<StatusCounts>(stmt);

    StatusCounts counts = empty_status_counts();
    sqlite3_stmt* s = stmt.value.get();
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        std::string status_text = get_text_column(s, 0);
        auto status = parse_job_status(status_text);
        if (!status) {
            return Result<StatusCounts>::Err(fmt::format("Unknown status '{}' in jobs table", status_text));
        }
        counts[*status] = static_cast<std::size_t>(sqlite3_column_int64(s, 1));
    }
    if (rc != SQLITE_DONE) {
        return Result<StatusCounts>::Err("Query failed: " + errmsg(db_));
    }
    return Result<StatusCounts>::Ok(std::move(counts));
}

Result<std::vector<JobRecord>> SqliteJobStore::find_stale_running(TimePoint started_before) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    auto stmt = prepare(db_, fmt::format(
        "SELECT {} FROM jobs WHERE status = 'running' AND started_at IS NOT NULL "
        "AND started_at < ? ORDER BY started_at ASC", SELECT_COLUMNS));
    if (stmt.is_err()) return forward_error<std::vector<JobRecord>>(stmt);

    sqlite3_bind_int64(stmt.value.get(), 1, to_epoch_ms(started_before));
    return read_rows(db_, stmt.value.get());
}

Result<void> SqliteJobStore::ping() {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    return exec("SELECT 1;");
}

// ── Writes ──────────────────────────────────────────────────

Result<void> SqliteJobStore::insert(const JobRecord& record) {
    auto valid = validate_new_record(record);
    if (valid.is_err()) return valid;

    std::lock_guard<std::mutex> lock(connection_mutex_);
    auto stmt = prepare(db_,
        "INSERT INTO jobs (id, status, version, worker_ref, model_type, parameters, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    if (stmt.is_err()) return forward_error<void>(stmt);

    sqlite3_stmt* s = stmt.value.get();
    int idx = 1;
    bind_text(s, idx++, record.id);
    sqlite3_bind_text(s, idx++, to_string(record.status), -1, SQLITE_STATIC);
    sqlite3_bind_int64(s, idx++, record.version);
    bind_text(s, idx++, record.worker_ref);
    bind_text(s, idx++, record.model_type);
    bind_text(s, idx++, record.parameters);
    sqlite3_bind_int64(s, idx++, to_epoch_ms(record.created_at));
    sqlite3_bind_int64(s, idx++, to_epoch_ms(record.created_at));

    int rc = sqlite3_step(s);
    if (rc == SQLITE_CONSTRAINT) {
        return Result<void>::Err(fmt::format("Job '{}' already exists", record.id),
                                 ErrorCode::InvalidArgument);
    }
    if (rc != SQLITE_DONE) {
        return Result<void>::Err(fmt::format("Failed to insert job '{}': {}", record.id, errmsg(db_)));
    }
    return Result<void>::Ok();
}

Result<CasOutcome> SqliteJobStore::conditional_update(const std::string& id,
                                                      int64_t expected_version,
                                                      const JobMutation& mutation,
                                                      TimePoint now) {
    // SET list mirrors the populated mutation fields; binding order follows it.
    std::string sql = "UPDATE jobs SET version = version + 1, updated_at = ?";
    if (mutation.status) sql += ", status = ?";
    if (mutation.worker_ref) sql += ", worker_ref = ?";
    if (mutation.started_at) sql += ", started_at = ?";
    if (mutation.completed_at) sql += ", completed_at = ?";
    if (mutation.result) sql += ", result = ?";
    if (mutation.error_info) sql += ", error_info = ?";
    if (mutation.cancel_reason) sql += ", cancel_reason = ?";
    sql += " WHERE id = ? AND version = ?";

    std::lock_guard<std::mutex> lock(connection_mutex_);
    auto stmt = prepare(db_, sql);
    if (stmt.is_err()) return forward_error<CasOutcome>(stmt);

    sqlite3_stmt* s = stmt.value.get();
    int idx = 1;
    sqlite3_bind_int64(s, idx++, to_epoch_ms(now));
    if (mutation.status) sqlite3_bind_text(s, idx++, to_string(*mutation.status), -1, SQLITE_STATIC);
    if (mutation.worker_ref) bind_text(s, idx++, *mutation.worker_ref);
    if (mutation.started_at) bind_optional_time(s, idx++, mutation.started_at);
    if (mutation.completed_at) bind_optional_time(s, idx++, mutation.completed_at);
    if (mutation.result) bind_optional_text(s, idx++, mutation.result);
    if (mutation.error_info) bind_optional_text(s, idx++, mutation.error_info);
    if (mutation.cancel_reason) bind_optional_text(s, idx++, mutation.cancel_reason);
    bind_text(s, idx++, id);
    sqlite3_bind_int64(s, idx++, expected_version);

    if (sqlite3_step(s) != SQLITE_DONE) {
        return Result<CasOutcome>::Err(
            fmt::format("Conditional update of job '{}' failed: {}", id, errmsg(db_)));
    }

    if (sqlite3_changes(db_) == 1) {
        return Result<CasOutcome>::Ok(CasOutcome{true, expected_version + 1});
    }

    // Zero rows: either the id is gone or the version moved. The read below
    // only classifies the miss; nothing is written on this path.
    auto current = load_locked(id);
    if (current.is_err()) return forward_error<CasOutcome>(current);
    return Result<CasOutcome>::Ok(CasOutcome{false, current.value.version});
}
