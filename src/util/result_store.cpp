#include <trellis/result_store.hpp>
#include <trellis/log.hpp>
#include <trellis/uuid.hpp>
#include <sqlite3.h>

#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

namespace trellis {

static const std::string SCHEMA_VERSION = "1";

static Result<TestStatus> parse_status(const std::string& text) {
    if (text == "passed") return Result<TestStatus>::ok(TestStatus::Passed);
    if (text == "failed") return Result<TestStatus>::ok(TestStatus::Failed);
    if (text == "errored") return Result<TestStatus>::ok(TestStatus::Errored);
    if (text == "skipped") return Result<TestStatus>::ok(TestStatus::Skipped);
    return TrellisError(TrellisError::Database, "unknown stored status '" + text + "'");
}

static std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// ---------------------------------------------------------------------------
// Impl: SQLite handle and prepared statements
// ---------------------------------------------------------------------------

struct ResultStore::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_insert_run = nullptr;
    sqlite3_stmt* stmt_insert_result = nullptr;
    sqlite3_stmt* stmt_latest = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_insert_run);
        fin(stmt_insert_result);
        fin(stmt_latest);
    }

    Status require_open() const {
        if (!db) return TrellisError(TrellisError::Database, "result store is not open");
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return TrellisError(TrellisError::Database,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return TrellisError(TrellisError::Database, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Result<int64_t> scalar(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return TrellisError(TrellisError::Database,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        int64_t value = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            value = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return Result<int64_t>::ok(value);
    }

    Status init_schema() {
        TRELLIS_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS runs ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  run_uuid TEXT,"
            "  started_at INTEGER,"
            "  passed INTEGER,"
            "  failed INTEGER,"
            "  errored INTEGER,"
            "  skipped INTEGER,"
            "  structural INTEGER,"
            "  duration_ms REAL"
            ");"
            "CREATE TABLE IF NOT EXISTS results ("
            "  run INTEGER,"
            "  location TEXT,"
            "  name TEXT,"
            "  status TEXT,"
            "  duration_ms REAL,"
            "  message TEXT,"
            "  PRIMARY KEY (run, location, name)"
            ");"
            "CREATE INDEX IF NOT EXISTS results_by_test ON results (location, name, run);"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return TrellisError(TrellisError::Database,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        bool current = false;
        bool present = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            present = true;
            current = column_string(stmt, 0) == SCHEMA_VERSION;
        }
        sqlite3_finalize(stmt);

        if (present && !current) {
            log::info("result store schema changed, discarding history");
            TRELLIS_TRY(exec("DELETE FROM results; DELETE FROM runs;"));
        }
        if (!current) {
            std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
                "VALUES ('version', '" + SCHEMA_VERSION + "');";
            TRELLIS_TRY(exec(ver_sql.c_str()));
        }
        return ok_status();
    }
};

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

ResultStore::ResultStore() : impl_(std::make_unique<Impl>()) {}
ResultStore::~ResultStore() = default;
ResultStore::ResultStore(ResultStore&&) noexcept = default;
ResultStore& ResultStore::operator=(ResultStore&&) noexcept = default;

Status ResultStore::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return TrellisError(TrellisError::IO,
                "failed to create result store directory: " + parent.string());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return TrellisError(TrellisError::Database,
            "failed to open result store: " + err_msg, "", db_path, 0);
    }

    auto setup = [&]() -> Status {
        TRELLIS_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        TRELLIS_TRY(impl_->init_schema());
        return ok_status();
    };

    auto setup_result = setup();
    if (setup_result.is_err()) {
        // History is disposable: recreate a corrupt database once
        log::warn("result store %s unusable (%s), recreating",
                  db_path.c_str(), setup_result.error().message.c_str());
        close();
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return TrellisError(TrellisError::Database,
                "failed to recreate result store", "", db_path, 0);
        }
        TRELLIS_TRY(setup());
    }
    return ok_status();
}

void ResultStore::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool ResultStore::is_open() const {
    return impl_->db != nullptr;
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

Result<int64_t> ResultStore::record_run(const RunSummary& summary) {
    TRELLIS_TRY(impl_->require_open());
    TRELLIS_TRY(impl_->prepare(
        "INSERT INTO runs (run_uuid, started_at, passed, failed, errored, skipped, "
        "structural, duration_ms) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
        impl_->stmt_insert_run));
    TRELLIS_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO results (run, location, name, status, duration_ms, message) "
        "VALUES (?, ?, ?, ?, ?, ?)",
        impl_->stmt_insert_result));

    TRELLIS_TRY(impl_->exec("BEGIN;"));

    auto write = [&]() -> Result<int64_t> {
        int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::string run_uuid = Uuid::v4().to_string();

        sqlite3_stmt* run = impl_->stmt_insert_run;
        sqlite3_reset(run);
        sqlite3_bind_text(run, 1, run_uuid.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(run, 2, now);
        sqlite3_bind_int64(run, 3, static_cast<int64_t>(summary.counts.passed));
        sqlite3_bind_int64(run, 4, static_cast<int64_t>(summary.counts.failed));
        sqlite3_bind_int64(run, 5, static_cast<int64_t>(summary.counts.errored));
        sqlite3_bind_int64(run, 6, static_cast<int64_t>(summary.counts.skipped));
        sqlite3_bind_int64(run, 7, static_cast<int64_t>(summary.errors.size()));
        sqlite3_bind_double(run, 8, summary.duration_ms);
        if (sqlite3_step(run) != SQLITE_DONE) {
            return TrellisError(TrellisError::Database,
                std::string("failed to record run: ") + sqlite3_errmsg(impl_->db));
        }
        int64_t run_id = sqlite3_last_insert_rowid(impl_->db);

        sqlite3_stmt* res = impl_->stmt_insert_result;
        for (const auto& o : summary.outcomes) {
            sqlite3_reset(res);
            sqlite3_bind_int64(res, 1, run_id);
            sqlite3_bind_text(res, 2, o.location.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(res, 3, o.name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(res, 4, status_name(o.status), -1, SQLITE_STATIC);
            sqlite3_bind_double(res, 5, o.duration_ms);
            sqlite3_bind_text(res, 6, o.message.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(res) != SQLITE_DONE) {
                return TrellisError(TrellisError::Database,
                    std::string("failed to record result: ") + sqlite3_errmsg(impl_->db));
            }
        }
        return Result<int64_t>::ok(run_id);
    };

    auto written = write();
    if (written.is_err()) {
        auto rollback = impl_->exec("ROLLBACK;");
        if (rollback.is_err()) {
            log::warn("%s", rollback.error().message.c_str());
        }
        return written;
    }
    TRELLIS_TRY(impl_->exec("COMMIT;"));
    log::debug("recorded run %lld (%zu outcome(s))",
               static_cast<long long>(written.value()), summary.outcomes.size());
    return written;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<std::vector<StoredResult>> ResultStore::latest() {
    TRELLIS_TRY(impl_->require_open());
    TRELLIS_TRY(impl_->prepare(
        "SELECT r.location, r.name, r.status, r.duration_ms FROM results r "
        "WHERE r.run = (SELECT MAX(run) FROM results l "
        "               WHERE l.location = r.location AND l.name = r.name) "
        "ORDER BY r.location, r.name",
        impl_->stmt_latest));

    sqlite3_stmt* stmt = impl_->stmt_latest;
    sqlite3_reset(stmt);

    std::vector<StoredResult> out;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        StoredResult r;
        r.location = column_string(stmt, 0);
        r.name = column_string(stmt, 1);
        auto status = parse_status(column_string(stmt, 2));
        if (status.is_err()) return std::move(status).error();
        r.status = status.value();
        r.duration_ms = sqlite3_column_double(stmt, 3);
        out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) {
        return TrellisError(TrellisError::Database,
            std::string("failed to read results: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<std::vector<StoredResult>>::ok(std::move(out));
}

Result<std::vector<std::string>> ResultStore::last_failed() {
    auto rows = latest();
    if (rows.is_err()) return std::move(rows).error();

    std::vector<std::string> out;
    for (const auto& r : rows.value()) {
        if (r.status == TestStatus::Failed || r.status == TestStatus::Errored) {
            out.push_back(r.location + "::" + r.name);
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<std::unordered_map<std::string, double>> ResultStore::durations() {
    auto rows = latest();
    if (rows.is_err()) return std::move(rows).error();

    std::unordered_map<std::string, double> out;
    for (const auto& r : rows.value()) {
        if (r.status == TestStatus::Skipped) continue;
        out[r.location + "::" + r.name] = r.duration_ms;
    }
    return Result<std::unordered_map<std::string, double>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

Status ResultStore::prune(size_t keep_runs) {
    TRELLIS_TRY(impl_->require_open());
    std::string keep = std::to_string(keep_runs);
    std::string sql =
        "DELETE FROM runs WHERE id NOT IN "
        "(SELECT id FROM runs ORDER BY id DESC LIMIT " + keep + ");"
        "DELETE FROM results WHERE run NOT IN (SELECT id FROM runs);";
    return impl_->exec(sql.c_str());
}

Status ResultStore::clear() {
    TRELLIS_TRY(impl_->require_open());
    return impl_->exec("DELETE FROM results; DELETE FROM runs;");
}

Result<StoreStats> ResultStore::get_stats() {
    TRELLIS_TRY(impl_->require_open());
    StoreStats stats;

    auto runs = impl_->scalar("SELECT COUNT(*) FROM runs");
    if (runs.is_err()) return std::move(runs).error();
    stats.run_count = runs.value();

    auto results = impl_->scalar("SELECT COUNT(*) FROM results");
    if (results.is_err()) return std::move(results).error();
    stats.result_count = results.value();

    return Result<StoreStats>::ok(stats);
}

} // namespace trellis
