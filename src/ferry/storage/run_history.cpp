#include "ferry/storage/run_history.hpp"

#include "ferry/storage/state_strings.hpp"
#include "ferry/util/log.hpp"
#include "ferry/util/time.hpp"

#include <sqlite3.h>

namespace ferry {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  const auto* text =
      reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return text ? std::string{text} : std::string{};
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

}  // namespace

void RunHistory::DbDeleter::operator()(sqlite3* db) const {
  if (db)
    sqlite3_close(db);
}

RunHistory::Statement::~Statement() {
  reset();
}

auto RunHistory::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

RunHistory::RunHistory(std::string_view db_path) : db_path_(db_path) {
}

RunHistory::~RunHistory() {
  close();
}

auto RunHistory::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto RunHistory::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open history database {}: {}", db_path_,
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  sqlite3_busy_timeout(db_.get(), 2000);

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::debug("History database opened: {}", db_path_);
  return ok();
}

auto RunHistory::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto RunHistory::is_open() const -> bool {
  std::lock_guard lock(mu_);
  return db_ != nullptr;
}

auto RunHistory::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS task_runs (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      task_id TEXT NOT NULL,
      type TEXT NOT NULL,
      source TEXT NOT NULL,
      destination TEXT,
      started_at INTEGER NOT NULL,
      finished_at INTEGER NOT NULL,
      outcome TEXT NOT NULL,
      error TEXT,
      bytes_done INTEGER DEFAULT 0
    );

    CREATE INDEX IF NOT EXISTS idx_task_runs_task
      ON task_runs(task_id);
  )";

  return execute(sql);
}

auto RunHistory::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto RunHistory::record(const RunRecord& run) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO task_runs (task_id, type, source, destination, started_at,
                           finished_at, outcome, error, bytes_done)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
  )";

  std::lock_guard lock(mu_);
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, run.task_id.value());
  bind_text(stmt.get(), 2, task_type_name(run.type));
  bind_text(stmt.get(), 3, run.source);
  if (run.destination) {
    bind_text(stmt.get(), 4, *run.destination);
  } else {
    sqlite3_bind_null(stmt.get(), 4);
  }
  sqlite3_bind_int64(stmt.get(), 5, to_epoch_ms(run.started_at));
  sqlite3_bind_int64(stmt.get(), 6, to_epoch_ms(run.finished_at));
  bind_text(stmt.get(), 7, run.succeeded ? "success" : "failed");
  if (run.succeeded) {
    sqlite3_bind_null(stmt.get(), 8);
  } else {
    bind_text(stmt.get(), 8, run.error);
  }
  sqlite3_bind_int64(stmt.get(), 9, run.bytes_done);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to record run of task {}: {}", run.task_id,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto RunHistory::list(std::string_view task_id, std::size_t limit)
    -> Result<std::vector<RunRecord>> {
  const char* sql = nullptr;
  if (task_id.empty()) {
    sql = R"(
      SELECT task_id, type, source, destination, started_at, finished_at,
             outcome, error, bytes_done
      FROM task_runs ORDER BY id DESC LIMIT ?;
    )";
  } else {
    sql = R"(
      SELECT task_id, type, source, destination, started_at, finished_at,
             outcome, error, bytes_done
      FROM task_runs WHERE task_id = ? ORDER BY id DESC LIMIT ?;
    )";
  }

  std::lock_guard lock(mu_);
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  int idx = 1;
  if (!task_id.empty()) {
    bind_text(stmt.get(), idx++, task_id);
  }
  sqlite3_bind_int64(stmt.get(), idx, static_cast<sqlite3_int64>(limit));

  std::vector<RunRecord> runs;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    RunRecord run;
    run.task_id = TaskId{col_text(stmt.get(), 0)};
    run.type = parse_task_type(col_text(stmt.get(), 1))
                   .value_or(TaskType::Upload);
    run.source = col_text(stmt.get(), 2);
    if (sqlite3_column_type(stmt.get(), 3) != SQLITE_NULL) {
      run.destination = col_text(stmt.get(), 3);
    }
    run.started_at = from_epoch_ms(sqlite3_column_int64(stmt.get(), 4));
    run.finished_at = from_epoch_ms(sqlite3_column_int64(stmt.get(), 5));
    run.succeeded = col_text(stmt.get(), 6) == "success";
    run.error = col_text(stmt.get(), 7);
    run.bytes_done = sqlite3_column_int64(stmt.get(), 8);
    runs.push_back(std::move(run));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to read run history: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return runs;
}

auto RunHistory::prune(std::size_t keep) -> Result<std::size_t> {
  constexpr auto sql = R"(
    DELETE FROM task_runs WHERE id NOT IN (
      SELECT id FROM task_runs ORDER BY id DESC LIMIT ?
    );
  )";

  std::lock_guard lock(mu_);
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(keep));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to prune run history: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

}  // namespace ferry
