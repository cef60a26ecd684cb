#include "benchdock/storage/score_store.hpp"

#include "benchdock/util/log.hpp"
#include "benchdock/util/util.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace benchdock {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto folds_to_text(const std::vector<int>& folds) -> std::string {
  return nlohmann::json(folds).dump();
}

auto folds_from_text(const std::string& text) -> std::vector<int> {
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_array()) {
    return {};
  }
  std::vector<int> folds;
  for (const auto& f : j) {
    if (f.is_number_integer()) {
      folds.push_back(f.get<int>());
    }
  }
  return folds;
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> int {
  return sqlite3_bind_text(stmt, idx, value.data(),
                           static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

}  // namespace

auto ScoreStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

ScoreStore::Statement::~Statement() {
  reset();
}

auto ScoreStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

ScoreStore::ScoreStore(std::string_view db_path) : db_path_(db_path) {}

ScoreStore::~ScoreStore() {
  close();
}

auto ScoreStore::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  if (sqlite3_open(db_path_.c_str(), &raw_db) != SQLITE_OK) {
    log::error("Failed to open score database {}: {}", db_path_,
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

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::debug("Score database opened: {}", db_path_);
  return ok();
}

auto ScoreStore::close() -> void {
  db_.reset();
}

auto ScoreStore::execute(std::string_view sql) -> Result<void> {
  char* err = nullptr;
  std::string stmt{sql};
  if (sqlite3_exec(db_.get(), stmt.c_str(), nullptr, nullptr, &err) !=
      SQLITE_OK) {
    log::error("SQL error: {}", err ? err : "unknown");
    sqlite3_free(err);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto ScoreStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto ScoreStore::create_tables() -> Result<void> {
  return execute(R"(
    CREATE TABLE IF NOT EXISTS runs (
      id TEXT PRIMARY KEY,
      framework TEXT NOT NULL,
      benchmark TEXT NOT NULL,
      task TEXT,
      saved_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS job_results (
      run_id TEXT NOT NULL,
      job_id TEXT NOT NULL,
      seq INTEGER NOT NULL,
      task TEXT DEFAULT '',
      folds TEXT DEFAULT '[]',
      state TEXT NOT NULL,
      exit_code INTEGER DEFAULT -1,
      duration_ms INTEGER DEFAULT 0,
      started_at INTEGER DEFAULT 0,
      error TEXT DEFAULT '',
      PRIMARY KEY (run_id, job_id),
      FOREIGN KEY (run_id) REFERENCES runs(id)
    );

    CREATE INDEX IF NOT EXISTS idx_job_results_run ON job_results(run_id);
  )");
}

auto ScoreStore::save_scoreboard(const Scoreboard& board) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseOpenFailed);
  }
  if (auto r = execute("BEGIN TRANSACTION;"); !r) {
    return r;
  }

  auto save_rows = [&]() -> Result<void> {
    auto run_stmt = prepare(
        "INSERT OR REPLACE INTO runs (id, framework, benchmark, task, "
        "saved_at) VALUES (?, ?, ?, ?, ?)");
    if (!run_stmt) {
      return fail(run_stmt.error());
    }
    Statement run{*run_stmt};
    bind_text(run.get(), 1, board.run_id.value());
    bind_text(run.get(), 2, board.framework);
    bind_text(run.get(), 3, board.benchmark);
    if (board.task) {
      bind_text(run.get(), 4, *board.task);
    } else {
      sqlite3_bind_null(run.get(), 4);
    }
    sqlite3_bind_int64(run.get(), 5,
                       to_millis(std::chrono::system_clock::now()));
    if (sqlite3_step(run.get()) != SQLITE_DONE) {
      log::error("Failed to save run {}: {}", board.run_id,
                 sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }

    auto del_stmt = prepare("DELETE FROM job_results WHERE run_id = ?");
    if (!del_stmt) {
      return fail(del_stmt.error());
    }
    Statement del{*del_stmt};
    bind_text(del.get(), 1, board.run_id.value());
    if (sqlite3_step(del.get()) != SQLITE_DONE) {
      log::error("Failed to clear previous results of run {}: {}",
                 board.run_id, sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }

    auto row_stmt = prepare(
        "INSERT INTO job_results (run_id, job_id, seq, task, folds, state, "
        "exit_code, duration_ms, started_at, error) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!row_stmt) {
      return fail(row_stmt.error());
    }
    Statement stmt{*row_stmt};
    int seq = 0;
    for (const auto& row : board.rows) {
      sqlite3_reset(stmt.get());
      sqlite3_clear_bindings(stmt.get());
      bind_text(stmt.get(), 1, board.run_id.value());
      bind_text(stmt.get(), 2, row.job_id);
      sqlite3_bind_int(stmt.get(), 3, seq++);
      bind_text(stmt.get(), 4, row.task);
      bind_text(stmt.get(), 5, folds_to_text(row.folds));
      bind_text(stmt.get(), 6, to_string_view(row.state));
      sqlite3_bind_int(stmt.get(), 7, row.exit_code);
      sqlite3_bind_int64(stmt.get(), 8, row.duration_ms);
      sqlite3_bind_int64(stmt.get(), 9, to_millis(row.started_at));
      bind_text(stmt.get(), 10, row.error);
      if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        log::error("Failed to save result of job {}: {}", row.job_id,
                   sqlite3_errmsg(db_.get()));
        return fail(Error::DatabaseQueryFailed);
      }
    }
    return ok();
  };

  if (auto r = save_rows(); !r) {
    if (auto rb = execute("ROLLBACK;"); !rb) {
      log::error("Rollback failed: {}", rb.error().message());
    }
    return r;
  }
  if (auto r = execute("COMMIT;"); !r) {
    return r;
  }

  log::info("Saved {} job result(s) of run {} to {}", board.rows.size(),
            board.run_id, db_path_);
  return ok();
}

auto ScoreStore::load_run(std::string_view run_id) -> Result<Scoreboard> {
  if (!db_) {
    return fail(Error::DatabaseOpenFailed);
  }

  auto run_stmt =
      prepare("SELECT framework, benchmark, task FROM runs WHERE id = ?");
  if (!run_stmt) {
    return fail(run_stmt.error());
  }
  Statement run{*run_stmt};
  bind_text(run.get(), 1, run_id);
  if (sqlite3_step(run.get()) != SQLITE_ROW) {
    return fail(Error::NotFound);
  }

  Scoreboard board;
  board.run_id = RunId{std::string{run_id}};
  board.framework = col_text(run.get(), 0);
  board.benchmark = col_text(run.get(), 1);
  if (sqlite3_column_type(run.get(), 2) != SQLITE_NULL) {
    board.task = col_text(run.get(), 2);
  }

  auto rows_stmt = prepare(
      "SELECT job_id, task, folds, state, exit_code, duration_ms, "
      "started_at, error FROM job_results WHERE run_id = ? ORDER BY seq");
  if (!rows_stmt) {
    return fail(rows_stmt.error());
  }
  Statement rows{*rows_stmt};
  bind_text(rows.get(), 1, run_id);

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(rows.get())) == SQLITE_ROW) {
    board.rows.push_back(ScoreRow{
        .job_id = col_text(rows.get(), 0),
        .task = col_text(rows.get(), 1),
        .folds = folds_from_text(col_text(rows.get(), 2)),
        .state = parse_job_state(col_text(rows.get(), 3)),
        .exit_code = sqlite3_column_int(rows.get(), 4),
        .duration_ms = sqlite3_column_int64(rows.get(), 5),
        .error = col_text(rows.get(), 7),
        .started_at = from_millis(sqlite3_column_int64(rows.get(), 6)),
    });
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to load results of run {}: {}", run_id,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok(std::move(board));
}

auto ScoreStore::list_runs() -> Result<std::vector<RunSummary>> {
  if (!db_) {
    return fail(Error::DatabaseOpenFailed);
  }

  auto prepared = prepare(
      "SELECT r.id, r.framework, r.benchmark, COUNT(j.job_id), "
      "COALESCE(SUM(CASE WHEN j.state != 'success' THEN 1 ELSE 0 END), 0) "
      "FROM runs r LEFT JOIN job_results j ON j.run_id = r.id "
      "GROUP BY r.id ORDER BY r.saved_at DESC");
  if (!prepared) {
    return fail(prepared.error());
  }
  Statement stmt{*prepared};

  std::vector<RunSummary> runs;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    runs.push_back(RunSummary{
        .run_id = col_text(stmt.get(), 0),
        .framework = col_text(stmt.get(), 1),
        .benchmark = col_text(stmt.get(), 2),
        .jobs = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 3)),
        .failed =
            static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 4)),
    });
  }
  if (rc != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return ok(std::move(runs));
}

}  // namespace benchdock
