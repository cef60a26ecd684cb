#pragma once

#include "benchdock/core/error.hpp"
#include "benchdock/results/scoreboard.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace benchdock {

// SQLite-backed store of job results, one row per (run, job).
class ScoreStore {
public:
  explicit ScoreStore(std::string_view db_path);
  ~ScoreStore();

  ScoreStore(const ScoreStore&) = delete;
  ScoreStore& operator=(const ScoreStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  // Writes every row of `board` in one transaction. Saving the same run twice
  // replaces its rows.
  [[nodiscard]] auto save_scoreboard(const Scoreboard& board) -> Result<void>;

  [[nodiscard]] auto load_run(std::string_view run_id) -> Result<Scoreboard>;

  struct RunSummary {
    std::string run_id;
    std::string framework;
    std::string benchmark;
    std::size_t jobs{0};
    std::size_t failed{0};
  };
  [[nodiscard]] auto list_runs() -> Result<std::vector<RunSummary>>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace benchdock
