#pragma once

#include "ferry/core/error.hpp"
#include "ferry/scheduler/task.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace ferry {

// SQLite log of every execution attempt. Thread-safe.
class RunHistory {
public:
  explicit RunHistory(std::string_view db_path);
  ~RunHistory();

  RunHistory(const RunHistory&) = delete;
  RunHistory& operator=(const RunHistory&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const -> bool;

  [[nodiscard]] auto record(const RunRecord& run) -> Result<void>;

  // Newest first. An empty task_id lists every task.
  [[nodiscard]] auto list(std::string_view task_id = "",
                          std::size_t limit = 50)
      -> Result<std::vector<RunRecord>>;

  // Keeps the newest `keep` rows; returns how many were deleted.
  [[nodiscard]] auto prune(std::size_t keep) -> Result<std::size_t>;

  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return db_path_;
  }

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
  mutable std::mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace ferry
