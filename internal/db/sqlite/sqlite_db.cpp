#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace sensorweave::db::sqlite {

namespace {

bool IsInMemory(const std::string& path) {
  return path.empty() || path == ":memory:" || path.rfind("file::memory:", 0) == 0;
}

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("sqlite: cannot create " + parent.string() + ": " + ec.message());
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  if (!IsInMemory(path_)) {
    EnsureParentDirectory(path_);
  }

  const auto* target = path_.empty() ? ":memory:" : path_.c_str();
  const int   rc     = sqlite3_open_v2(target, &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite: open " + path_ + ": " + message);
  }

  try {
    ApplyPragmas(busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  SENSORWEAVE_LOG_INFO("sqlite database opened", {observability::StringField("path", path_)});
}

SqliteDB::~SqliteDB() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void SqliteDB::Exec(const std::string& sql) {
  char*     error = nullptr;
  const int rc    = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
  if (rc == SQLITE_OK) {
    return;
  }
  const std::string message = error != nullptr ? error : sqlite3_errstr(rc);
  sqlite3_free(error);
  throw std::runtime_error("sqlite: " + message);
}

void SqliteDB::ApplyPragmas(std::chrono::milliseconds busy_timeout) {
  // WAL keeps discovery reads going while the heartbeat log is appended
  if (!IsInMemory(path_)) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite: busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace sensorweave::db::sqlite
