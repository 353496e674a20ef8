#include "core/sqlite.hpp"

#include <filesystem>
#include <iostream>

#include <sqlite3.h>

#include "core/errors.hpp"

namespace fleet_hub::core {
namespace {

std::string error_message(sqlite3* db, const std::string& context) {
  const char* message = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
  return context + ": " + (message != nullptr ? message : "unknown sqlite error");
}

}  // namespace

void SqliteDatabase::ConnectionDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

SqliteDatabase::SqliteDatabase(const std::string& path, const std::chrono::milliseconds busy_timeout)
    : path_(path) {
  if (path != ":memory:") {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw StorageError("unable to create database directory " + parent.string() + ": " + ec.message());
      }
    }
  }

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  db_.reset(raw);
  if (rc != SQLITE_OK) {
    throw StorageError(error_message(raw, "sqlite open " + path));
  }

  sqlite3_busy_timeout(db_.get(), static_cast<int>(busy_timeout.count()));
  if (path != ":memory:") {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
  }
  exec("PRAGMA foreign_keys=ON;");
}

SqliteDatabase::~SqliteDatabase() = default;

void SqliteDatabase::exec(const std::string& sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
    const std::string message = error != nullptr ? error : "sqlite exec failed";
    sqlite3_free(error);
    throw StorageError(message);
  }
}

bool SqliteDatabase::table_exists(const std::string& table) {
  Statement stmt(*this, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
  stmt.bind(1, table);
  return stmt.step();
}

std::int64_t SqliteDatabase::last_insert_rowid() const {
  return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_.get()));
}

int SqliteDatabase::changes() const {
  return sqlite3_changes(db_.get());
}

Statement::Statement(SqliteDatabase& db, const std::string& sql) : db_(db) {
  if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
    throw StorageError(error_message(db.handle(), "sqlite prepare failed"));
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

Statement& Statement::bind(const int index, const std::int64_t value) {
  sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
  return *this;
}

Statement& Statement::bind(const int index, const double value) {
  sqlite3_bind_double(stmt_, index, value);
  return *this;
}

Statement& Statement::bind(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  return *this;
}

Statement& Statement::bind_null(const int index) {
  sqlite3_bind_null(stmt_, index);
  return *this;
}

bool Statement::step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw StorageError(error_message(db_.handle(), "sqlite step failed"));
}

void Statement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::int64_t Statement::column_int64(const int index) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

double Statement::column_double(const int index) const {
  return sqlite3_column_double(stmt_, index);
}

std::string Statement::column_text(const int index) const {
  const unsigned char* text = sqlite3_column_text(stmt_, index);
  if (text == nullptr) {
    return {};
  }
  return reinterpret_cast<const char*>(text);
}

bool Statement::column_is_null(const int index) const {
  return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

Transaction::Transaction(SqliteDatabase& db) : db_(db) {
  db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
  if (committed_) {
    return;
  }
  char* error = nullptr;
  if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
    std::cerr << "[sqlite] rollback failed: " << (error != nullptr ? error : "unknown") << '\n';
    sqlite3_free(error);
  }
}

void Transaction::commit() {
  db_.exec("COMMIT;");
  committed_ = true;
}

}  // namespace fleet_hub::core
