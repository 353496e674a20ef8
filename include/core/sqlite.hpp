#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace fleet_hub::core {

// One connection shared by the stores that live in the hub database. Callers
// hold mutex() for the duration of a statement sequence.
class SqliteDatabase {
 public:
  explicit SqliteDatabase(const std::string& path,
                          std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDatabase();

  SqliteDatabase(const SqliteDatabase&) = delete;
  SqliteDatabase& operator=(const SqliteDatabase&) = delete;

  void exec(const std::string& sql);
  [[nodiscard]] bool table_exists(const std::string& table);
  [[nodiscard]] std::int64_t last_insert_rowid() const;
  [[nodiscard]] int changes() const;

  sqlite3* handle() const { return db_.get(); }
  std::mutex& mutex() { return mutex_; }
  const std::string& path() const { return path_; }

 private:
  struct ConnectionDeleter {
    void operator()(sqlite3* db) const;
  };

  std::string path_;
  std::unique_ptr<sqlite3, ConnectionDeleter> db_;
  std::mutex mutex_;
};

class Statement {
 public:
  Statement(SqliteDatabase& db, const std::string& sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& bind(int index, std::int64_t value);
  Statement& bind(int index, double value);
  Statement& bind(int index, const std::string& value);
  Statement& bind_null(int index);

  // true while a row is available, false once the statement is done.
  bool step();
  void reset();

  [[nodiscard]] std::int64_t column_int64(int index) const;
  [[nodiscard]] double column_double(int index) const;
  [[nodiscard]] std::string column_text(int index) const;
  [[nodiscard]] bool column_is_null(int index) const;

 private:
  SqliteDatabase& db_;
  sqlite3_stmt* stmt_{nullptr};
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was reached.
class Transaction {
 public:
  explicit Transaction(SqliteDatabase& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

 private:
  SqliteDatabase& db_;
  bool committed_{false};
};

}  // namespace fleet_hub::core
