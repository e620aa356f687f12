#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

namespace tripgraph::db::sqlite {

// Failure reported by sqlite, with its primary result code.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

 private:
  int code_;
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  A connection carries at most one open transaction, so transactions hold
  Mutex() for their whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool read_only = false);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool IsReadOnly() const {
    return read_only_;
  }

  std::mutex& Mutex() {
    return mutex_;
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // WAL, foreign keys, busy timeout
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        read_only_;
  std::mutex  mutex_;
};

/*
  Prepared statement owned for one call site.
*/
class SqliteStatement {
 public:
  SqliteStatement(sqlite3* db, const char* sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&)            = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  void Bind(int idx, const std::string& value);
  void Bind(int idx, std::int64_t value);
  void Bind(int idx, double value);
  void BindNull(int idx);

  // SQLITE_ROW, SQLITE_DONE or an error code
  int Step();

  std::string  Text(int col) const;
  std::int64_t Int64(int col) const;
  double       Double(int col) const;
  bool         IsNull(int col) const;

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace tripgraph::db::sqlite
