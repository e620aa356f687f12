#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tripgraph::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only)
    : db_(std::move(db)), lock_(db_->Mutex()), read_only_(read_only) {
  db_->Exec(read_only_ ? "BEGIN;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const SqliteError& e) {
      TRIPGRAPH_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    const auto code = (e.Code() == SQLITE_BUSY || e.Code() == SQLITE_LOCKED) ? ErrorCode::Busy : ErrorCode::InternalError;
    throw util::WriteConflict(code, std::string("sqlite commit: ") + e.what());
  }
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  committed_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace tripgraph::db::sqlite
