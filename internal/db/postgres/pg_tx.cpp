#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tripgraph::db::postgres {

using ReadOnlyWork = pqxx::transaction<pqxx::isolation_level::repeatable_read, pqxx::write_policy::read_only>;

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, bool read_only) : read_only_(read_only) {
  conn_ = pool->Acquire();
  if (read_only_) {
    tx_ = std::make_unique<ReadOnlyWork>(*conn_);
  } else {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  }
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      TRIPGRAPH_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::WriteConflict(ErrorCode::SerializationFailure, e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::WriteConflict(ErrorCode::Conflict, e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::SourceUnavailable(e.what());
  } catch (const pqxx::failure& e) {
    throw util::WriteConflict(ErrorCode::InternalError, e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  committed_ = true;
  tx_->abort();
}

} // namespace tripgraph::db::postgres
