#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace tripgraph::db::postgres {

/*
  Writers run in pqxx::work (READ COMMITTED); city uniqueness is carried
  by the UNIQUE(name) constraint, not by isolation.
  Readers run REPEATABLE READ, READ ONLY so a query sees one snapshot.
*/
class PgTransaction final : public db::Transaction {
 public:
  PgTransaction(std::shared_ptr<PgPool> pool, bool read_only);
  ~PgTransaction();

  pqxx::transaction_base& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsReadOnly() const override {
    return read_only_;
  }

 private:
  std::shared_ptr<pqxx::connection>       conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  bool                                    read_only_;
  bool                                    committed_ = false;
};

} // namespace tripgraph::db::postgres
