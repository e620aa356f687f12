#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace tripgraph::db::memory {

/*
  Transaction = pinned snapshot + private write layer
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsReadOnly() const override {
    return read_only_;
  }

  const MemoryRepository::State& Base() const {
    return *base_;
  }
  const MemoryRepository::State& Pending() const {
    return pending_;
  }
  MemoryRepository::State& Mutable() {
    return pending_;
  }

 private:
  static void Merge(MemoryRepository::State& into, MemoryRepository::State&& layer);

  MemoryRepository&                              repo_;
  bool                                           read_only_;
  std::unique_lock<std::mutex>                   writer_lock_;
  std::shared_ptr<const MemoryRepository::State> base_;
  MemoryRepository::State                        pending_;
  bool                                           committed_ = false;
};

} // namespace tripgraph::db::memory
