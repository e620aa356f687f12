#include "memory_tx.hpp"

#include <stdexcept>

namespace tripgraph::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  if (!read_only_) {
    writer_lock_ = std::unique_lock(repo_.writer_mutex_);
  }
  std::scoped_lock lock(repo_.state_mutex_);
  base_            = repo_.committed_;
  pending_.next_id = base_->next_id;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_) {
    throw std::logic_error("memory transaction already finished");
  }

  if (!read_only_) {
    base_.reset();
    std::scoped_lock lock(repo_.state_mutex_);
    if (repo_.committed_.use_count() > 1) {
      // a reader still pins the current snapshot
      repo_.committed_ = std::make_shared<MemoryRepository::State>(*repo_.committed_);
    }
    Merge(*repo_.committed_, std::move(pending_));
  }

  base_.reset();
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  pending_ = MemoryRepository::State{};
  base_.reset();
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Merge(MemoryRepository::State& into, MemoryRepository::State&& layer) {
  into.next_id = layer.next_id;
  into.labels.merge(layer.labels);
  into.cities.merge(layer.cities);
  into.city_by_name.merge(layer.city_by_name);
  into.trip_plans.merge(layer.trip_plans);
  into.day_plans.merge(layer.day_plans);
  into.activities.merge(layer.activities);
  into.references.merge(layer.references);
  into.relationships.merge(layer.relationships);
}

} // namespace tripgraph::db::memory
