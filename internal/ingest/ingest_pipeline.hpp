#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/dataset/record_source.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/graph_writer.hpp"
#include "internal/util/errors.hpp"

namespace tripgraph::ingest {

struct IngestOptions {
  // 0 and 1 both mean: normalize and write on the calling thread.
  std::size_t               workers        = 1;
  std::uint32_t             max_attempts   = 3;
  std::size_t               queue_capacity = 64;
  std::chrono::milliseconds retry_backoff{10};
};

enum class SkipCategory {
  kRecordMalformed,
  kWriteConflict,
};

std::string_view SkipCategoryName(SkipCategory category);

struct SkippedRecord {
  std::uint64_t index = 0;
  SkipCategory  category = SkipCategory::kRecordMalformed;
  std::string   reason;
};

struct IngestReport {
  std::uint64_t              records_read     = 0;
  std::uint64_t              records_written  = 0;
  std::uint64_t              malformed_fields = 0;
  std::vector<SkippedRecord> skipped; // ascending index
  bool                       cancelled = false;
};

// A run stopped by SourceUnavailable; carries what happened before the stop.
class IngestAborted : public util::SourceUnavailable {
 public:
  IngestAborted(const std::string& msg, IngestReport report) : util::SourceUnavailable(msg), report_(std::move(report)) {
  }

  const IngestReport& Report() const {
    return report_;
  }

 private:
  IngestReport report_;
};

/*
  IngestPipeline

  Drives source -> Normalize -> GraphWriter for every record of a run.

  Each record is its own write transaction. Transient store errors
  (busy, serialization failure) are retried up to max_attempts; after that
  the record is skipped with a WriteConflict entry. An unreadable record is
  skipped with a RecordMalformed entry.

  Cancellation is polled between records. Records already handed to the
  workers still complete.

  Throws IngestAborted when the dataset or the store goes away; workers are
  joined first and the partial report travels with the exception.
*/
class IngestPipeline {
 public:
  IngestPipeline(std::shared_ptr<db::GraphRepository> repository, IngestOptions options);

  IngestReport Run(dataset::RecordSource& source, const std::atomic<bool>* cancel = nullptr);

 private:
  struct RunState;

  void RunSequential(dataset::RecordSource& source, const std::atomic<bool>* cancel, RunState& state);
  void RunParallel(dataset::RecordSource& source, const std::atomic<bool>* cancel, RunState& state);

  // Reads one record; false once the source is exhausted.
  bool ReadNext(dataset::RecordSource& source, RunState& state, std::uint64_t& index, google::protobuf::Struct& record);

  void Process(std::uint64_t index, const google::protobuf::Struct& record, RunState& state);

  GraphWriter   writer_;
  IngestOptions options_;
};

} // namespace tripgraph::ingest
