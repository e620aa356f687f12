#include "ingest_pipeline.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>

#include "internal/ingest/ingest_queue.hpp"
#include "internal/ingest/record_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace tripgraph::ingest {

struct IngestPipeline::RunState {
  std::mutex         mutex;
  IngestReport       report;
  std::exception_ptr fatal;
  std::atomic<bool>  failed{false};

  void Skip(std::uint64_t index, SkipCategory category, std::string reason) {
    std::lock_guard lock(mutex);
    report.skipped.push_back({.index = index, .category = category, .reason = std::move(reason)});
  }

  void Fail(std::exception_ptr error) {
    std::lock_guard lock(mutex);
    if (!fatal) {
      fatal = std::move(error);
    }
    failed = true;
  }
};

std::string_view SkipCategoryName(SkipCategory category) {
  switch (category) {
    case SkipCategory::kRecordMalformed:
      return "record_malformed";
    case SkipCategory::kWriteConflict:
      return "write_conflict";
  }
  return "unknown";
}

IngestPipeline::IngestPipeline(std::shared_ptr<db::GraphRepository> repository, IngestOptions options)
    : writer_(std::move(repository)), options_(options) {
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
  if (options_.queue_capacity == 0) {
    options_.queue_capacity = 1;
  }
}

IngestReport IngestPipeline::Run(dataset::RecordSource& source, const std::atomic<bool>* cancel) {
  RunState state;

  TRIPGRAPH_LOG_INFO("ingest started", {observability::StringField("source", source.Describe()),
                                        observability::UintField("workers", options_.workers)});

  source.Reset();
  if (options_.workers <= 1) {
    RunSequential(source, cancel, state);
  } else {
    RunParallel(source, cancel, state);
  }

  auto& report = state.report;
  std::sort(report.skipped.begin(), report.skipped.end(),
            [](const SkippedRecord& a, const SkippedRecord& b) { return a.index < b.index; });

  if (state.fatal) {
    try {
      std::rethrow_exception(state.fatal);
    } catch (const util::SourceUnavailable& e) {
      TRIPGRAPH_LOG_ERROR("ingest aborted", {observability::StringField("error", e.what()),
                                             observability::UintField("read", report.records_read),
                                             observability::UintField("written", report.records_written),
                                             observability::UintField("skipped", report.skipped.size())});
      throw IngestAborted(e.what(), std::move(report));
    }
  }

  TRIPGRAPH_LOG_INFO("ingest finished", {observability::UintField("read", report.records_read),
                                         observability::UintField("written", report.records_written),
                                         observability::UintField("skipped", report.skipped.size()),
                                         observability::UintField("malformed_fields", report.malformed_fields),
                                         observability::BoolField("cancelled", report.cancelled)});
  return std::move(state.report);
}

void IngestPipeline::RunSequential(dataset::RecordSource& source, const std::atomic<bool>* cancel, RunState& state) {
  std::uint64_t            index = 0;
  google::protobuf::Struct record;

  while (true) {
    if (cancel && cancel->load()) {
      state.report.cancelled = true;
      return;
    }
    try {
      if (!ReadNext(source, state, index, record)) {
        return;
      }
      Process(index, record, state);
    } catch (const util::SourceUnavailable&) {
      state.Fail(std::current_exception());
      return;
    }
  }
}

void IngestPipeline::RunParallel(dataset::RecordSource& source, const std::atomic<bool>* cancel, RunState& state) {
  IngestQueue              queue(options_.queue_capacity);
  std::vector<std::thread> workers;
  workers.reserve(options_.workers);

  for (std::size_t i = 0; i < options_.workers; ++i) {
    workers.emplace_back([this, &queue, &state] {
      while (auto task = queue.Dequeue()) {
        if (state.failed) {
          continue; // drain
        }
        try {
          Process(task->index, task->record, state);
        } catch (...) {
          state.Fail(std::current_exception());
        }
      }
    });
  }

  std::uint64_t            index = 0;
  google::protobuf::Struct record;
  try {
    while (!state.failed) {
      if (cancel && cancel->load()) {
        std::lock_guard lock(state.mutex);
        state.report.cancelled = true;
        break;
      }
      if (!ReadNext(source, state, index, record)) {
        break;
      }
      if (!queue.Enqueue({.index = index, .record = std::move(record)})) {
        break;
      }
      record.Clear();
    }
  } catch (...) {
    state.Fail(std::current_exception());
  }

  queue.Shutdown();
  for (auto& worker : workers) {
    worker.join();
  }
}

bool IngestPipeline::ReadNext(dataset::RecordSource& source, RunState& state, std::uint64_t& index, google::protobuf::Struct& record) {
  while (true) {
    try {
      auto next = source.Next();
      if (!next) {
        return false;
      }
      std::lock_guard lock(state.mutex);
      index = state.report.records_read++;
      record = std::move(*next);
      return true;
    } catch (const util::RecordMalformed& e) {
      std::uint64_t skipped_index;
      {
        std::lock_guard lock(state.mutex);
        skipped_index = state.report.records_read++;
      }
      TRIPGRAPH_LOG_WARN("record unreadable, skipped",
                         {observability::UintField("index", skipped_index), observability::StringField("error", e.what())});
      observability::Metrics::Instance().RecordIngestOutcome("malformed");
      state.Skip(skipped_index, SkipCategory::kRecordMalformed, e.what());
    }
  }
}

void IngestPipeline::Process(std::uint64_t index, const google::protobuf::Struct& record, RunState& state) {
  const auto trip = Normalize(record);
  for (const auto& issue : trip.issues) {
    TRIPGRAPH_LOG_WARN("malformed field recovered with default", {observability::UintField("index", index),
                                                                   observability::StringField("field", issue.field),
                                                                   observability::StringField("reason", issue.reason)});
  }
  if (!trip.issues.empty()) {
    std::lock_guard lock(state.mutex);
    state.report.malformed_fields += trip.issues.size();
  }

  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      const auto started = std::chrono::steady_clock::now();
      writer_.Write(trip);
      observability::Metrics::Instance().ObserveRecordWriteMs(
          std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
      observability::Metrics::Instance().RecordIngestOutcome("written");

      std::lock_guard lock(state.mutex);
      ++state.report.records_written;
      return;
    } catch (const util::WriteConflict& e) {
      if (e.Transient() && attempt < options_.max_attempts) {
        TRIPGRAPH_LOG_DEBUG("transient write failure, retrying",
                            {observability::UintField("index", index), observability::IntField("attempt", attempt),
                             observability::StringField("error", e.what())});
        std::this_thread::sleep_for(options_.retry_backoff * attempt);
        continue;
      }
      TRIPGRAPH_LOG_WARN("record write rolled back, skipped",
                         {observability::UintField("index", index), observability::StringField("code", db::ErrorCodeName(e.Code())),
                          observability::StringField("error", e.what())});
      observability::Metrics::Instance().RecordIngestOutcome("conflict");
      state.Skip(index, SkipCategory::kWriteConflict, e.what());
      return;
    }
  }
}

} // namespace tripgraph::ingest
