#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>

#include <google/protobuf/struct.pb.h>

namespace tripgraph::ingest {

struct IngestTask {
  std::uint64_t            index = 0;
  google::protobuf::Struct record;
};

/*
  Bounded blocking hand-off between the reader and the write workers.
*/
class IngestQueue {
 public:
  explicit IngestQueue(std::size_t capacity);

  // Blocks while full. False once Shutdown() was called.
  bool Enqueue(IngestTask task);

  // Blocks while empty. std::nullopt after Shutdown() once drained.
  std::optional<IngestTask> Dequeue();

  void Shutdown();

 private:
  std::size_t             capacity_;
  std::mutex              mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<IngestTask>  queue_;
  bool                    shutdown_ = false;
};

} // namespace tripgraph::ingest
