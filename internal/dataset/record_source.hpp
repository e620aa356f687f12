#pragma once

#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace tripgraph::dataset {

/*
  Lazy, finite, restartable sequence of raw records.

  Next() returns std::nullopt once the source is exhausted and throws:
    util::RecordMalformed    this record is unreadable; the next call moves on
    util::SourceUnavailable  reading cannot continue
*/
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  virtual std::optional<google::protobuf::Struct> Next() = 0;

  // Rewind to the first record.
  virtual void Reset() = 0;

  // For logs: path or kind of the source.
  virtual std::string Describe() const = 0;
};

} // namespace tripgraph::dataset
