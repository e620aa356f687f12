#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "record_source.hpp"

namespace tripgraph::dataset {

class InMemorySource final : public RecordSource {
 public:
  explicit InMemorySource(std::vector<google::protobuf::Struct> records) : records_(std::move(records)) {
  }

  std::optional<google::protobuf::Struct> Next() override {
    if (cursor_ >= records_.size()) {
      return std::nullopt;
    }
    return records_[cursor_++];
  }

  void Reset() override {
    cursor_ = 0;
  }

  std::string Describe() const override {
    return "memory:" + std::to_string(records_.size());
  }

 private:
  std::vector<google::protobuf::Struct> records_;
  std::size_t                           cursor_ = 0;
};

/*
  Caps a source at `limit` records. Unreadable records count toward the
  limit as well.
*/
class LimitedSource final : public RecordSource {
 public:
  LimitedSource(std::unique_ptr<RecordSource> inner, std::uint64_t limit) : inner_(std::move(inner)), limit_(limit) {
  }

  std::optional<google::protobuf::Struct> Next() override {
    if (taken_ >= limit_) {
      return std::nullopt;
    }
    try {
      auto record = inner_->Next();
      if (record) {
        ++taken_;
      }
      return record;
    } catch (const util::RecordMalformed&) {
      ++taken_;
      throw;
    }
  }

  void Reset() override {
    inner_->Reset();
    taken_ = 0;
  }

  std::string Describe() const override {
    return inner_->Describe() + " limit=" + std::to_string(limit_);
  }

 private:
  std::unique_ptr<RecordSource> inner_;
  std::uint64_t                 limit_;
  std::uint64_t                 taken_ = 0;
};

} // namespace tripgraph::dataset
