#include "json_lines_source.hpp"

#include <string>

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace tripgraph::dataset {

JsonLinesSource::JsonLinesSource(std::filesystem::path path) : path_(std::move(path)) {
  Open();
}

void JsonLinesSource::Open() {
  if (in_.is_open()) {
    in_.close();
  }
  in_.clear();
  in_.open(path_);
  if (!in_) {
    throw util::SourceUnavailable("cannot open dataset " + path_.string());
  }
  line_number_ = 0;
}

std::optional<google::protobuf::Struct> JsonLinesSource::Next() {
  std::string line;
  while (std::getline(in_, line)) {
    ++line_number_;
    if (util::Trim(line).empty()) {
      continue;
    }

    google::protobuf::Struct record;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    const auto status = google::protobuf::util::JsonStringToMessage(line, &record, options);
    if (!status.ok()) {
      throw util::RecordMalformed(path_.string() + ":" + std::to_string(line_number_) + ": " + std::string(status.message()));
    }
    return record;
  }

  if (in_.bad()) {
    throw util::SourceUnavailable("read error on dataset " + path_.string());
  }
  return std::nullopt;
}

void JsonLinesSource::Reset() {
  Open();
}

std::string JsonLinesSource::Describe() const {
  return "jsonl:" + path_.string();
}

} // namespace tripgraph::dataset
