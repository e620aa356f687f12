#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>

#include "record_source.hpp"

namespace tripgraph::dataset {

/*
  One JSON object per line. Blank lines are skipped; a line that is not a
  JSON object is reported as RecordMalformed.
*/
class JsonLinesSource final : public RecordSource {
 public:
  explicit JsonLinesSource(std::filesystem::path path);

  std::optional<google::protobuf::Struct> Next() override;
  void                                    Reset() override;
  std::string                             Describe() const override;

 private:
  void Open();

  std::filesystem::path path_;
  std::ifstream         in_;
  std::uint64_t         line_number_ = 0;
};

} // namespace tripgraph::dataset
