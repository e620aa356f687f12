#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <arrow/csv/api.h>
#include <arrow/record_batch.h>

#include "record_source.hpp"

namespace tripgraph::dataset {

/*
  CSV with a header row, read in batches through arrow::csv::StreamingReader.

  The well-known record columns are read as text so batch type inference
  cannot disagree between blocks; quoted cells may span lines (the payload
  columns do). Rows with the wrong number of cells are dropped by the
  reader and surface here as RecordMalformed, one per row; so does a row
  with a cell that is not valid UTF-8.
*/
class CsvSource final : public RecordSource {
 public:
  explicit CsvSource(std::filesystem::path path);

  std::optional<google::protobuf::Struct> Next() override;
  void                                    Reset() override;
  std::string                             Describe() const override;

 private:
  void Open();

  std::filesystem::path                        path_;
  std::shared_ptr<arrow::csv::StreamingReader> reader_;
  std::shared_ptr<arrow::RecordBatch>          batch_;
  std::int64_t                                 row_     = 0;
  std::uint64_t                                records_ = 0; // data rows handed out, 1-based in messages

  // Written by the reader's invalid-row handler.
  std::shared_ptr<std::vector<std::string>> invalid_rows_;
};

} // namespace tripgraph::dataset
