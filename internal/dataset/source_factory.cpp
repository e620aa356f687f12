#include "source_factory.hpp"

#include <filesystem>

#include "config/config.pb.h"
#include "csv_source.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "json_lines_source.hpp"
#include "memory_source.hpp"

namespace tripgraph::dataset {

std::unique_ptr<RecordSource> OpenSource(const tripgraph::runtime::config::DatasetConfig& config) {
  if (config.path().empty()) {
    throw util::InvalidArgument("dataset.path is required");
  }

  const std::filesystem::path path(config.path());

  auto format = config.format();
  if (format == tripgraph::runtime::config::DATASET_FORMAT_UNSPECIFIED) {
    format = util::FoldCase(path.extension().string()) == ".csv" ? tripgraph::runtime::config::DATASET_FORMAT_CSV
                                                                 : tripgraph::runtime::config::DATASET_FORMAT_JSONL;
  }

  std::unique_ptr<RecordSource> source;
  if (format == tripgraph::runtime::config::DATASET_FORMAT_CSV) {
    source = std::make_unique<CsvSource>(path);
  } else {
    source = std::make_unique<JsonLinesSource>(path);
  }

  if (config.limit() > 0) {
    source = std::make_unique<LimitedSource>(std::move(source), config.limit());
  }
  return source;
}

} // namespace tripgraph::dataset
