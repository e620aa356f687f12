#pragma once

#include <memory>

#include "record_source.hpp"

namespace tripgraph::runtime::config {
class DatasetConfig;
}

namespace tripgraph::dataset {

/*
  Opens the configured dataset. With DATASET_FORMAT_UNSPECIFIED the format
  follows the file extension: ".csv" is CSV, anything else JSON Lines.

  Throws util::SourceUnavailable if the file cannot be opened and
  util::InvalidArgument if no path is configured.
*/
std::unique_ptr<RecordSource> OpenSource(const tripgraph::runtime::config::DatasetConfig& config);

} // namespace tripgraph::dataset
