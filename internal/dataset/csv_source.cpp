#include "csv_source.hpp"

#include <arrow/array.h>
#include <arrow/io/file.h>
#include <arrow/scalar.h>
#include <arrow/util/utf8.h>

#include <array>
#include <string>

#include "internal/util/errors.hpp"

namespace tripgraph::dataset {

namespace {

constexpr std::array<const char*, 12> kTextColumns = {
    "org",    "dest",  "days",  "visiting_city_number", "date",           "people_number",
    "local_constraint", "budget", "query", "level", "annotated_plan", "reference_information",
};

template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  if (!result.ok()) {
    throw util::SourceUnavailable(context + ": " + result.status().ToString());
  }
  return std::move(result).ValueUnsafe();
}

bool IsUtf8(const std::string& text) {
  return arrow::util::ValidateUTF8(reinterpret_cast<const std::uint8_t*>(text.data()), static_cast<std::int64_t>(text.size()));
}

google::protobuf::Value CellValue(const arrow::Array& column, std::int64_t row) {
  google::protobuf::Value value;
  if (column.IsNull(row)) {
    value.set_null_value(google::protobuf::NULL_VALUE);
    return value;
  }

  switch (column.type_id()) {
    case arrow::Type::STRING:
      value.set_string_value(static_cast<const arrow::StringArray&>(column).GetString(row));
      break;
    case arrow::Type::LARGE_STRING:
      value.set_string_value(static_cast<const arrow::LargeStringArray&>(column).GetString(row));
      break;
    case arrow::Type::INT64:
      value.set_number_value(static_cast<double>(static_cast<const arrow::Int64Array&>(column).Value(row)));
      break;
    case arrow::Type::DOUBLE:
      value.set_number_value(static_cast<const arrow::DoubleArray&>(column).Value(row));
      break;
    case arrow::Type::BOOL:
      value.set_bool_value(static_cast<const arrow::BooleanArray&>(column).Value(row));
      break;
    default: {
      auto scalar = column.GetScalar(row);
      value.set_string_value(scalar.ok() ? (*scalar)->ToString() : std::string());
      break;
    }
  }
  return value;
}

} // namespace

CsvSource::CsvSource(std::filesystem::path path) : path_(std::move(path)), invalid_rows_(std::make_shared<std::vector<std::string>>()) {
  Open();
}

void CsvSource::Open() {
  const auto context = "cannot open dataset " + path_.string();
  auto       input   = Unwrap(arrow::io::ReadableFile::Open(path_.string()), context);

  arrow::util::InitializeUTF8();

  auto read_options    = arrow::csv::ReadOptions::Defaults();
  auto parse_options   = arrow::csv::ParseOptions::Defaults();
  auto convert_options = arrow::csv::ConvertOptions::Defaults();

  // the invalid-row handler and Next() share invalid_rows_ without a lock
  read_options.use_threads            = false;
  parse_options.newlines_in_values    = true;
  convert_options.strings_can_be_null = false;
  // checked per cell in Next() so one bad cell skips one record, not the run
  convert_options.check_utf8 = false;
  for (const auto* name : kTextColumns) {
    convert_options.column_types[name] = arrow::utf8();
  }

  invalid_rows_->clear();
  auto invalid_rows                 = invalid_rows_;
  parse_options.invalid_row_handler = [invalid_rows](const arrow::csv::InvalidRow& row) {
    invalid_rows->push_back("line " + std::to_string(row.number) + ": expected " + std::to_string(row.expected_columns) +
                            " columns, got " + std::to_string(row.actual_columns));
    return arrow::csv::InvalidRowResult::Skip;
  };

  reader_ = Unwrap(arrow::csv::StreamingReader::Make(arrow::io::default_io_context(), input, read_options, parse_options, convert_options),
                   context);
  batch_.reset();
  row_     = 0;
  records_ = 0;
}

std::optional<google::protobuf::Struct> CsvSource::Next() {
  while (!batch_ || row_ >= batch_->num_rows()) {
    if (!invalid_rows_->empty()) {
      auto reason = invalid_rows_->front();
      invalid_rows_->erase(invalid_rows_->begin());
      throw util::RecordMalformed(path_.string() + ": " + reason);
    }

    std::shared_ptr<arrow::RecordBatch> next;
    const auto status = reader_->ReadNext(&next);
    if (!status.ok()) {
      throw util::SourceUnavailable("read error on dataset " + path_.string() + ": " + status.ToString());
    }
    if (!next) {
      return std::nullopt;
    }
    batch_ = std::move(next);
    row_   = 0;
  }

  const auto row = row_++;
  ++records_;

  google::protobuf::Struct record;
  auto&                    fields = *record.mutable_fields();
  const auto&              schema = *batch_->schema();
  for (int i = 0; i < batch_->num_columns(); ++i) {
    const auto& name = schema.field(i)->name();
    if (name.empty()) {
      continue; // pandas index column
    }
    auto value = CellValue(*batch_->column(i), row);
    if (value.kind_case() == google::protobuf::Value::kStringValue && !IsUtf8(value.string_value())) {
      throw util::RecordMalformed(path_.string() + ": record " + std::to_string(records_) + ": column '" + name +
                                  "' is not valid UTF-8");
    }
    fields[name] = std::move(value);
  }
  return record;
}

void CsvSource::Reset() {
  Open();
}

std::string CsvSource::Describe() const {
  return "csv:" + path_.string();
}

} // namespace tripgraph::dataset
