#include "arrow_decoder.hpp"

#include <arrow/memory_pool.h>
#include <arrow/scalar.h>

#include <limits>
#include <string>
#include <vector>

#include "internal/transport/fd_stream.hpp"
#include "internal/util/errors.hpp"

namespace ferry::decode {

using ferry::util::DecodeError;

namespace {

constexpr int64_t kReadBufferSize = 64 * 1024;

// Anything the IPC reader rejects is malformed output, whatever status code Arrow picked.
void Check(const arrow::Status& status, const char* context) {
  if (!status.ok()) throw DecodeError(std::string(context) + ": " + status.ToString(), 0);
}

template <typename T>
T Check(arrow::Result<T> result, const char* context) {
  Check(result.status(), context);
  return std::move(result).ValueOrDie();
}

int64_t ToMicros(int64_t value, arrow::TimeUnit::type unit) {
  switch (unit) {
    case arrow::TimeUnit::SECOND:
      return value * 1000000;
    case arrow::TimeUnit::MILLI:
      return value * 1000;
    case arrow::TimeUnit::MICRO:
      return value;
    case arrow::TimeUnit::NANO:
      return value / 1000;
  }
  return value;
}

template <typename ArrayType>
int64_t IntegerAt(const arrow::Array& array, int64_t row) {
  return static_cast<int64_t>(static_cast<const ArrayType&>(array).Value(row));
}

} // namespace

// ------------------------------------------------------------
// Batch decoder
// ------------------------------------------------------------

ArrowBatchDecoder::ArrowBatchDecoder(int fd) : fd_(fd) {
}

void ArrowBatchDecoder::Open() {
  if (opened_) return;
  opened_ = true;

  auto raw = std::make_shared<transport::PipeInputStream>(fd_);
  input_   = Check(
      arrow::io::BufferedInputStream::Create(kReadBufferSize, arrow::default_memory_pool(), raw), "open stdout");

  auto head = Check(input_->Peek(1), "read stdout");
  if (head.empty()) return;

  reader_ = Check(arrow::ipc::RecordBatchStreamReader::Open(input_), "read Arrow stream header");
}

std::shared_ptr<arrow::Schema> ArrowBatchDecoder::schema() {
  Open();
  return reader_ ? reader_->schema() : nullptr;
}

std::shared_ptr<arrow::RecordBatch> ArrowBatchDecoder::Next() {
  Open();
  if (!reader_) return nullptr;

  std::shared_ptr<arrow::RecordBatch> batch;
  Check(reader_->ReadNext(&batch), "read Arrow record batch");
  return batch;
}

// ------------------------------------------------------------
// Row decoder
// ------------------------------------------------------------

std::optional<model::Record> ArrowRowDecoder::Next() {
  while (!batch_ || row_ >= batch_->num_rows()) {
    batch_ = batches_.Next();
    row_   = 0;
    if (!batch_) return std::nullopt;
    if (!schema_) schema_ = ToRecordSchema(*batch_->schema());
  }

  std::vector<model::Value> values;
  values.reserve(batch_->num_columns());
  for (int i = 0; i < batch_->num_columns(); ++i) {
    values.push_back(ValueAt(*batch_->column(i), row_));
  }
  ++row_;
  return model::Record(schema_, std::move(values));
}

// ------------------------------------------------------------
// Type mapping
// ------------------------------------------------------------

model::ColumnType ToColumnType(const arrow::DataType& type) {
  switch (type.id()) {
    case arrow::Type::NA:
      return model::ColumnType::kNull;
    case arrow::Type::BOOL:
      return model::ColumnType::kBool;
    case arrow::Type::INT8:
    case arrow::Type::INT16:
    case arrow::Type::INT32:
    case arrow::Type::INT64:
    case arrow::Type::UINT8:
    case arrow::Type::UINT16:
    case arrow::Type::UINT32:
    case arrow::Type::UINT64:
      return model::ColumnType::kInt64;
    case arrow::Type::FLOAT:
    case arrow::Type::DOUBLE:
      return model::ColumnType::kFloat64;
    case arrow::Type::TIMESTAMP:
    case arrow::Type::DATE32:
    case arrow::Type::DATE64:
      return model::ColumnType::kTimestamp;
    default:
      return model::ColumnType::kString;
  }
}

model::SchemaPtr ToRecordSchema(const arrow::Schema& schema) {
  model::Schema columns;
  columns.reserve(schema.num_fields());
  for (const auto& field : schema.fields()) {
    columns.push_back({field->name(), ToColumnType(*field->type())});
  }
  return model::MakeSchema(std::move(columns));
}

model::Value ValueAt(const arrow::Array& array, int64_t row) {
  if (array.IsNull(row)) return std::monostate{};

  switch (array.type_id()) {
    case arrow::Type::NA:
      return std::monostate{};
    case arrow::Type::BOOL:
      return static_cast<const arrow::BooleanArray&>(array).Value(row);
    case arrow::Type::INT8:
      return IntegerAt<arrow::Int8Array>(array, row);
    case arrow::Type::INT16:
      return IntegerAt<arrow::Int16Array>(array, row);
    case arrow::Type::INT32:
      return IntegerAt<arrow::Int32Array>(array, row);
    case arrow::Type::INT64:
      return IntegerAt<arrow::Int64Array>(array, row);
    case arrow::Type::UINT8:
      return IntegerAt<arrow::UInt8Array>(array, row);
    case arrow::Type::UINT16:
      return IntegerAt<arrow::UInt16Array>(array, row);
    case arrow::Type::UINT32:
      return IntegerAt<arrow::UInt32Array>(array, row);
    case arrow::Type::UINT64: {
      const auto value = static_cast<const arrow::UInt64Array&>(array).Value(row);
      if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::to_string(value);
      }
      return static_cast<int64_t>(value);
    }
    case arrow::Type::FLOAT:
      return static_cast<double>(static_cast<const arrow::FloatArray&>(array).Value(row));
    case arrow::Type::DOUBLE:
      return static_cast<const arrow::DoubleArray&>(array).Value(row);
    case arrow::Type::STRING:
      return static_cast<const arrow::StringArray&>(array).GetString(row);
    case arrow::Type::LARGE_STRING:
      return static_cast<const arrow::LargeStringArray&>(array).GetString(row);
    case arrow::Type::TIMESTAMP: {
      const auto& type = static_cast<const arrow::TimestampType&>(*array.type());
      return model::Timestamp{ToMicros(static_cast<const arrow::TimestampArray&>(array).Value(row), type.unit())};
    }
    case arrow::Type::DATE32:
      return model::Timestamp{int64_t{static_cast<const arrow::Date32Array&>(array).Value(row)} * 86400 * 1000000};
    case arrow::Type::DATE64:
      return model::Timestamp{static_cast<const arrow::Date64Array&>(array).Value(row) * 1000};
    default: {
      auto scalar = Check(array.GetScalar(row), "read Arrow value");
      return scalar->ToString();
    }
  }
}

} // namespace ferry::decode
