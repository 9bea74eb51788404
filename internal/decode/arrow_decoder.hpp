#pragma once

#include <arrow/array.h>
#include <arrow/io/buffered.h>
#include <arrow/ipc/reader.h>
#include <arrow/record_batch.h>
#include <arrow/type.h>

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/decode/row_decoder.hpp"

namespace ferry::decode {

/*
  Reads an Arrow IPC stream from a pipe, one RecordBatch at a time.

  The stream header is read lazily on first use. An engine that wrote
  nothing at all yields an empty stream with no schema.
*/
class ArrowBatchDecoder {
 public:
  explicit ArrowBatchDecoder(int fd);

  // nullptr at end of stream. Throws DecodeError on a malformed stream.
  std::shared_ptr<arrow::RecordBatch> Next();

  // nullptr when the stream was empty.
  std::shared_ptr<arrow::Schema> schema();

 private:
  void Open();

  int                                                  fd_;
  std::shared_ptr<arrow::io::BufferedInputStream>      input_;
  std::shared_ptr<arrow::ipc::RecordBatchStreamReader> reader_;
  bool                                                 opened_{false};
};

// Row view over the batch stream.
class ArrowRowDecoder : public RowDecoder {
 public:
  explicit ArrowRowDecoder(int fd) : batches_(fd) {
  }

  std::optional<model::Record> Next() override;

 private:
  ArrowBatchDecoder                   batches_;
  std::shared_ptr<arrow::RecordBatch> batch_;
  model::SchemaPtr                    schema_;
  int64_t                             row_{0};
};

model::ColumnType ToColumnType(const arrow::DataType& type);

model::SchemaPtr ToRecordSchema(const arrow::Schema& schema);

// Cell value at `row`; unsupported types are rendered as text.
model::Value ValueAt(const arrow::Array& array, int64_t row);

} // namespace ferry::decode
