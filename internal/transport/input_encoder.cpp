#include "input_encoder.hpp"

#include <arrow/array/builder_binary.h>
#include <arrow/array/builder_primitive.h>
#include <arrow/ipc/writer.h>
#include <arrow/record_batch.h>
#include <arrow/type.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <locale>
#include <map>
#include <sstream>
#include <vector>

#include "internal/transport/fd_stream.hpp"
#include "internal/util/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ferry::transport {

using ferry::util::EncodeError;
using model::ColumnType;

namespace {

// ------------------------------------------------------------
// CSV
// ------------------------------------------------------------

class CsvInputEncoder : public InputEncoder {
 public:
  explicit CsvInputEncoder(int fd) : fd_(fd) {
  }

  bool Write(const model::Record& record) override {
    std::string line;
    if (header_.empty()) {
      header_ = record.ColumnNames();
      if (header_.empty()) {
        throw EncodeError("first input record has no columns");
      }
      for (std::size_t i = 0; i < header_.size(); ++i) {
        if (i > 0) line += ',';
        line += QuoteCsvField(model::Value(header_[i]));
      }
      line += '\n';
    }

    for (std::size_t i = 0; i < record.size(); ++i) {
      if (std::find(header_.begin(), header_.end(), record.name(i)) == header_.end()) {
        throw EncodeError("input record " + std::to_string(written_ + 1) + " has column '" + record.name(i) +
                          "' not present in the CSV header");
      }
    }

    for (std::size_t i = 0; i < header_.size(); ++i) {
      if (i > 0) line += ',';
      if (const auto* value = record.Find(header_[i])) {
        line += QuoteCsvField(*value);
      }
    }
    line += '\n';

    if (!WriteAll(fd_, line)) return false;
    ++written_;
    return true;
  }

  bool Finish() override {
    return true;
  }

  std::size_t records_written() const override {
    return written_;
  }

 private:
  int                      fd_;
  std::vector<std::string> header_;
  std::size_t              written_{0};
};

// ------------------------------------------------------------
// JSON Lines
// ------------------------------------------------------------

std::string QuotedJson(const std::string& text) {
  google::protobuf::Value value;
  value.set_string_value(text);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw EncodeError("cannot encode string as JSON: " + std::string(status.message()));
  }
  return json;
}

// Integers are written exactly; floats always carry a fraction or exponent.
std::string JsonScalar(const model::Value& value) {
  switch (model::TypeOf(value)) {
    case ColumnType::kNull:
      return "null";
    case ColumnType::kBool:
      return std::get<bool>(value) ? "true" : "false";
    case ColumnType::kInt64:
      return std::to_string(std::get<int64_t>(value));
    case ColumnType::kFloat64: {
      const double number = std::get<double>(value);
      if (!std::isfinite(number)) throw EncodeError("non-finite number has no JSON form");
      std::ostringstream out;
      out.imbue(std::locale::classic());
      out.precision(17);
      out << number;
      auto text = out.str();
      if (text.find_first_of(".eE") == std::string::npos) text += ".0";
      return text;
    }
    case ColumnType::kString:
      return QuotedJson(std::get<std::string>(value));
    case ColumnType::kTimestamp:
      return QuotedJson(ferry::util::FormatMicros(std::get<model::Timestamp>(value).micros));
  }
  return "null";
}

class JsonLinesInputEncoder : public InputEncoder {
 public:
  explicit JsonLinesInputEncoder(int fd) : fd_(fd) {
  }

  // Keys are written in record order.
  bool Write(const model::Record& record) override {
    std::string line = "{";
    try {
      for (std::size_t i = 0; i < record.size(); ++i) {
        if (i > 0) line += ',';
        line += QuotedJson(record.name(i));
        line += ':';
        line += JsonScalar(record.at(i));
      }
    } catch (const EncodeError& e) {
      throw EncodeError("input record " + std::to_string(written_ + 1) + ": " + e.what());
    }
    line += "}\n";

    if (!WriteAll(fd_, line)) return false;
    ++written_;
    return true;
  }

  bool Finish() override {
    return true;
  }

  std::size_t records_written() const override {
    return written_;
  }

 private:
  int         fd_;
  std::size_t written_{0};
};

// ------------------------------------------------------------
// Arrow IPC stream
// ------------------------------------------------------------

ColumnType Widen(ColumnType current, ColumnType next) {
  if (current == ColumnType::kNull) return next;
  if (next == ColumnType::kNull || next == current) return current;

  const bool numeric_pair = (current == ColumnType::kInt64 && next == ColumnType::kFloat64) ||
                            (current == ColumnType::kFloat64 && next == ColumnType::kInt64);
  return numeric_pair ? ColumnType::kFloat64 : ColumnType::kString;
}

std::shared_ptr<arrow::DataType> ToArrowType(ColumnType type) {
  switch (type) {
    case ColumnType::kBool:
      return arrow::boolean();
    case ColumnType::kInt64:
      return arrow::int64();
    case ColumnType::kFloat64:
      return arrow::float64();
    case ColumnType::kTimestamp:
      return arrow::timestamp(arrow::TimeUnit::MICRO, "UTC");
    case ColumnType::kNull:
    case ColumnType::kString:
      return arrow::utf8();
  }
  return arrow::utf8();
}

class ArrowInputEncoder : public InputEncoder {
 public:
  ArrowInputEncoder(int fd, std::size_t batch_rows)
      : sink_(std::make_shared<PipeOutputStream>(fd)), batch_rows_(std::max<std::size_t>(1, batch_rows)) {
  }

  bool Write(const model::Record& record) override {
    pending_.push_back(record);
    if (pending_.size() >= batch_rows_) {
      return Flush();
    }
    return true;
  }

  bool Finish() override {
    if (!Flush()) return false;
    if (!writer_ && !OpenWriter(arrow::schema(arrow::FieldVector{}))) return false;

    auto status = writer_->Close();
    if (status.IsCancelled()) return false;
    ferry::util::Unwrap<EncodeError>(status, "close arrow input stream");
    return true;
  }

  std::size_t records_written() const override {
    return written_;
  }

 private:
  bool OpenWriter(std::shared_ptr<arrow::Schema> schema) {
    schema_ = std::move(schema);
    auto writer = arrow::ipc::MakeStreamWriter(sink_, schema_);
    if (!writer.ok() && writer.status().IsCancelled()) return false;
    writer_ = ferry::util::Unwrap<EncodeError>(std::move(writer), "open arrow input stream");
    return true;
  }

  // Column union of the first batch in first-appearance order.
  void InferSchema() {
    std::map<std::string, std::size_t> index;
    for (const auto& record : pending_) {
      for (std::size_t i = 0; i < record.size(); ++i) {
        const auto& name = record.name(i);
        auto        it   = index.find(name);
        if (it == index.end()) {
          it = index.emplace(name, names_.size()).first;
          names_.push_back(name);
          types_.push_back(ColumnType::kNull);
        }
        types_[it->second] = Widen(types_[it->second], model::TypeOf(record.at(i)));
      }
    }

    arrow::FieldVector fields;
    for (std::size_t i = 0; i < names_.size(); ++i) {
      if (types_[i] == ColumnType::kNull) types_[i] = ColumnType::kString;
      fields.push_back(arrow::field(names_[i], ToArrowType(types_[i])));
    }
    schema_ = arrow::schema(std::move(fields));
  }

  [[noreturn]] void Mismatch(std::size_t row, const std::string& column, ColumnType expected,
                             const model::Value& got) const {
    throw EncodeError("input record " + std::to_string(written_ + row + 1) + ": column '" + column + "' is " +
                      model::ToString(expected) + " in the input schema, got " +
                      model::ToString(model::TypeOf(got)));
  }

  std::shared_ptr<arrow::Array> BuildColumn(std::size_t column) {
    const auto& name = names_[column];
    const auto  type = types_[column];

    auto finish = [](arrow::ArrayBuilder& builder) {
      return ferry::util::Unwrap<EncodeError>(builder.Finish(), "build arrow column");
    };
    auto check = [](const arrow::Status& status) { ferry::util::Unwrap<EncodeError>(status, "append value"); };

    switch (type) {
      case ColumnType::kBool: {
        arrow::BooleanBuilder builder;
        for (std::size_t row = 0; row < pending_.size(); ++row) {
          const auto* value = pending_[row].Find(name);
          if (!value || model::TypeOf(*value) == ColumnType::kNull) {
            check(builder.AppendNull());
          } else if (const auto* flag = std::get_if<bool>(value)) {
            check(builder.Append(*flag));
          } else {
            Mismatch(row, name, type, *value);
          }
        }
        return finish(builder);
      }
      case ColumnType::kInt64: {
        arrow::Int64Builder builder;
        for (std::size_t row = 0; row < pending_.size(); ++row) {
          const auto* value = pending_[row].Find(name);
          if (!value || model::TypeOf(*value) == ColumnType::kNull) {
            check(builder.AppendNull());
          } else if (const auto* number = std::get_if<int64_t>(value)) {
            check(builder.Append(*number));
          } else {
            Mismatch(row, name, type, *value);
          }
        }
        return finish(builder);
      }
      case ColumnType::kFloat64: {
        arrow::DoubleBuilder builder;
        for (std::size_t row = 0; row < pending_.size(); ++row) {
          const auto* value = pending_[row].Find(name);
          if (!value || model::TypeOf(*value) == ColumnType::kNull) {
            check(builder.AppendNull());
          } else if (const auto* real = std::get_if<double>(value)) {
            check(builder.Append(*real));
          } else if (const auto* number = std::get_if<int64_t>(value)) {
            check(builder.Append(static_cast<double>(*number)));
          } else {
            Mismatch(row, name, type, *value);
          }
        }
        return finish(builder);
      }
      case ColumnType::kTimestamp: {
        arrow::TimestampBuilder builder(ToArrowType(type), arrow::default_memory_pool());
        for (std::size_t row = 0; row < pending_.size(); ++row) {
          const auto* value = pending_[row].Find(name);
          if (!value || model::TypeOf(*value) == ColumnType::kNull) {
            check(builder.AppendNull());
          } else if (const auto* ts = std::get_if<model::Timestamp>(value)) {
            check(builder.Append(ts->micros));
          } else {
            Mismatch(row, name, type, *value);
          }
        }
        return finish(builder);
      }
      case ColumnType::kNull:
      case ColumnType::kString: {
        arrow::StringBuilder builder;
        for (const auto& record : pending_) {
          const auto* value = record.Find(name);
          if (!value || model::TypeOf(*value) == ColumnType::kNull) {
            check(builder.AppendNull());
          } else {
            check(builder.Append(model::ToText(*value)));
          }
        }
        return finish(builder);
      }
    }
    throw EncodeError("unsupported column type for '" + name + "'");
  }

  bool Flush() {
    if (pending_.empty()) return true;

    if (!writer_) {
      InferSchema();
      if (!OpenWriter(schema_)) return false;
    } else {
      for (std::size_t row = 0; row < pending_.size(); ++row) {
        const auto& record = pending_[row];
        for (std::size_t i = 0; i < record.size(); ++i) {
          if (std::find(names_.begin(), names_.end(), record.name(i)) == names_.end()) {
            throw EncodeError("input record " + std::to_string(written_ + row + 1) + " has column '" +
                              record.name(i) + "' not present in the input schema");
          }
        }
      }
    }

    arrow::ArrayVector columns;
    columns.reserve(names_.size());
    for (std::size_t i = 0; i < names_.size(); ++i) {
      columns.push_back(BuildColumn(i));
    }

    auto batch  = arrow::RecordBatch::Make(schema_, static_cast<int64_t>(pending_.size()), std::move(columns));
    auto status = writer_->WriteRecordBatch(*batch);
    if (status.IsCancelled()) return false;
    ferry::util::Unwrap<EncodeError>(status, "write arrow batch");

    written_ += pending_.size();
    pending_.clear();
    return true;
  }

  std::shared_ptr<PipeOutputStream>              sink_;
  std::size_t                                    batch_rows_;
  std::vector<model::Record>                     pending_;
  std::vector<std::string>                       names_;
  std::vector<ColumnType>                        types_;
  std::shared_ptr<arrow::Schema>                 schema_;
  std::shared_ptr<arrow::ipc::RecordBatchWriter> writer_;
  std::size_t                                    written_{0};
};

} // namespace

std::string QuoteCsvField(const model::Value& value) {
  const auto* text = std::get_if<std::string>(&value);
  if (!text) {
    return model::ToText(value);
  }
  if (text->empty()) {
    return "\"\"";
  }

  const bool needs_quotes = text->find_first_of(",\"\r\n") != std::string::npos || text->front() == ' ' ||
                            text->back() == ' ';
  if (!needs_quotes) {
    return *text;
  }

  std::string quoted = "\"";
  for (char c : *text) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::unique_ptr<InputEncoder> MakeInputEncoder(model::StreamFormat format, int fd, std::size_t batch_rows) {
  switch (format) {
    case model::StreamFormat::kCsv:
      return std::make_unique<CsvInputEncoder>(fd);
    case model::StreamFormat::kJsonLines:
      return std::make_unique<JsonLinesInputEncoder>(fd);
    case model::StreamFormat::kArrow:
      return std::make_unique<ArrowInputEncoder>(fd, batch_rows);
  }
  throw ferry::util::ConfigurationError("unsupported input format");
}

} // namespace ferry::transport
