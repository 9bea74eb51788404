#include "record.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace ferry::model {

namespace {

const Schema& EmptySchema() {
  static const Schema empty;
  return empty;
}

std::string FormatDouble(double value) {
  if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
    std::ostringstream out;
    out.precision(1);
    out << std::fixed << value;
    return out.str();
  }
  std::ostringstream out;
  out.precision(17);
  out << value;
  return out.str();
}

} // namespace

std::string ToString(ColumnType type) {
  switch (type) {
    case ColumnType::kNull:
      return "null";
    case ColumnType::kBool:
      return "bool";
    case ColumnType::kInt64:
      return "int64";
    case ColumnType::kFloat64:
      return "float64";
    case ColumnType::kString:
      return "string";
    case ColumnType::kTimestamp:
      return "timestamp";
  }
  return "string";
}

ColumnType TypeOf(const Value& value) {
  switch (value.index()) {
    case 0:
      return ColumnType::kNull;
    case 1:
      return ColumnType::kBool;
    case 2:
      return ColumnType::kInt64;
    case 3:
      return ColumnType::kFloat64;
    case 4:
      return ColumnType::kString;
    default:
      return ColumnType::kTimestamp;
  }
}

std::string ToText(const Value& value) {
  struct Visitor {
    std::string operator()(std::monostate) const {
      return {};
    }
    std::string operator()(bool v) const {
      return v ? "true" : "false";
    }
    std::string operator()(int64_t v) const {
      return std::to_string(v);
    }
    std::string operator()(double v) const {
      return FormatDouble(v);
    }
    std::string operator()(const std::string& v) const {
      return v;
    }
    std::string operator()(const Timestamp& v) const {
      return ferry::util::FormatMicros(v.micros);
    }
  };
  return std::visit(Visitor{}, value);
}

SchemaPtr MakeSchema(std::vector<Column> columns) {
  return std::make_shared<const Schema>(std::move(columns));
}

Record::Record(SchemaPtr schema, std::vector<Value> values) : schema_(std::move(schema)), values_(std::move(values)) {
  if (!schema_ || schema_->size() != values_.size()) {
    throw std::invalid_argument("record values do not match schema width");
  }
}

Record::Record(std::initializer_list<std::pair<std::string, Value>> fields) {
  Schema columns;
  columns.reserve(fields.size());
  values_.reserve(fields.size());
  for (const auto& [name, value] : fields) {
    columns.push_back({name, TypeOf(value)});
    values_.push_back(value);
  }
  schema_ = MakeSchema(std::move(columns));
}

const Schema& Record::schema() const {
  return schema_ ? *schema_ : EmptySchema();
}

const std::string& Record::name(std::size_t index) const {
  return schema().at(index).name;
}

const Value& Record::at(std::size_t index) const {
  return values_.at(index);
}

const Value* Record::Find(std::string_view column) const {
  const auto& columns = schema();
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (columns[i].name == column) {
      return &values_[i];
    }
  }
  return nullptr;
}

const Value& Record::operator[](std::string_view column) const {
  if (const auto* value = Find(column)) {
    return *value;
  }
  throw std::out_of_range("no such column: " + std::string(column));
}

std::vector<std::string> Record::ColumnNames() const {
  std::vector<std::string> names;
  names.reserve(schema().size());
  for (const auto& column : schema()) {
    names.push_back(column.name);
  }
  return names;
}

} // namespace ferry::model
