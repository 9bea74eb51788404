#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ferry::model {

// Microseconds since the Unix epoch, UTC.
struct Timestamp {
  int64_t micros{0};

  bool operator==(const Timestamp& other) const = default;
};

/*
  One scalar cell. Row formats yield strings (CSV) or JSON scalars;
  the Arrow batch path keeps the source column type.
*/
using Value = std::variant<std::monostate, bool, int64_t, double, std::string, Timestamp>;

enum class ColumnType : std::uint8_t {
  kNull,
  kBool,
  kInt64,
  kFloat64,
  kString,
  kTimestamp,
};

std::string ToString(ColumnType type);

ColumnType TypeOf(const Value& value);

// Text rendering used by the CSV encoder and by log output.
std::string ToText(const Value& value);

struct Column {
  std::string name;
  ColumnType  type{ColumnType::kString};

  bool operator==(const Column& other) const = default;
};

using Schema    = std::vector<Column>;
using SchemaPtr = std::shared_ptr<const Schema>;

SchemaPtr MakeSchema(std::vector<Column> columns);

/*
  Ordered mapping from column name to value. Records decoded from one
  stream share a single schema instance.
*/
class Record {
 public:
  Record() = default;
  Record(SchemaPtr schema, std::vector<Value> values);

  // Convenience for in-process input: {{"id", int64_t{1}}, {"name", "a"}}.
  Record(std::initializer_list<std::pair<std::string, Value>> fields);

  std::size_t size() const {
    return values_.size();
  }

  bool empty() const {
    return values_.empty();
  }

  const Schema& schema() const;

  const SchemaPtr& schema_ptr() const {
    return schema_;
  }

  const std::vector<Value>& values() const {
    return values_;
  }

  const std::string& name(std::size_t index) const;

  const Value& at(std::size_t index) const;

  // nullptr when the column is absent.
  const Value* Find(std::string_view column) const;

  // Throws std::out_of_range when the column is absent.
  const Value& operator[](std::string_view column) const;

  std::vector<std::string> ColumnNames() const;

 private:
  SchemaPtr          schema_;
  std::vector<Value> values_;
};

} // namespace ferry::model
