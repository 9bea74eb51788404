#include "jsonl_decoder.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <charconv>
#include <string_view>
#include <system_error>
#include <vector>

#include "internal/util/errors.hpp"

namespace ferry::decode {

using ferry::util::DecodeError;

namespace {

std::size_t SkipSpace(std::string_view text, std::size_t pos) {
  while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\r' || text[pos] == '\n')) ++pos;
  return pos;
}

// `pos` is on the opening quote; returns the index past the closing one.
std::size_t SkipString(std::string_view text, std::size_t pos) {
  for (++pos; pos < text.size(); ++pos) {
    if (text[pos] == '\\') {
      ++pos;
    } else if (text[pos] == '"') {
      return pos + 1;
    }
  }
  return pos;
}

std::size_t SkipValue(std::string_view text, std::size_t pos) {
  if (pos >= text.size()) return pos;
  if (text[pos] == '"') return SkipString(text, pos);
  if (text[pos] == '{' || text[pos] == '[') {
    int depth = 0;
    while (pos < text.size()) {
      const char c = text[pos];
      if (c == '"') {
        pos = SkipString(text, pos);
        continue;
      }
      if (c == '{' || c == '[') ++depth;
      if (c == '}' || c == ']') --depth;
      ++pos;
      if (depth == 0) break;
    }
    return pos;
  }
  while (pos < text.size() && text[pos] != ',' && text[pos] != '}' && text[pos] != ']' && text[pos] != ' ' &&
         text[pos] != '\t') {
    ++pos;
  }
  return pos;
}

struct RawField {
  std::string      key;
  std::string_view token; // value text as written
};

std::string KeyText(std::string_view quoted) {
  if (quoted.find('\\') == std::string_view::npos) return std::string(quoted.substr(1, quoted.size() - 2));
  google::protobuf::Value key;
  if (!google::protobuf::util::JsonStringToMessage(std::string(quoted), &key).ok()) {
    throw DecodeError("invalid key " + std::string(quoted), 0);
  }
  return key.string_value();
}

/*
  Top-level keys in the order the engine wrote them, with the raw value
  token. Only called on a line the protobuf parser has accepted as an
  object, so the scan can assume well-formed input.
*/
std::vector<RawField> ScanObject(std::string_view line) {
  std::vector<RawField> fields;
  std::size_t           pos = SkipSpace(line, 0) + 1; // past '{'
  for (;;) {
    pos = SkipSpace(line, pos);
    if (pos >= line.size() || line[pos] == '}') break;
    if (line[pos] == ',') {
      ++pos;
      continue;
    }
    const auto key_end = SkipString(line, pos);
    auto       key     = KeyText(line.substr(pos, key_end - pos));
    pos                = SkipSpace(line, key_end) + 1; // past ':'
    pos                = SkipSpace(line, pos);
    const auto value_end = SkipValue(line, pos);
    fields.push_back({std::move(key), line.substr(pos, value_end - pos)});
    pos = value_end;
  }
  return fields;
}

// A number is float64 when written with a fraction or exponent, or when it does not fit int64.
model::Value NumberValue(const google::protobuf::Value& value, std::string_view token) {
  if (token.find_first_of(".eE") == std::string_view::npos) {
    int64_t integer = 0;
    const auto [end, error] = std::from_chars(token.data(), token.data() + token.size(), integer);
    if (error == std::errc() && end == token.data() + token.size()) return integer;
  }
  return value.number_value();
}

model::Value ToValue(const google::protobuf::Value& value, std::string_view token) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return std::monostate{};
    case google::protobuf::Value::kBoolValue:
      return value.bool_value();
    case google::protobuf::Value::kNumberValue:
      return NumberValue(value, token);
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kStructValue:
    case google::protobuf::Value::kListValue: {
      std::string json;
      auto        status = google::protobuf::util::MessageToJsonString(value, &json);
      if (!status.ok()) {
        throw DecodeError("cannot render nested value: " + std::string(status.message()), 0);
      }
      return json;
    }
  }
  return std::monostate{};
}

} // namespace

model::Record ParseJsonLine(const std::string& line, const model::SchemaPtr& previous) {
  google::protobuf::Value parsed;
  auto                    status = google::protobuf::util::JsonStringToMessage(line, &parsed);
  if (!status.ok()) {
    throw DecodeError("invalid JSON: " + std::string(status.message()), 0);
  }
  if (parsed.kind_case() != google::protobuf::Value::kStructValue) {
    throw DecodeError("JSON line is not an object", 0);
  }

  const auto&               fields = parsed.struct_value().fields();
  std::vector<std::string>  keys;
  std::vector<model::Value> values;
  keys.reserve(fields.size());
  values.reserve(fields.size());
  for (auto& field : ScanObject(line)) {
    // a repeated key keeps its first position and the parser's value
    if (std::find(keys.begin(), keys.end(), field.key) != keys.end()) continue;
    auto it = fields.find(field.key);
    if (it == fields.end()) continue;
    values.push_back(ToValue(it->second, field.token));
    keys.push_back(std::move(field.key));
  }

  bool same_names = previous && previous->size() == keys.size();
  for (std::size_t i = 0; same_names && i < keys.size(); ++i) {
    same_names = (*previous)[i].name == keys[i];
  }

  // Every value either matches its column type or is null. A float64
  // column absorbs integers; any other change gets a new schema.
  model::Schema columns;
  columns.reserve(keys.size());
  bool reuse = same_names;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    const auto known = same_names ? (*previous)[i].type : model::ColumnType::kNull;
    auto       type  = model::TypeOf(values[i]);
    if (type == model::ColumnType::kNull) {
      type = known == model::ColumnType::kNull ? model::ColumnType::kString : known;
    } else if (known == model::ColumnType::kFloat64 && type == model::ColumnType::kInt64) {
      values[i] = static_cast<double>(std::get<int64_t>(values[i]));
      type      = model::ColumnType::kFloat64;
    }
    reuse = reuse && type == known;
    columns.push_back({keys[i], type});
  }
  if (reuse) return model::Record(previous, std::move(values));
  return model::Record(model::MakeSchema(std::move(columns)), std::move(values));
}

std::optional<model::Record> JsonLinesDecoder::Next() {
  std::string line;
  for (;;) {
    if (!reader_.Next(&line)) return std::nullopt;
    ++line_number_;
    if (line.find_first_not_of(" \t") != std::string::npos) break;
  }

  try {
    auto record = ParseJsonLine(line, schema_);
    schema_     = record.schema_ptr();
    return record;
  } catch (const DecodeError& e) {
    throw DecodeError("line " + std::to_string(line_number_) + ": " + e.what(), 0);
  }
}

} // namespace ferry::decode
