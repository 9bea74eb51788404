#include "csv_decoder.hpp"

#include "internal/util/errors.hpp"

namespace ferry::decode {

using ferry::util::DecodeError;

namespace {

struct CsvState {
  std::vector<std::optional<std::string>> fields;
  std::string                             field;
  bool                                    in_quotes{false};
  bool                                    quoted{false};

  void PushField() {
    if (quoted || !field.empty()) {
      fields.emplace_back(field);
    } else {
      fields.emplace_back(std::nullopt);
    }
    field.clear();
    quoted = false;
  }
};

// Consumes one physical line. True when the logical record is complete.
bool ConsumeLine(const std::string& line, CsvState* state) {
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (state->in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          state->field += '"';
          ++i;
        } else {
          state->in_quotes = false;
        }
      } else {
        state->field += c;
      }
    } else if (c == ',') {
      state->PushField();
    } else if (c == '"' && state->field.empty() && !state->quoted) {
      state->in_quotes = true;
      state->quoted    = true;
    } else {
      state->field += c;
    }
  }

  if (state->in_quotes) {
    state->field += '\n';
    return false;
  }
  state->PushField();
  return true;
}

} // namespace

std::vector<std::optional<std::string>> SplitCsvLine(const std::string& text) {
  CsvState    state;
  std::size_t start = 0;
  for (;;) {
    const auto end      = text.find('\n', start);
    const auto line     = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    const bool complete = ConsumeLine(line, &state);
    if (end == std::string::npos) {
      if (!complete) throw DecodeError("unterminated quoted field", 0);
      return std::move(state.fields);
    }
    if (complete) return std::move(state.fields);
    start = end + 1;
  }
}

bool CsvDecoder::ReadFields(Fields* fields) {
  std::string line;
  CsvState    state;

  // skip blank lines between records
  do {
    if (!reader_.Next(&line)) return false;
    ++line_number_;
  } while (line.empty());

  const auto first_line = line_number_;
  while (!ConsumeLine(line, &state)) {
    if (!reader_.Next(&line)) {
      throw DecodeError("unterminated quoted field starting on line " + std::to_string(first_line), 0);
    }
    ++line_number_;
  }

  *fields = std::move(state.fields);
  return true;
}

std::optional<model::Record> CsvDecoder::Next() {
  Fields fields;

  if (!schema_) {
    if (!ReadFields(&fields)) return std::nullopt;

    model::Schema columns;
    columns.reserve(fields.size());
    for (std::size_t i = 0; i < fields.size(); ++i) {
      auto name = fields[i].value_or("");
      if (name.empty()) name = "col_" + std::to_string(i + 1);
      columns.push_back({std::move(name), model::ColumnType::kString});
    }
    schema_ = model::MakeSchema(std::move(columns));
  }

  if (!ReadFields(&fields)) return std::nullopt;
  ++row_number_;

  if (fields.size() != schema_->size()) {
    throw DecodeError("row " + std::to_string(row_number_) + " (line " + std::to_string(line_number_) + ") has " +
                          std::to_string(fields.size()) + " fields, header has " + std::to_string(schema_->size()),
                      0);
  }

  std::vector<model::Value> values;
  values.reserve(fields.size());
  for (auto& field : fields) {
    if (field) {
      values.emplace_back(std::move(*field));
    } else {
      values.emplace_back(std::monostate{});
    }
  }
  return model::Record(schema_, std::move(values));
}

} // namespace ferry::decode
