#pragma once

#include <optional>
#include <string>

#include "internal/decode/row_decoder.hpp"
#include "internal/transport/fd_stream.hpp"

namespace ferry::decode {

/*
  One JSON object per line. Columns follow the key order of each line,
  numbers with a fraction or exponent are float64; nested arrays
  and objects are kept as compact JSON text.
*/
class JsonLinesDecoder : public RowDecoder {
 public:
  explicit JsonLinesDecoder(int fd) : reader_(fd) {
  }

  std::optional<model::Record> Next() override;

 private:
  transport::LineReader reader_;
  model::SchemaPtr      schema_;
  std::size_t           line_number_{0};
};

// Decodes one JSONL line; `previous` is reused when names and types match.
model::Record ParseJsonLine(const std::string& line, const model::SchemaPtr& previous);

} // namespace ferry::decode
