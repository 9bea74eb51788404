#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/decode/row_decoder.hpp"
#include "internal/transport/fd_stream.hpp"

namespace ferry::decode {

/*
  RFC 4180 reader. The first record is the header. Unquoted empty
  fields decode to null, quoted empty fields to "". Quoted fields may
  span lines.
*/
class CsvDecoder : public RowDecoder {
 public:
  explicit CsvDecoder(int fd) : reader_(fd) {
  }

  std::optional<model::Record> Next() override;

 private:
  using Fields = std::vector<std::optional<std::string>>;

  bool ReadFields(Fields* fields);

  transport::LineReader reader_;
  model::SchemaPtr      schema_;
  std::size_t           line_number_{0};
  std::size_t           row_number_{0};
};

// Parses one logical CSV record from `text`; exposed for tests.
std::vector<std::optional<std::string>> SplitCsvLine(const std::string& text);

} // namespace ferry::decode
