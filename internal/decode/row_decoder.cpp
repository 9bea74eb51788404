#include "row_decoder.hpp"

#include "internal/decode/arrow_decoder.hpp"
#include "internal/decode/csv_decoder.hpp"
#include "internal/decode/jsonl_decoder.hpp"

namespace ferry::decode {

std::unique_ptr<RowDecoder> MakeRowDecoder(model::StreamFormat format, int fd) {
  switch (format) {
    case model::StreamFormat::kCsv:
      return std::make_unique<CsvDecoder>(fd);
    case model::StreamFormat::kJsonLines:
      return std::make_unique<JsonLinesDecoder>(fd);
    case model::StreamFormat::kArrow:
      return std::make_unique<ArrowRowDecoder>(fd);
  }
  return nullptr;
}

} // namespace ferry::decode
