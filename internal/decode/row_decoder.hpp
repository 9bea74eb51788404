#pragma once

#include <memory>
#include <optional>

#include "internal/model/enums.hpp"
#include "internal/model/record.hpp"

namespace ferry::decode {

/*
  Lazily turns engine stdout into records, one per call.

  Decoders borrow the pipe; they never close it. Next() returns
  std::nullopt at end of stream and throws DecodeError on malformed
  input.
*/
class RowDecoder {
 public:
  virtual ~RowDecoder() = default;

  virtual std::optional<model::Record> Next() = 0;
};

std::unique_ptr<RowDecoder> MakeRowDecoder(model::StreamFormat format, int fd);

} // namespace ferry::decode
