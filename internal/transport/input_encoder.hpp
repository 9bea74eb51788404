#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "internal/model/enums.hpp"
#include "internal/model/record.hpp"

namespace ferry::transport {

/*
  Serializes in-process records onto the engine's stdin.

  Write() and Finish() return false when the engine stopped reading;
  they throw EncodeError when a record does not fit the stream and
  ResourceError on I/O failure. None of them closes the descriptor.
*/
class InputEncoder {
 public:
  virtual ~InputEncoder() = default;

  virtual bool Write(const model::Record& record) = 0;

  // Flushes pending rows and writes the end-of-stream marker, if the format has one.
  virtual bool Finish() = 0;

  virtual std::size_t records_written() const = 0;
};

// `batch_rows` only applies to the Arrow format.
std::unique_ptr<InputEncoder> MakeInputEncoder(model::StreamFormat format, int fd, std::size_t batch_rows);

// One CSV field: null is empty, an empty string is "".
std::string QuoteCsvField(const model::Value& value);

} // namespace ferry::transport
