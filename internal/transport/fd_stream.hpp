#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ferry::transport {

/*
  Write the whole buffer to a pipe.

  Returns false when the reading side has gone away (EPIPE); the
  process handle reports why. Throws ResourceError on any other error.
*/
bool WriteAll(int fd, const void* data, std::size_t size);

inline bool WriteAll(int fd, std::string_view text) {
  return WriteAll(fd, text.data(), text.size());
}

/*
  Arrow stream views over a pipe end. Neither owns the descriptor:
  Close() only marks the stream closed, the ProcessHandle closes the fd.
*/
class PipeInputStream : public arrow::io::InputStream {
 public:
  explicit PipeInputStream(int fd) : fd_(fd) {
  }

  arrow::Status Close() override;

  bool closed() const override {
    return closed_;
  }

  arrow::Result<int64_t> Tell() const override {
    return position_;
  }

  // Blocks until `nbytes` are read or the writer closes the pipe.
  arrow::Result<int64_t> Read(int64_t nbytes, void* out) override;

  arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override;

 private:
  int     fd_;
  int64_t position_{0};
  bool    closed_{false};
};

class PipeOutputStream : public arrow::io::OutputStream {
 public:
  explicit PipeOutputStream(int fd) : fd_(fd) {
  }

  arrow::Status Close() override;

  bool closed() const override {
    return closed_;
  }

  arrow::Result<int64_t> Tell() const override {
    return position_;
  }

  // Status::Cancelled when the reader went away.
  arrow::Status Write(const void* data, int64_t nbytes) override;

  using arrow::io::OutputStream::Write;

 private:
  int     fd_;
  int64_t position_{0};
  bool    closed_{false};
};

/*
  Buffered line reader over a pipe. Lines are returned without the
  trailing "\n" (or "\r\n").
*/
class LineReader {
 public:
  explicit LineReader(int fd) : fd_(fd) {
  }

  // False at end of stream. A final line without a newline is still returned.
  bool Next(std::string* line);

  int64_t bytes_read() const {
    return bytes_read_;
  }

 private:
  bool Fill();

  int         fd_;
  std::string buffer_;
  std::size_t offset_{0};
  bool        eof_{false};
  int64_t     bytes_read_{0};
};

} // namespace ferry::transport
