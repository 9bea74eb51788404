#include "fd_stream.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace ferry::transport {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

} // namespace

bool WriteAll(int fd, const void* data, std::size_t size) {
  const auto* cursor = static_cast<const char*>(data);
  while (size > 0) {
    const ssize_t n = ::write(fd, cursor, size);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EPIPE) return false;
      throw ferry::util::ResourceError(std::string("write to engine stdin failed: ") + std::strerror(errno));
    }
    cursor += n;
    size -= static_cast<std::size_t>(n);
  }
  return true;
}

// ------------------------------------------------------------
// PipeInputStream
// ------------------------------------------------------------

arrow::Status PipeInputStream::Close() {
  closed_ = true;
  return arrow::Status::OK();
}

arrow::Result<int64_t> PipeInputStream::Read(int64_t nbytes, void* out) {
  if (closed_) {
    return arrow::Status::Invalid("read from a closed pipe stream");
  }
  auto*   cursor = static_cast<uint8_t*>(out);
  int64_t total  = 0;
  while (total < nbytes) {
    const ssize_t n = ::read(fd_, cursor + total, static_cast<std::size_t>(nbytes - total));
    if (n < 0) {
      if (errno == EINTR) continue;
      return arrow::Status::IOError("read from engine stdout failed: ", std::strerror(errno));
    }
    if (n == 0) break;
    total += n;
  }
  position_ += total;
  return total;
}

arrow::Result<std::shared_ptr<arrow::Buffer>> PipeInputStream::Read(int64_t nbytes) {
  ARROW_ASSIGN_OR_RAISE(auto buffer, arrow::AllocateResizableBuffer(nbytes));
  ARROW_ASSIGN_OR_RAISE(int64_t n, Read(nbytes, buffer->mutable_data()));
  ARROW_RETURN_NOT_OK(buffer->Resize(n, /*shrink_to_fit=*/false));
  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

// ------------------------------------------------------------
// PipeOutputStream
// ------------------------------------------------------------

arrow::Status PipeOutputStream::Close() {
  closed_ = true;
  return arrow::Status::OK();
}

arrow::Status PipeOutputStream::Write(const void* data, int64_t nbytes) {
  if (closed_) {
    return arrow::Status::Invalid("write to a closed pipe stream");
  }
  try {
    if (!WriteAll(fd_, data, static_cast<std::size_t>(nbytes))) {
      return arrow::Status::Cancelled("engine closed its stdin");
    }
  } catch (const ferry::util::ResourceError& e) {
    return arrow::Status::IOError(e.what());
  }
  position_ += nbytes;
  return arrow::Status::OK();
}

// ------------------------------------------------------------
// LineReader
// ------------------------------------------------------------

bool LineReader::Fill() {
  if (eof_) return false;

  if (offset_ > 0) {
    buffer_.erase(0, offset_);
    offset_ = 0;
  }

  char chunk[kReadChunk];
  for (;;) {
    const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR) continue;
      throw ferry::util::ResourceError(std::string("read from engine stdout failed: ") + std::strerror(errno));
    }
    if (n == 0) {
      eof_ = true;
      return false;
    }
    buffer_.append(chunk, static_cast<std::size_t>(n));
    bytes_read_ += n;
    return true;
  }
}

bool LineReader::Next(std::string* line) {
  for (;;) {
    const auto newline = buffer_.find('\n', offset_);
    if (newline != std::string::npos) {
      std::size_t end = newline;
      if (end > offset_ && buffer_[end - 1] == '\r') --end;
      line->assign(buffer_, offset_, end - offset_);
      offset_ = newline + 1;
      return true;
    }
    if (!Fill()) {
      if (offset_ < buffer_.size()) {
        std::size_t end = buffer_.size();
        if (buffer_[end - 1] == '\r') --end;
        line->assign(buffer_, offset_, end - offset_);
        offset_ = buffer_.size();
        return true;
      }
      return false;
    }
  }
}

} // namespace ferry::transport
