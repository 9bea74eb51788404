#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace ferry::util {

/*
  Central error types.

  ConfigurationError is always raised before any process is launched.
  The step interpreter wraps everything else into StepError.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProcessError : public std::runtime_error {
 public:
  ProcessError(int exit_code, std::string stderr_text)
      : std::runtime_error(BuildMessage(exit_code, stderr_text)), exit_code_(exit_code), stderr_(std::move(stderr_text)) {
  }

  int exit_code() const {
    return exit_code_;
  }

  const std::string& stderr_text() const {
    return stderr_;
  }

 private:
  static std::string BuildMessage(int exit_code, const std::string& stderr_text) {
    std::string msg = "engine exited with code " + std::to_string(exit_code);
    if (!stderr_text.empty()) {
      msg += ":\n" + stderr_text;
    }
    return msg;
  }

  int         exit_code_;
  std::string stderr_;
};

class DecodeError : public std::runtime_error {
 public:
  DecodeError(const std::string& msg, std::size_t records_yielded)
      : std::runtime_error(msg), records_yielded_(records_yielded) {
  }

  // Records handed to the caller before the failure. They stay valid.
  std::size_t records_yielded() const {
    return records_yielded_;
  }

 private:
  std::size_t records_yielded_;
};

class EncodeError : public std::runtime_error {
 public:
  explicit EncodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class HttpError : public std::runtime_error {
 public:
  HttpError(long status, const std::string& msg) : std::runtime_error(msg), status_(status) {
  }

  // 0 when the request never produced a response.
  long status() const {
    return status_;
  }

 private:
  long status_;
};

class ResourceError : public std::runtime_error {
 public:
  explicit ResourceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class ErrorKind {
  kConfiguration,
  kProcess,
  kDecode,
  kEncode,
  kHttp,
  kResource,
  kOther,
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConfiguration:
      return "configuration";
    case ErrorKind::kProcess:
      return "process";
    case ErrorKind::kDecode:
      return "decode";
    case ErrorKind::kEncode:
      return "encode";
    case ErrorKind::kHttp:
      return "http";
    case ErrorKind::kResource:
      return "resource";
    case ErrorKind::kOther:
      return "other";
  }
  return "other";
}

inline ErrorKind ClassifyError(const std::exception& e) {
  if (dynamic_cast<const ConfigurationError*>(&e)) return ErrorKind::kConfiguration;
  if (dynamic_cast<const ProcessError*>(&e)) return ErrorKind::kProcess;
  if (dynamic_cast<const DecodeError*>(&e)) return ErrorKind::kDecode;
  if (dynamic_cast<const EncodeError*>(&e)) return ErrorKind::kEncode;
  if (dynamic_cast<const HttpError*>(&e)) return ErrorKind::kHttp;
  if (dynamic_cast<const ResourceError*>(&e)) return ErrorKind::kResource;
  return ErrorKind::kOther;
}

class StepError : public std::runtime_error {
 public:
  StepError(std::size_t index, std::string type, ErrorKind cause_kind, const std::string& cause_message,
            std::exception_ptr cause)
      : std::runtime_error("step " + std::to_string(index) + " (" + type + ") failed: " + cause_message),
        index_(index),
        type_(std::move(type)),
        cause_kind_(cause_kind),
        cause_(std::move(cause)) {
  }

  std::size_t index() const {
    return index_;
  }

  const std::string& type() const {
    return type_;
  }

  ErrorKind cause_kind() const {
    return cause_kind_;
  }

  // Rethrows the underlying error.
  [[noreturn]] void RethrowCause() const {
    std::rethrow_exception(cause_);
  }

  const std::exception_ptr& cause() const {
    return cause_;
  }

 private:
  std::size_t        index_;
  std::string        type_;
  ErrorKind          cause_kind_;
  std::exception_ptr cause_;
};

} // namespace ferry::util
