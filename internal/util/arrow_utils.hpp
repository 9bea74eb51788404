#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/util/errors.hpp"

namespace ferry::util {

/*
  Arrow boundary helpers: unwrap Status / Result<T> or throw.

  I/O failures always surface as ResourceError; every other failure is
  reported as `Error`.
*/
template <typename Error>
[[noreturn]] void ThrowStatus(const arrow::Status& status, const std::string& context) {
  const auto message = context.empty() ? status.ToString() : context + ": " + status.ToString();
  if (status.IsIOError()) {
    throw ResourceError(message);
  }
  if constexpr (std::is_constructible_v<Error, std::string, std::size_t>) {
    throw Error(message, 0);
  } else {
    throw Error(message);
  }
}

template <typename Error = ResourceError>
void Unwrap(const arrow::Status& status, const std::string& context = {}) {
  if (!status.ok()) ThrowStatus<Error>(status, context);
}

template <typename Error = ResourceError, typename T>
T Unwrap(arrow::Result<T> result, const std::string& context = {}) {
  if (!result.ok()) ThrowStatus<Error>(result.status(), context);
  return std::move(result).ValueOrDie();
}

} // namespace ferry::util
