#include "enums.hpp"

#include <array>
#include <utility>

#include "internal/util/errors.hpp"

namespace ferry::model {

namespace {

constexpr std::array<std::pair<Mode, std::string_view>, 5> kModes{{
    {Mode::kFullRefresh, "full-refresh"},
    {Mode::kIncremental, "incremental"},
    {Mode::kTruncate, "truncate"},
    {Mode::kSnapshot, "snapshot"},
    {Mode::kBackfill, "backfill"},
}};

constexpr std::array<std::pair<Format, std::string_view>, 10> kFormats{{
    {Format::kCsv, "csv"},
    {Format::kJson, "json"},
    {Format::kJsonLines, "jsonlines"},
    {Format::kXml, "xml"},
    {Format::kXlsx, "xlsx"},
    {Format::kParquet, "parquet"},
    {Format::kArrow, "arrow"},
    {Format::kAvro, "avro"},
    {Format::kSas, "sas7bdat"},
    {Format::kRaw, "raw"},
}};

constexpr std::array<std::pair<Compression, std::string_view>, 6> kCompressions{{
    {Compression::kAuto, "auto"},
    {Compression::kNone, "none"},
    {Compression::kZip, "zip"},
    {Compression::kGzip, "gzip"},
    {Compression::kSnappy, "snappy"},
    {Compression::kZstd, "zstd"},
}};

} // namespace

std::string ToString(Mode mode) {
  for (const auto& [value, name] : kModes) {
    if (value == mode) return std::string(name);
  }
  return "full-refresh";
}

Mode ParseMode(std::string_view text) {
  std::string normalized(text);
  for (auto& c : normalized) {
    if (c == '_') c = '-';
  }
  for (const auto& [value, name] : kModes) {
    if (name == normalized) return value;
  }
  throw ferry::util::ConfigurationError("unknown mode: " + std::string(text));
}

std::string ToString(Format format) {
  for (const auto& [value, name] : kFormats) {
    if (value == format) return std::string(name);
  }
  return "csv";
}

std::optional<Format> ParseFormat(std::string_view text) {
  for (const auto& [value, name] : kFormats) {
    if (name == text) return value;
  }
  return std::nullopt;
}

std::string ToString(Compression compression) {
  for (const auto& [value, name] : kCompressions) {
    if (value == compression) return std::string(name);
  }
  return "auto";
}

std::optional<Compression> ParseCompression(std::string_view text) {
  for (const auto& [value, name] : kCompressions) {
    if (name == text) return value;
  }
  return std::nullopt;
}

std::string ToString(StreamFormat format) {
  switch (format) {
    case StreamFormat::kCsv:
      return "csv";
    case StreamFormat::kJsonLines:
      return "jsonlines";
    case StreamFormat::kArrow:
      return "arrow";
  }
  return "csv";
}

StreamFormat ToStreamFormat(Format format) {
  switch (format) {
    case Format::kCsv:
      return StreamFormat::kCsv;
    case Format::kJsonLines:
      return StreamFormat::kJsonLines;
    case Format::kArrow:
      return StreamFormat::kArrow;
    default:
      throw ferry::util::ConfigurationError("format cannot be streamed over a pipe: " + ToString(format));
  }
}

} // namespace ferry::model
