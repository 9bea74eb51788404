#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::model {

/*
  Transfer semantics. The bridge never interprets a mode; it only
  validates the spelling and hands it to the engine.
*/
enum class Mode : std::uint8_t {
  kFullRefresh,
  kIncremental,
  kTruncate,
  kSnapshot,
  kBackfill,
};

// Engine spelling, e.g. "full-refresh".
std::string ToString(Mode mode);

// Accepts "full-refresh" and "full_refresh". Throws ConfigurationError.
Mode ParseMode(std::string_view text);

enum class Format : std::uint8_t {
  kCsv,
  kJson,
  kJsonLines,
  kXml,
  kXlsx,
  kParquet,
  kArrow,
  kAvro,
  kSas,
  kRaw,
};

std::string           ToString(Format format);
std::optional<Format> ParseFormat(std::string_view text);

enum class Compression : std::uint8_t {
  kAuto,
  kNone,
  kZip,
  kGzip,
  kSnappy,
  kZstd,
};

std::string                ToString(Compression compression);
std::optional<Compression> ParseCompression(std::string_view text);

/*
  Formats the bridge itself can put on, or take off, a pipe.
  kArrow is the columnar batch transport; the other two are rows.
*/
enum class StreamFormat : std::uint8_t {
  kCsv,
  kJsonLines,
  kArrow,
};

constexpr bool IsBatchFormat(StreamFormat format) {
  return format == StreamFormat::kArrow;
}

std::string ToString(StreamFormat format);

// Throws ConfigurationError for formats that cannot travel over a pipe.
StreamFormat ToStreamFormat(Format format);

} // namespace ferry::model
