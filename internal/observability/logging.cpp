#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace ferry::observability {
namespace {

constexpr char kLoggerName[]     = "ferry";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment first, then the config file, then the built-in default.
std::string Pick(const char* variable, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(variable)) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

// Values with blanks, quotes or '=' are quoted so engine stderr lines stay one field.
void AppendField(std::string* out, const LogField& field) {
  if (!out->empty()) out->push_back(' ');
  out->append(field.key);
  out->push_back('=');

  const bool quote = field.value.empty() || field.value.find_first_of(" \t\"=") != std::string::npos;
  if (!quote) {
    out->append(field.value);
    return;
  }
  out->push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') out->push_back('\\');
    out->push_back(c);
  }
  out->push_back('"');
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string* out) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_id[33];
  char span_id[17];
  context.trace_id().ToLowerBase16(opentelemetry::nostd::span<char, 32>(trace_id, 32));
  context.span_id().ToLowerBase16(opentelemetry::nostd::span<char, 16>(span_id, 16));
  trace_id[32] = '\0';
  span_id[16]  = '\0';

  AppendField(out, StringField("trace_id", trace_id));
  AppendField(out, StringField("span_id", span_id));
}
#else
void AppendTraceContext(std::string*) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  const std::string text(name);
  const auto        level = spdlog::level::from_str(text);
  if (level == spdlog::level::off && text != "off") {
    return spdlog::level::info;
  }
  return level;
}

void InitializeLogging(const ferry::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(Pick("FERRY_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(ParseLevel(Pick("FERRY_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const auto trace_context = Pick("FERRY_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "",
                                  "false");
  g_include_trace_context  = trace_context == "1" || trace_context == "true";
}

void ShutdownLogging() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string suffix;
  for (const auto& field : fields) {
    AppendField(&suffix, field);
  }
  if (g_include_trace_context) {
    AppendTraceContext(&suffix);
  }

  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, suffix);
  }
}

} // namespace ferry::observability
