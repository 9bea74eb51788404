#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <string_view>

namespace ferry::runtime::config {
class RuntimeConfig;
}

namespace ferry::observability {

/*
  OTLP span export configured from the tracing section of the runtime
  config. Returns false when tracing is disabled or the build carries no
  exporter.
*/
bool InitializeTracing(const ferry::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

// One per engine invocation.
inline constexpr std::string_view kTransferSpan = "ferry.transfer";
// One per interpreted pipeline step; a step that launches the engine parents its transfer span.
inline constexpr std::string_view kStepSpan = "ferry.step";

/*
  RAII span, active for the lifetime of the scope. No-op unless built
  with ENABLE_OTEL.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);

  // Stops being the active span. The span stays open until destruction, so it can be handed to a stream.
  void Deactivate();

  // Marks the span failed and tags it with the error kind (process, decode, ...).
  void RecordError(const std::exception& error);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const ferry::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::Deactivate() {
}

inline void SpanScope::RecordError(const std::exception&) {
}
#endif

} // namespace ferry::observability
