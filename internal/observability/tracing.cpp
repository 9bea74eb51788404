#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace ferry::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using ferry::runtime::config::TracingConfig;

namespace {

constexpr char kTracerName[]    = "ferry";
constexpr char kTracerVersion[] = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

bool UsesHttp(const TracingConfig& tracing) {
  return tracing.transport() == ferry::runtime::config::TRACING_TRANSPORT_HTTP;
}

// Configured endpoint, then the standard OTLP variables, then the local collector.
std::string Endpoint(const TracingConfig& tracing) {
  if (!tracing.endpoint().empty()) return tracing.endpoint();
  for (const char* variable : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(variable)) return value;
  }
  return UsesHttp(tracing) ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const TracingConfig& tracing) {
  const auto endpoint = Endpoint(tracing);
  if (UsesHttp(tracing)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = endpoint.rfind("https://", 0) == 0;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const ferry::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();

  const auto& tracing = config.tracing();
  if (!tracing.enabled()) {
    return false;
  }

  const std::string            service = tracing.service_name().empty() ? "ferry" : tracing.service_name();
  resource::ResourceAttributes attributes = {{"service.name", service},
                                             {"ferry.package", config.engine().package()}};

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(tracing),
                                                               sdktrace::BatchSpanProcessorOptions{});
  g_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attributes)));

  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 active;

  bool live() const {
    return static_cast<bool>(span);
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = Tracer();
  if (!tracer) return;

  impl_->span   = tracer->StartSpan(std::string(name));
  impl_->active = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_ || !impl_->live()) return;
  impl_->active.reset();
  impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->live()) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->live()) impl_->span->AddEvent(std::string(name));
}

void SpanScope::Deactivate() {
  if (impl_) impl_->active.reset();
}

void SpanScope::RecordError(const std::exception& error) {
  if (!impl_ || !impl_->live()) return;

  const std::string message = error.what();
  impl_->span->SetAttribute("error.kind", ferry::util::ToString(ferry::util::ClassifyError(error)));
  impl_->span->AddEvent("exception", {{"exception.message", message}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace ferry::observability

#endif
