#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace planner::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
constexpr const char* kTracerName      = "resource-planner";
constexpr const char* kTracerVersion   = "0.1.0";
constexpr const char* kAttributePrefix = "planner.";

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string Endpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) {
      return value;
    }
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = Endpoint(config);
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = Endpoint(config);
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::Sampler> MakeSampler(const OtlpConfig& config) {
  const double ratio = config.sample_ratio > 0.0 && config.sample_ratio < 1.0 ? config.sample_ratio : 1.0;
  std::shared_ptr<sdktrace::Sampler> root = sdktrace::TraceIdRatioBasedSamplerFactory::Create(ratio);
  return sdktrace::ParentBasedSamplerFactory::Create(root);
}

std::string PrefixedKey(std::string_view key) {
  return kAttributePrefix + std::string(key);
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{});
  auto attrs     = resource::ResourceAttributes{{"service.name", config.service_name}, {"service.version", kTracerVersion}};
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs), MakeSampler(config));

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const planner::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == planner::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  otlp_config.sample_ratio = observability.sample_ratio();
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }

  return InitializeTracing(otlp_config);
}

void ShutdownTracing() {
  if (g_provider) {
    // Planner runs are short; pending spans must leave before exit.
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

struct OperationSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

OperationSpan::OperationSpan(std::string_view operation) : impl_(std::make_unique<Impl>()) {
  auto tracer = g_tracer;
  if (!tracer) {
    tracer = trace_api::Provider::GetTracerProvider()->GetTracer(kTracerName, kTracerVersion);
  }

  impl_->span  = tracer->StartSpan("planner/" + std::string(operation));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
  impl_->span->SetAttribute(PrefixedKey("operation"), std::string(operation));
}

OperationSpan::~OperationSpan() {
  impl_->scope.reset();
  impl_->span->End();
}

void OperationSpan::SetAttribute(std::string_view key, std::string_view value) {
  impl_->span->SetAttribute(PrefixedKey(key), std::string(value));
}

void OperationSpan::SetAttribute(std::string_view key, std::int64_t value) {
  impl_->span->SetAttribute(PrefixedKey(key), value);
}

void OperationSpan::SetAttribute(std::string_view key, double value) {
  impl_->span->SetAttribute(PrefixedKey(key), value);
}

void OperationSpan::SetAttribute(std::string_view key, bool value) {
  impl_->span->SetAttribute(PrefixedKey(key), value);
}

void OperationSpan::MarkRejected(std::string_view reason) {
  impl_->span->AddEvent("request.rejected", {{"planner.reason", std::string(reason)}});
}

void OperationSpan::MarkFailed(std::string_view description) {
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace planner::observability

#endif
