#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace planner::runtime::config {
class RuntimeConfig;
}

namespace planner::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"resource-planner"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  // Fraction of root operations recorded, in (0, 1].
  double sample_ratio{1.0};
};

// Returns true when spans are exported. Without OpenTelemetry, always false.
bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeTracing(const planner::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  Span around one planner operation (capacity, distribute, optimize).

  Named "planner/<operation>". Attribute keys are prefixed with "planner.".
  A rejected request (bad input) is recorded as an event on an otherwise
  healthy span; only MarkFailed sets the error status.
*/
class OperationSpan {
 public:
  explicit OperationSpan(std::string_view operation);
  ~OperationSpan();

  OperationSpan(const OperationSpan&)            = delete;
  OperationSpan& operator=(const OperationSpan&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void SetAttribute(std::string_view key, bool value);

  void MarkRejected(std::string_view reason);
  void MarkFailed(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const planner::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline OperationSpan::OperationSpan(std::string_view) {
}

inline OperationSpan::~OperationSpan() {
}

inline void OperationSpan::SetAttribute(std::string_view, std::string_view) {
}

inline void OperationSpan::SetAttribute(std::string_view, std::int64_t) {
}

inline void OperationSpan::SetAttribute(std::string_view, double) {
}

inline void OperationSpan::SetAttribute(std::string_view, bool) {
}

inline void OperationSpan::MarkRejected(std::string_view) {
}

inline void OperationSpan::MarkFailed(std::string_view) {
}
#endif

} // namespace planner::observability
