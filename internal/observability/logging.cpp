#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace planner::observability {
namespace {

constexpr const char* kLoggerName     = "resource-planner";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %n: %v";

bool g_include_trace_context{false};

std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  // from_str maps anything it does not know to "off".
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw util::InvalidParameters("unknown log level: " + name);
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string_view::npos;
}

std::string Quote(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void AppendField(std::string& line, const LogField& field) {
  line.push_back(' ');
  line += field.key;
  line.push_back('=');
  line += field.value;
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  AppendField(line, {"trace_id", std::string(trace_id, sizeof(trace_id))});
  AppendField(line, {"span_id", std::string(span_id, sizeof(span_id))});
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), NeedsQuoting(value) ? Quote(value) : std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.4f}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LoggingSettings ResolveLoggingSettings(const planner::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LoggingSettings settings;

  if (auto level = Env("PLANNER_LOG_LEVEL")) {
    settings.level = ParseLevel(*level);
  } else if (!logging.level().empty()) {
    settings.level = ParseLevel(logging.level());
  }

  settings.pattern = Env("PLANNER_LOG_PATTERN").value_or(logging.pattern().empty() ? kDefaultPattern : logging.pattern());

  if (auto include = Env("PLANNER_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.include_trace_context = *include == "1" || *include == "true";
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }

  return settings;
}

void InitializeLogging(const planner::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveLoggingSettings(config);

  // Re-initialization replaces the previous planner logger.
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);

  logger->log(level, line);
}

} // namespace planner::observability
