#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace checkpoint::observability {
namespace {

std::string ResolveLevel(const checkpoint::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("CHECKPOINT_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const checkpoint::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("CHECKPOINT_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] %v";
}

bool ResolveTraceContextEnabled(const checkpoint::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("CHECKPOINT_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool                  g_include_trace_context{false};
std::mutex            g_context_mutex;
std::vector<LogField> g_context_fields;

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') {
      return true;
    }
  }
  return false;
}

void AppendField(std::string& out, const LogField& field) {
  out.push_back(' ');
  out += field.key;
  out.push_back('=');
  if (!NeedsQuoting(field.value)) {
    out += field.value;
    return;
  }
  out.push_back('"');
  for (char c : field.value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  auto trace_id = context.trace_id();
  auto span_id  = context.span_id();
  if (trace_id.IsValid() && span_id.IsValid()) {
    uint8_t trace_bytes[16];
    uint8_t span_bytes[8];
    trace_id.CopyBytesTo(trace_bytes);
    span_id.CopyBytesTo(span_bytes);
    return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
  }
  return {};
}
#else
std::string TraceContextFields() {
  return {};
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

LogField DurationMsField(std::string_view key, std::uint64_t millis) {
  return {std::string(key), std::to_string(millis) + "ms"};
}

void SetContextFields(std::vector<LogField> fields) {
  std::lock_guard<std::mutex> lock(g_context_mutex);
  g_context_fields = std::move(fields);
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  {
    std::lock_guard<std::mutex> lock(g_context_mutex);
    for (const auto& field : g_context_fields) {
      AppendField(line, field);
    }
  }
  return line;
}

void InitializeLogging(const checkpoint::runtime::config::RuntimeConfig& config, std::string_view component) {
  const std::string name = component.empty() ? "checkpoint-manager" : "checkpoint-" + std::string(component);
  spdlog::drop(name);

  auto logger = spdlog::stdout_color_mt(name);
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context = ResolveTraceContextEnabled(config);

  std::vector<LogField> context;
  if (component == "worker" && !config.worker().worker_id().empty()) {
    context.push_back(StringField("worker_id", config.worker().worker_id()));
  }
  SetContextFields(std::move(context));
}

void ShutdownLogging() {
  SetContextFields({});
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto line         = FormatLogLine(message, fields);
  auto trace_fields = TraceContextFields();
  if (trace_fields.empty()) {
    spdlog::log(level, "{}", line);
    return;
  }
  spdlog::log(level, "{} {}", line, trace_fields);
}

} // namespace checkpoint::observability
