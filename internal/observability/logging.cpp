#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace scanhub::observability {
namespace {

std::string ResolveLevel(const scanhub::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("SCANHUB_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const scanhub::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("SCANHUB_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%d %H:%M:%S.%e %^%-5l%$ %P --- [%t] : %v";
}

bool ResolveTraceContextEnabled(const scanhub::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("SCANHUB_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '=' || c == '\\') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
      case '\\':
        out.push_back('\\');
        out.push_back(c);
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);

  line.append(" trace_id=").append(trace_hex, sizeof(trace_hex));
  line.append(" span_id=").append(span_hex, sizeof(span_hex));
}
#else
void AppendTraceContext(std::string&) {
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

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key).push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace") return spdlog::level::trace;
  if (lowered == "debug") return spdlog::level::debug;
  if (lowered == "info") return spdlog::level::info;
  if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
  if (lowered == "error" || lowered == "err") return spdlog::level::err;
  if (lowered == "critical") return spdlog::level::critical;
  if (lowered == "off") return spdlog::level::off;
  return std::nullopt;
}

void InitializeLogging(const scanhub::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("scanhub");
  if (!logger) {
    logger = spdlog::stdout_color_mt("scanhub");
  }

  const auto level_name = ResolveLevel(config);
  const auto level      = ParseLogLevel(level_name);

  logger->set_pattern(ResolvePattern(config));
  logger->set_level(level.value_or(spdlog::level::info));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);

  if (!level) {
    Log(spdlog::level::warn, "unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) return;

  std::string line(message);
  if (fields.size() > 0) {
    line.push_back(' ');
    line.append(FormatFields(fields));
  }
  AppendTraceContext(line);

  logger->log(level, "{}", line);
}

} // namespace scanhub::observability
