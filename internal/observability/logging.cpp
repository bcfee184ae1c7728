#include "internal/observability/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace market::observability {
namespace {

constexpr const char* kLoggerName     = "affiliate-market";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr std::size_t kBytesPerMb     = 1024 * 1024;

std::atomic<bool> g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value && *value ? std::string(value) : fallback;
}

spdlog::level::level_enum ParseLevel(const std::string& text) {
  auto level = spdlog::level::from_str(text);
  // from_str maps anything it does not recognise to off.
  if (level == spdlog::level::off && text != "off") {
    return spdlog::level::info;
  }
  return level;
}

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

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c == '\n' ? ' ' : c);
  }
  out.push_back('"');
}

std::vector<spdlog::sink_ptr> BuildSinks(const market::runtime::config::LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!logging.file().path().empty()) {
    const std::size_t max_mb    = logging.file().max_size_mb() > 0 ? logging.file().max_size_mb() : 10;
    const std::size_t max_files = logging.file().max_files() > 0 ? logging.file().max_files() : 3;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file().path(), max_mb * kBytesPerMb, max_files));
  }
  return sinks;
}

#ifdef ENABLE_OTEL
template <typename Id>
std::string Hex(const Id& id) {
  char buffer[2 * Id::kSize];
  id.ToLowerBase16(buffer);
  return std::string(buffer, sizeof(buffer));
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) {
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
  line += " trace_id=" + Hex(context.trace_id());
  line += " span_id=" + Hex(context.span_id());
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField UIntField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const market::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto sinks  = BuildSinks(logging);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("MARKET_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern()));
  logger->set_level(ParseLevel(EnvOr("MARKET_LOG_LEVEL", logging.level().empty() ? "info" : logging.level())));
  logger->flush_on(spdlog::level::warn);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));

  const auto trace_env = EnvOr("MARKET_LOG_INCLUDE_TRACE_CONTEXT", "");
  g_include_trace_context.store(trace_env.empty() ? logging.include_trace_context() : (trace_env == "1" || trace_env == "true"));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  if (fields.size() > 0) {
    line.push_back(' ');
    line += FormatFields(fields);
  }
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace market::observability
