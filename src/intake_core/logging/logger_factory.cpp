#include "intake_core/logging/logger_factory.hpp"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace intake_core {

spdlog::level::level_enum parse_log_level(const std::string& level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn" || level == "warning")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "off")
    return spdlog::level::off;
  throw std::invalid_argument("Unknown log level: " + level);
}

LoggerPtr make_intake_logger(const std::filesystem::path& log_dir,
                             const std::string& level,
                             const std::string& name) {
  std::filesystem::create_directories(log_dir);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  const spdlog::level::level_enum console_level = parse_log_level(level);
  console_sink->set_level(console_level);
  console_sink->set_pattern("%^%l%$: %v");

  // Rotates at midnight; file name becomes ingestion_YYYY-MM-DD.log
  auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
      (log_dir / "ingestion.log").string(), 0, 0);
  file_sink->set_level(spdlog::level::debug);
  file_sink->set_pattern("%Y-%m-%d %H:%M:%S.%e - %n - %l - %v");

  std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_level(std::min(console_level, spdlog::level::debug));
  logger->flush_on(spdlog::level::warn);
  return logger;
}

LoggerPtr make_null_logger(const std::string& name) {
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>(name, sink);
}

}  // namespace intake_core
