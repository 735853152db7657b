#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>

namespace intake_core {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

// Console sink at info plus a daily rotated ingestion_<date>.log in log_dir at debug.
// The logger is not registered with spdlog; pass it to
// every component that logs.
LoggerPtr make_intake_logger(const std::filesystem::path& log_dir,
                             const std::string& level = "info",
                             const std::string& name = "intake");

// Discards everything; used by tests and by callers that don't want output
LoggerPtr make_null_logger(const std::string& name = "intake_null");

spdlog::level::level_enum parse_log_level(const std::string& level);

}  // namespace intake_core
