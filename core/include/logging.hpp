#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call once at process start (main(), test main) before any component logs.
    // Writes to console and to <log_dir>/<base_filename>_<UTC stamp>.log
    void initialize(const std::string& base_filename = "trading_bot",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug,
                    const std::string& log_dir = "logs");

    // Get the globally configured logger. Throws if initialize() was not called.
    std::shared_ptr<spdlog::logger>& getLogger();

    // Flush and drop the logger (end of main)
    void shutdown();

    // Helper to map "debug", "warn", ... to spdlog levels (config file / env vars)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
