#pragma once

#include "dsync/core/result.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>

namespace dsync::logging {

constexpr const char* kLoggerName = "dsync";
constexpr std::size_t kMaxLogFileSize = 10 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 5;

constexpr const char* kFilePattern = "%Y-%m-%d %H:%M:%S | %l | %v";
constexpr const char* kConsolePattern = "%^%l: %v%$";

/**
 * @brief Install the "dsync" logger as spdlog's default
 *
 * Two sinks:
 * - rotating file at `log_file` (10 MiB x 5), everything at `level` and above
 * - coloured stderr, errors only
 *
 * After this call every spdlog::info/error in the process lands in both.
 *
 * @return ErrorKind::Config when the log file cannot be opened
 */
Result<void> setup_logging(const std::filesystem::path& log_file, spdlog::level::level_enum level);

} // namespace dsync::logging
