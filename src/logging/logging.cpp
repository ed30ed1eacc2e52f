#include "dsync/logging/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace dsync::logging {

Result<void> setup_logging(const std::filesystem::path& log_file, spdlog::level::level_enum level) {
    std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink;
    try {
        file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), kMaxLogFileSize, kMaxLogFiles);
    } catch (const spdlog::spdlog_ex& e) {
        return Err<void>(ErrorKind::Config, "Cannot open log file " + log_file.string() + ": " + e.what());
    }
    file_sink->set_level(level);
    file_sink->set_pattern(kFilePattern);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::err);
    console_sink->set_pattern(kConsolePattern);

    std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(std::min(level, spdlog::level::err));
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);
    return Ok();
}

} // namespace dsync::logging
