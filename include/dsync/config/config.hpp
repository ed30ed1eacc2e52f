#pragma once

#include "dsync/core/result.hpp"
#include "dsync/sync/types.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace dsync::config {

/**
 * @brief Validated agent settings
 *
 * Built only by load(); every field has passed its check by the time a
 * Config exists.
 */
struct Config {
    std::filesystem::path sync_folder;
    std::string cloud_folder;
    std::string token;
    std::chrono::seconds sync_period{0};
    std::filesystem::path log_file;
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::chrono::seconds http_timeout{30};
    sync::SyncPolicy policy;
};

using EnvMap = std::map<std::string, std::string>;

/// Upper bound for SYNC_PERIOD and HTTP_TIMEOUT (one year)
inline constexpr long long kMaxDurationSeconds = 365LL * 24 * 60 * 60;

/**
 * @brief Parse KEY=VALUE lines of a .env file
 *
 * Blank lines and lines starting with '#' are skipped. An optional
 * "export " prefix is accepted. Values wrapped in single or double quotes
 * are unquoted; unquoted values lose a trailing " # comment".
 *
 * A missing file is not an error and yields an empty map.
 */
Result<EnvMap> parse_env_file(const std::filesystem::path& path);

/**
 * @brief Resolve and validate the configuration
 *
 * Each key is looked up in the process environment first, then in the
 * .env file. The parent directory of LOG_FILE_PATH is created if needed.
 *
 * @return Config, or ErrorKind::Config naming the offending key
 */
Result<Config> load(const std::filesystem::path& env_file);

/**
 * @brief Same as load() with an explicit lookup table instead of getenv
 *
 * `environment` overrides `file_values` key by key.
 */
Result<Config> resolve(const EnvMap& environment, const EnvMap& file_values);

} // namespace dsync::config
