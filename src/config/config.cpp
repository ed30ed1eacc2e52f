#include "dsync/config/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <system_error>

namespace dsync::config {
namespace fs = std::filesystem;

namespace {

constexpr const char* kKnownKeys[] = {
    "SYNC_FOLDER_PATH",
    "CLOUD_FOLDER_NAME",
    "YANDEX_TOKEN",
    "SYNC_PERIOD",
    "LOG_FILE_PATH",
    "LOG_LEVEL",
    "HTTP_TIMEOUT",
    "RETRY_FAILED_TRANSFERS",
    "SKIP_DELETES_ON_SCAN_FAILURE",
};

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Error config_error(const std::string& key, const std::string& problem) {
    return Error{ErrorKind::Config, key + ": " + problem};
}

class Lookup {
public:
    Lookup(const EnvMap& environment, const EnvMap& file_values)
        : environment_(environment), file_values_(file_values) {}

    std::optional<std::string> get(const std::string& key) const {
        if (auto it = environment_.find(key); it != environment_.end()) {
            return it->second;
        }
        if (auto it = file_values_.find(key); it != file_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    Result<std::string> required(const std::string& key) const {
        auto value = get(key);
        if (!value || trim(*value).empty()) {
            return Err<std::string>(config_error(key, "required setting is missing"));
        }
        return Ok(trim(*value));
    }

private:
    const EnvMap& environment_;
    const EnvMap& file_values_;
};

Result<std::chrono::seconds> parse_seconds(const std::string& key, const std::string& text) {
    long long value = 0;
    std::size_t consumed = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        return Err<std::chrono::seconds>(config_error(key, "expected an integer, got '" + text + "'"));
    }
    if (consumed != text.size()) {
        return Err<std::chrono::seconds>(config_error(key, "expected an integer, got '" + text + "'"));
    }
    if (value <= 0) {
        return Err<std::chrono::seconds>(config_error(key, "must be greater than zero"));
    }
    if (value > kMaxDurationSeconds) {
        return Err<std::chrono::seconds>(
            config_error(key, "must be at most " + std::to_string(kMaxDurationSeconds) + " seconds"));
    }
    return Ok(std::chrono::seconds(value));
}

Result<bool> parse_bool(const std::string& key, const std::string& text) {
    const std::string value = lowercase(trim(text));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return Ok(true);
    }
    if (value == "0" || value == "false" || value == "no" || value == "off" || value.empty()) {
        return Ok(false);
    }
    return Err<bool>(config_error(key, "expected a boolean, got '" + text + "'"));
}

Result<spdlog::level::level_enum> parse_level(const std::string& text) {
    const std::string value = lowercase(trim(text));
    if (value == "trace") return Ok(spdlog::level::trace);
    if (value == "debug") return Ok(spdlog::level::debug);
    if (value == "info") return Ok(spdlog::level::info);
    if (value == "warn" || value == "warning") return Ok(spdlog::level::warn);
    if (value == "error") return Ok(spdlog::level::err);
    return Err<spdlog::level::level_enum>(
        config_error("LOG_LEVEL", "unknown level '" + text + "' (trace, debug, info, warn, error)"));
}

std::string unquote(const std::string& raw) {
    std::string value = trim(raw);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
        const char quote = value.front();
        const auto closing = value.find(quote, 1);
        if (closing != std::string::npos) {
            return value.substr(1, closing - 1);
        }
    }
    // Inline comment on an unquoted value
    if (const auto hash = value.find(" #"); hash != std::string::npos) {
        value = trim(value.substr(0, hash));
    }
    return value;
}

EnvMap process_environment() {
    EnvMap environment;
    for (const char* key : kKnownKeys) {
        if (const char* value = std::getenv(key)) {
            environment.emplace(key, value);
        }
    }
    return environment;
}

} // namespace

Result<EnvMap> parse_env_file(const fs::path& path) {
    EnvMap values;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::debug("No environment file at {}", path.string());
        return Ok(std::move(values));
    }

    std::ifstream input(path);
    if (!input) {
        return Err<EnvMap>(ErrorKind::Config, "Cannot read environment file " + path.string());
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }
        if (text.rfind("export ", 0) == 0) {
            text = trim(text.substr(7));
        }

        const auto eq = text.find('=');
        if (eq == std::string::npos) {
            return Err<EnvMap>(ErrorKind::Config,
                path.string() + ":" + std::to_string(line_number) + ": expected KEY=VALUE");
        }
        const std::string key = trim(text.substr(0, eq));
        if (key.empty()) {
            return Err<EnvMap>(ErrorKind::Config,
                path.string() + ":" + std::to_string(line_number) + ": empty key");
        }
        values[key] = unquote(text.substr(eq + 1));
    }

    return Ok(std::move(values));
}

Result<Config> resolve(const EnvMap& environment, const EnvMap& file_values) {
    const Lookup lookup(environment, file_values);
    Config config;

    auto folder = lookup.required("SYNC_FOLDER_PATH");
    if (folder.is_error()) return Err<Config>(folder.error());
    config.sync_folder = folder.value();

    std::error_code ec;
    if (!fs::exists(config.sync_folder, ec)) {
        return Err<Config>(config_error("SYNC_FOLDER_PATH",
            "folder does not exist: " + config.sync_folder.string()));
    }
    if (!fs::is_directory(config.sync_folder, ec)) {
        return Err<Config>(config_error("SYNC_FOLDER_PATH",
            "not a directory: " + config.sync_folder.string()));
    }

    auto cloud = lookup.required("CLOUD_FOLDER_NAME");
    if (cloud.is_error()) return Err<Config>(cloud.error());
    config.cloud_folder = cloud.value();

    auto token = lookup.required("YANDEX_TOKEN");
    if (token.is_error()) return Err<Config>(token.error());
    config.token = token.value();

    auto period_text = lookup.required("SYNC_PERIOD");
    if (period_text.is_error()) return Err<Config>(period_text.error());
    auto period = parse_seconds("SYNC_PERIOD", period_text.value());
    if (period.is_error()) return Err<Config>(period.error());
    config.sync_period = period.value();

    auto log_file = lookup.required("LOG_FILE_PATH");
    if (log_file.is_error()) return Err<Config>(log_file.error());
    config.log_file = log_file.value();

    const fs::path log_dir = config.log_file.parent_path();
    if (!log_dir.empty()) {
        fs::create_directories(log_dir, ec);
        if (ec) {
            return Err<Config>(config_error("LOG_FILE_PATH",
                "cannot create " + log_dir.string() + ": " + ec.message()));
        }
    }

    if (auto level = lookup.get("LOG_LEVEL"); level && !trim(*level).empty()) {
        auto parsed = parse_level(*level);
        if (parsed.is_error()) return Err<Config>(parsed.error());
        config.log_level = parsed.value();
    }

    if (auto timeout = lookup.get("HTTP_TIMEOUT"); timeout && !trim(*timeout).empty()) {
        auto parsed = parse_seconds("HTTP_TIMEOUT", trim(*timeout));
        if (parsed.is_error()) return Err<Config>(parsed.error());
        config.http_timeout = parsed.value();
    }

    if (auto retry = lookup.get("RETRY_FAILED_TRANSFERS")) {
        auto parsed = parse_bool("RETRY_FAILED_TRANSFERS", *retry);
        if (parsed.is_error()) return Err<Config>(parsed.error());
        config.policy.retry_failed_transfers = parsed.value();
    }

    if (auto guard = lookup.get("SKIP_DELETES_ON_SCAN_FAILURE")) {
        auto parsed = parse_bool("SKIP_DELETES_ON_SCAN_FAILURE", *guard);
        if (parsed.is_error()) return Err<Config>(parsed.error());
        config.policy.skip_deletes_on_scan_failure = parsed.value();
    }

    return Ok(std::move(config));
}

Result<Config> load(const fs::path& env_file) {
    auto file_values = parse_env_file(env_file);
    if (file_values.is_error()) {
        return Err<Config>(file_values.error());
    }
    return resolve(process_environment(), file_values.value());
}

} // namespace dsync::config
