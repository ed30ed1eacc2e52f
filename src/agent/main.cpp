#include "dsync/agent/runner.hpp"
#include "dsync/config/config.hpp"
#include "dsync/events/components.hpp"
#include "dsync/events/event_bus.hpp"
#include "dsync/events/events.hpp"
#include "dsync/local/scanner.hpp"
#include "dsync/logging/logging.hpp"
#include "dsync/network/https_client.hpp"
#include "dsync/remote/yandex_disk.hpp"
#include "dsync/sync/engine.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [-e|--env <file>] [-h|--help]\n"
              << "\n"
              << "Keeps a cloud folder on Yandex.Disk in line with a local folder.\n"
              << "Settings are read from the environment and from the .env file\n"
              << "(default: ./.env). Required keys: SYNC_FOLDER_PATH, CLOUD_FOLDER_NAME,\n"
              << "YANDEX_TOKEN, SYNC_PERIOD, LOG_FILE_PATH.\n";
}

void print_banner(const dsync::config::Config& config) {
    std::cout << "╔════════════════════════════════════════╗\n"
              << "║   File sync service started            ║\n"
              << "╚════════════════════════════════════════╝\n"
              << "Local folder: " << config.sync_folder.string() << "\n"
              << "Cloud folder: " << config.cloud_folder << "\n"
              << "Sync period:  " << config.sync_period.count() << "s\n"
              << "Log file:     " << config.log_file.string() << "\n"
              << "Press Ctrl+C to stop\n"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    fs::path env_file = ".env";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-e" || arg == "--env") && i + 1 < argc) {
            env_file = fs::path(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config = dsync::config::load(env_file);
    if (config.is_error()) {
        std::cerr << "Configuration error: " << config.error().message << std::endl;
        return 1;
    }
    const auto& settings = config.value();

    if (auto res = dsync::logging::setup_logging(settings.log_file, settings.log_level); res.is_error()) {
        std::cerr << "Configuration error: " << res.error().message << std::endl;
        return 1;
    }

    print_banner(settings);

    dsync::events::EventBus event_bus;
    dsync::events::LoggerComponent logger(event_bus);
    dsync::events::MetricsComponent metrics(event_bus);

    dsync::network::HttpsClient::Options client_options;
    client_options.timeout = settings.http_timeout;
    dsync::network::HttpsClient client(client_options);

    auto storage = dsync::remote::YandexDiskStorage::connect(client, settings.token, settings.cloud_folder);
    if (storage.is_error()) {
        spdlog::error("{}", storage.error().message);
        return 1;
    }

    dsync::local::LocalScanner scanner(settings.sync_folder);
    dsync::sync::SyncEngine engine(scanner, *storage.value(), event_bus, settings.policy);

    event_bus.emit(dsync::events::AgentStartedEvent{settings.sync_folder, settings.cloud_folder, settings.sync_period});

    boost::asio::io_context io_context;
    dsync::agent::SyncRunner runner(io_context, engine, event_bus, settings.sync_period);

    try {
        runner.run();
    } catch (const std::exception&) {
        // Already logged as critical by the runner
        spdlog::shutdown();
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
