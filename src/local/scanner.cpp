#include "dsync/local/scanner.hpp"
#include "dsync/local/fingerprint.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <system_error>

namespace dsync::local {
namespace fs = std::filesystem;
namespace {

std::time_t to_time_t(fs::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(system_time);
}

ScanResult listing_failed(const fs::path& root, const std::string& reason) {
    spdlog::error("Cannot list directory {}: {}", root.string(), reason);
    ScanResult result;
    result.directory_listed = false;
    return result;
}

} // namespace

LocalScanner::LocalScanner(fs::path root)
    : LocalScanner(std::move(root), fingerprint_file) {}

LocalScanner::LocalScanner(fs::path root, FingerprintFunction fingerprint)
    : root_(std::move(root)),
      fingerprint_(std::move(fingerprint)) {}

ScanResult LocalScanner::scan() {
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return listing_failed(root_, ec.message());
    }

    ScanResult result;
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) {
            continue;
        }

        const std::string name = it->path().filename().string();
        if (auto state = build_state(*it)) {
            result.snapshot.emplace(name, std::move(*state));
        } else {
            result.skipped.push_back(name);
        }
    }

    if (ec) {
        return listing_failed(root_, ec.message());
    }

    spdlog::debug("Scanned {}: {} files, {} skipped",
                  root_.string(), result.snapshot.size(), result.skipped.size());
    return result;
}

std::optional<FileState> LocalScanner::build_state(const fs::directory_entry& entry) const {
    auto fingerprint = fingerprint_(entry.path());
    if (fingerprint.is_error()) {
        spdlog::error("Error reading file {}: {}", entry.path().string(), fingerprint.error().message);
        return std::nullopt;
    }

    std::error_code ec;
    const auto size = entry.file_size(ec);
    if (ec) {
        spdlog::error("Error reading size of {}: {}", entry.path().string(), ec.message());
        return std::nullopt;
    }

    const auto write_time = entry.last_write_time(ec);
    if (ec) {
        spdlog::error("Error reading modification time of {}: {}", entry.path().string(), ec.message());
        return std::nullopt;
    }

    FileState state;
    state.name = entry.path().filename().string();
    state.path = entry.path();
    state.fingerprint = std::move(fingerprint.value());
    state.size = size;
    state.modified_time = to_time_t(write_time);
    return state;
}

} // namespace dsync::local
