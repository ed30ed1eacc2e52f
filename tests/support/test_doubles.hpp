#pragma once

#include "dsync/local/scanner.hpp"
#include "dsync/remote/storage.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace dsync::test {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix = "dsync_test_") {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path(prefix + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline local::FileState make_state(const std::string& name, const std::string& fingerprint,
                                   std::time_t modified_time = 0) {
    local::FileState state;
    state.name = name;
    state.path = fs::path("/sync") / name;
    state.fingerprint = fingerprint;
    state.size = fingerprint.size();
    state.modified_time = modified_time;
    return state;
}

/**
 * @brief Scanner returning queued results; the last one repeats
 */
class FakeScanner : public local::Scanner {
public:
    void set(local::Snapshot snapshot) {
        local::ScanResult result;
        result.snapshot = std::move(snapshot);
        results_.clear();
        results_.push_back(std::move(result));
    }

    void set_unlistable() {
        local::ScanResult result;
        result.directory_listed = false;
        results_.clear();
        results_.push_back(std::move(result));
    }

    void throw_on_scan(std::string message) { throw_message_ = std::move(message); }

    local::ScanResult scan() override {
        ++scans;
        if (!throw_message_.empty()) {
            throw std::runtime_error(throw_message_);
        }
        if (results_.empty()) {
            return {};
        }
        return results_.back();
    }

    int scans = 0;

private:
    std::deque<local::ScanResult> results_;
    std::string throw_message_;
};

/**
 * @brief RemoteStorage that records every call and fails on request
 */
class RecordingRemote : public remote::RemoteStorage {
public:
    struct Call {
        std::string op;
        std::string name;

        bool operator==(const Call& other) const { return op == other.op && name == other.name; }
    };

    Result<void> upload(const fs::path& local_path) override {
        return record("upload", local_path.filename().string());
    }

    Result<void> overwrite(const fs::path& local_path) override {
        return record("overwrite", local_path.filename().string());
    }

    Result<void> remove(const std::string& name) override {
        return record("delete", name);
    }

    Result<remote::RemoteListing> list_remote() override {
        ++listings;
        if (fail_listing) {
            return Err<remote::RemoteListing>(ErrorKind::Network, "listing unavailable");
        }
        remote::RemoteListing listing;
        for (const auto& name : stored) {
            listing.emplace(name, remote::RemoteFileInfo{name, 0, ""});
        }
        return Ok(std::move(listing));
    }

    void fail(const std::string& name, ErrorKind kind = ErrorKind::Network) { failing[name] = kind; }

    void heal(const std::string& name) { failing.erase(name); }

    std::vector<Call> calls;
    std::map<std::string, ErrorKind> failing;
    std::set<std::string> stored;
    bool fail_listing = false;
    int listings = 0;

private:
    Result<void> record(const std::string& op, const std::string& name) {
        calls.push_back(Call{op, name});
        if (auto it = failing.find(name); it != failing.end()) {
            return Err<void>(it->second, op + " of " + name + " failed");
        }
        if (op == "delete") {
            stored.erase(name);
        } else {
            stored.insert(name);
        }
        return Ok();
    }
};

} // namespace dsync::test
