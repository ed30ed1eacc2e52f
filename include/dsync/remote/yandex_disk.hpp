#pragma once

#include "dsync/core/result.hpp"
#include "dsync/network/http_types.hpp"
#include "dsync/remote/storage.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dsync::remote {

/**
 * @brief RemoteStorage backed by the Yandex.Disk REST API
 *
 * Every remote object lives at "<cloud_folder>/<file name>". Uploads are a
 * two-step exchange: ask the API for an upload href, then PUT the raw bytes
 * there. Deletes are permanent (no trash).
 *
 * HTTP status mapping:
 * - 401 -> ErrorKind::Auth
 * - 404 -> ErrorKind::NotFound
 * - 409 -> ErrorKind::Conflict
 * - other non-2xx -> ErrorKind::Http
 */
class YandexDiskStorage : public RemoteStorage {
public:
    static constexpr const char* kBaseUrl = "https://cloud-api.yandex.net/v1/disk";
    static constexpr int kListLimit = 1000;

    /**
     * @brief Validate the token and make sure the remote folder exists
     *
     * Fails with Auth/Network/Http errors when the disk is unreachable; the
     * caller must not start syncing in that case.
     */
    static Result<std::unique_ptr<YandexDiskStorage>> connect(network::HttpTransport& transport,
                                                              std::string token,
                                                              std::string cloud_folder);

    Result<void> upload(const std::filesystem::path& local_path) override;
    Result<void> overwrite(const std::filesystem::path& local_path) override;
    Result<void> remove(const std::string& name) override;
    Result<RemoteListing> list_remote() override;

    const std::string& cloud_folder() const noexcept { return cloud_folder_; }

    /// Remote path for a local file name.
    std::string remote_path(const std::string& name) const;

private:
    YandexDiskStorage(network::HttpTransport& transport, std::string token, std::string cloud_folder);

    Result<void> validate_connection();
    Result<void> ensure_folder_exists();

    Result<network::HttpResponse> api_request(network::HttpMethod method,
                                              const std::string& path,
                                              const std::vector<std::pair<std::string, std::string>>& params);

    static Error status_error(const network::HttpResponse& response, const std::string& context);

    network::HttpTransport& transport_;
    std::string token_;
    std::string cloud_folder_;
};

} // namespace dsync::remote
