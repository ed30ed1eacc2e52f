#include "dsync/remote/yandex_disk.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dsync::remote {
namespace fs = std::filesystem;
using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::Url;

namespace {

std::string trim_trailing_slashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

Result<json> parse_json(const HttpResponse& response, const std::string& context) {
    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return Err<json>(ErrorKind::Protocol, context + ": response is not valid JSON");
    }
    if (!body.is_object()) {
        return Err<json>(ErrorKind::Protocol, context + ": expected a JSON object");
    }
    return Ok(std::move(body));
}

} // namespace

YandexDiskStorage::YandexDiskStorage(network::HttpTransport& transport,
                                     std::string token,
                                     std::string cloud_folder)
    : transport_(transport),
      token_(std::move(token)),
      cloud_folder_(trim_trailing_slashes(std::move(cloud_folder))) {}

Result<std::unique_ptr<YandexDiskStorage>> YandexDiskStorage::connect(network::HttpTransport& transport,
                                                                      std::string token,
                                                                      std::string cloud_folder) {
    std::unique_ptr<YandexDiskStorage> storage(
        new YandexDiskStorage(transport, std::move(token), std::move(cloud_folder)));

    if (auto res = storage->validate_connection(); res.is_error()) {
        return Err<std::unique_ptr<YandexDiskStorage>>(
            Error{res.error().kind, "Cannot connect to Yandex.Disk: " + res.error().message});
    }
    if (auto res = storage->ensure_folder_exists(); res.is_error()) {
        return Err<std::unique_ptr<YandexDiskStorage>>(
            Error{res.error().kind, "Cannot prepare remote folder " + storage->cloud_folder() + ": " +
                                    res.error().message});
    }

    spdlog::debug("Remote folder {} is ready", storage->cloud_folder());
    return Ok(std::move(storage));
}

std::string YandexDiskStorage::remote_path(const std::string& name) const {
    return cloud_folder_ + "/" + name;
}

Result<void> YandexDiskStorage::validate_connection() {
    auto response = api_request(HttpMethod::GET, "", {});
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<void>(status_error(response.value(), "Disk info"));
    }
    return Ok();
}

Result<void> YandexDiskStorage::ensure_folder_exists() {
    auto response = api_request(HttpMethod::PUT, "/resources", {{"path", cloud_folder_}});
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (response.value().status_code == 409) {
        // Folder already exists
        return Ok();
    }
    if (!response.value().is_success()) {
        return Err<void>(status_error(response.value(), "Create folder"));
    }
    spdlog::info("Created remote folder {}", cloud_folder_);
    return Ok();
}

Result<void> YandexDiskStorage::upload(const fs::path& local_path) {
    const std::string name = local_path.filename().string();

    auto link = api_request(HttpMethod::GET, "/resources/upload",
                            {{"path", remote_path(name)}, {"overwrite", "true"}});
    if (link.is_error()) {
        return Err<void>(link.error());
    }
    if (!link.value().is_success()) {
        return Err<void>(status_error(link.value(), "Upload link for " + name));
    }

    auto body = parse_json(link.value(), "Upload link for " + name);
    if (body.is_error()) {
        return Err<void>(body.error());
    }
    const auto href = body.value().find("href");
    if (href == body.value().end() || !href->is_string() || href->get_ref<const std::string&>().empty()) {
        return Err<void>(ErrorKind::Protocol, "Upload link for " + name + " has no href");
    }

    auto target = Url::parse(href->get<std::string>());
    if (target.is_error()) {
        return Err<void>(target.error());
    }

    HttpRequest put;
    put.method = HttpMethod::PUT;
    put.url = target.value();
    put.body_file = local_path;

    auto stored = transport_.send(put);
    if (stored.is_error()) {
        return Err<void>(stored.error());
    }
    if (!stored.value().is_success()) {
        return Err<void>(status_error(stored.value(), "Upload of " + name));
    }
    return Ok();
}

Result<void> YandexDiskStorage::overwrite(const fs::path& local_path) {
    // The upload link is requested with overwrite=true, so both are the same call
    return upload(local_path);
}

Result<void> YandexDiskStorage::remove(const std::string& name) {
    auto response = api_request(HttpMethod::DELETE_METHOD, "/resources",
                                {{"path", remote_path(name)}, {"permanently", "true"}});
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (response.value().status_code == 404) {
        spdlog::debug("Remote file {} already absent", name);
        return Ok();
    }
    if (!response.value().is_success()) {
        return Err<void>(status_error(response.value(), "Delete of " + name));
    }
    return Ok();
}

Result<RemoteListing> YandexDiskStorage::list_remote() {
    auto response = api_request(HttpMethod::GET, "/resources",
                                {{"path", cloud_folder_}, {"limit", std::to_string(kListLimit)}});
    if (response.is_error()) {
        return Err<RemoteListing>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<RemoteListing>(status_error(response.value(), "Folder listing"));
    }

    auto body = parse_json(response.value(), "Folder listing");
    if (body.is_error()) {
        return Err<RemoteListing>(body.error());
    }

    RemoteListing listing;
    const auto embedded = body.value().find("_embedded");
    if (embedded == body.value().end() || !embedded->is_object()) {
        return Ok(std::move(listing));
    }
    const auto items = embedded->find("items");
    if (items == embedded->end() || !items->is_array()) {
        return Ok(std::move(listing));
    }

    std::size_t malformed = 0;
    for (const auto& item : *items) {
        if (!item.is_object()) {
            ++malformed;
            continue;
        }
        const auto type = item.find("type");
        const auto name = item.find("name");
        if (type == item.end() || !type->is_string() || name == item.end() || !name->is_string()) {
            ++malformed;
            continue;
        }
        if (type->get_ref<const std::string&>() != "file") {
            continue;
        }

        RemoteFileInfo info;
        info.name = name->get<std::string>();
        if (info.name.empty()) {
            ++malformed;
            continue;
        }
        // size and modified are informational; a wrong type just drops the field
        if (const auto size = item.find("size"); size != item.end() && size->is_number_unsigned()) {
            info.size = size->get<std::uint64_t>();
        }
        if (const auto modified = item.find("modified"); modified != item.end() && modified->is_string()) {
            info.modified = modified->get<std::string>();
        }
        listing.emplace(info.name, std::move(info));
    }

    if (malformed > 0) {
        spdlog::warn("Folder listing of {}: skipped {} malformed item(s)", cloud_folder_, malformed);
    }
    return Ok(std::move(listing));
}

Result<HttpResponse> YandexDiskStorage::api_request(HttpMethod method,
                                                    const std::string& path,
                                                    const std::vector<std::pair<std::string, std::string>>& params) {
    auto url = Url::parse(std::string(kBaseUrl) + network::with_query(path, params));
    if (url.is_error()) {
        return Err<HttpResponse>(url.error());
    }

    HttpRequest request;
    request.method = method;
    request.url = url.value();
    request.set_header("Authorization", "OAuth " + token_);
    request.set_header("Accept", "application/json");
    return transport_.send(request);
}

Error YandexDiskStorage::status_error(const HttpResponse& response, const std::string& context) {
    switch (response.status_code) {
        case 401:
            return Error{ErrorKind::Auth, context + ": invalid OAuth token"};
        case 404:
            return Error{ErrorKind::NotFound, context + ": resource not found"};
        case 409:
            return Error{ErrorKind::Conflict, context + ": resource already exists"};
        default:
            return Error{ErrorKind::Http, context + ": HTTP " + std::to_string(response.status_code) +
                                          " " + response.body_as_string()};
    }
}

} // namespace dsync::remote
