#include "dsync/remote/yandex_disk.hpp"

#include "../support/test_doubles.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using dsync::ErrorKind;
using dsync::Result;
using dsync::network::HttpMethod;
using dsync::network::HttpRequest;
using dsync::network::HttpResponse;
using dsync::network::HttpTransport;
using dsync::remote::YandexDiskStorage;

namespace {

HttpResponse response(int status, const std::string& body = "") {
    HttpResponse r;
    r.status_code = status;
    r.body.assign(body.begin(), body.end());
    return r;
}

/**
 * @brief Replays queued responses and keeps every request it was given
 */
class ScriptedTransport : public HttpTransport {
public:
    void reply(HttpResponse r) { script_.push_back(dsync::Ok(std::move(r))); }

    void reply_error(ErrorKind kind, const std::string& message) {
        script_.push_back(dsync::Err<HttpResponse>(kind, message));
    }

    Result<HttpResponse> send(const HttpRequest& request) override {
        requests.push_back(request);
        if (script_.empty()) {
            return dsync::Err<HttpResponse>(ErrorKind::Network, "no scripted response");
        }
        auto next = std::move(script_.front());
        script_.pop_front();
        return next;
    }

    std::vector<HttpRequest> requests;

private:
    std::deque<Result<HttpResponse>> script_;
};

} // namespace

class YandexDiskStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = dsync::test::create_temp_dir("dsync_yandex_");
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    std::unique_ptr<YandexDiskStorage> connected(const std::string& folder = "Backup") {
        transport_.reply(response(200, R"({"total_space": 100})"));
        transport_.reply(response(201));
        auto storage = YandexDiskStorage::connect(transport_, "secret-token", folder);
        EXPECT_TRUE(storage.is_ok());
        transport_.requests.clear();
        return std::move(storage.value());
    }

    fs::path root_;
    ScriptedTransport transport_;
};

TEST_F(YandexDiskStorageTest, ConnectValidatesTokenAndCreatesFolder) {
    transport_.reply(response(200, "{}"));
    transport_.reply(response(201));

    auto storage = YandexDiskStorage::connect(transport_, "secret-token", "Backup");
    ASSERT_TRUE(storage.is_ok());

    ASSERT_EQ(transport_.requests.size(), 2u);
    const auto& info = transport_.requests[0];
    EXPECT_EQ(info.method, HttpMethod::GET);
    EXPECT_EQ(info.url.host, "cloud-api.yandex.net");
    EXPECT_TRUE(info.url.is_tls());
    EXPECT_EQ(info.url.target, "/v1/disk");
    EXPECT_EQ(info.get_header("Authorization"), "OAuth secret-token");

    const auto& mkdir = transport_.requests[1];
    EXPECT_EQ(mkdir.method, HttpMethod::PUT);
    EXPECT_EQ(mkdir.url.target, "/v1/disk/resources?path=Backup");
}

TEST_F(YandexDiskStorageTest, ExistingFolderIsAccepted) {
    transport_.reply(response(200, "{}"));
    transport_.reply(response(409, R"({"error": "DiskPathPointsToExistentDirectoryError"})"));

    auto storage = YandexDiskStorage::connect(transport_, "secret-token", "Backup");
    EXPECT_TRUE(storage.is_ok());
}

TEST_F(YandexDiskStorageTest, RejectedTokenFailsConnect) {
    transport_.reply(response(401, R"({"error": "UnauthorizedError"})"));

    auto storage = YandexDiskStorage::connect(transport_, "bad", "Backup");
    ASSERT_TRUE(storage.is_error());
    EXPECT_TRUE(storage.error().is(ErrorKind::Auth));
    EXPECT_EQ(transport_.requests.size(), 1u);
}

TEST_F(YandexDiskStorageTest, UnreachableDiskFailsConnect) {
    transport_.reply_error(ErrorKind::Network, "connection refused");

    auto storage = YandexDiskStorage::connect(transport_, "secret-token", "Backup");
    ASSERT_TRUE(storage.is_error());
    EXPECT_TRUE(storage.error().is(ErrorKind::Network));
}

TEST_F(YandexDiskStorageTest, UploadRequestsLinkThenPutsFile) {
    auto storage = connected();
    const auto file = root_ / "report v1.txt";
    dsync::test::write_file(file, "payload");

    transport_.reply(response(200, R"({"href": "https://uploader.disk.yandex.net:443/upload-target/42?x=1", "method": "PUT"})"));
    transport_.reply(response(201));

    auto result = storage->upload(file);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    ASSERT_EQ(transport_.requests.size(), 2u);
    const auto& link = transport_.requests[0];
    EXPECT_EQ(link.method, HttpMethod::GET);
    EXPECT_EQ(link.url.target, "/v1/disk/resources/upload?path=Backup%2Freport%20v1.txt&overwrite=true");

    const auto& put = transport_.requests[1];
    EXPECT_EQ(put.method, HttpMethod::PUT);
    EXPECT_EQ(put.url.host, "uploader.disk.yandex.net");
    EXPECT_EQ(put.url.target, "/upload-target/42?x=1");
    ASSERT_TRUE(put.body_file.has_value());
    EXPECT_EQ(*put.body_file, file);
    EXPECT_TRUE(put.get_header("Authorization").empty());
}

TEST_F(YandexDiskStorageTest, OverwriteUsesTheUploadFlow) {
    auto storage = connected();
    const auto file = root_ / "a.txt";
    dsync::test::write_file(file, "new content");

    transport_.reply(response(200, R"({"href": "https://uploader.disk.yandex.net/t"})"));
    transport_.reply(response(202));

    EXPECT_TRUE(storage->overwrite(file).is_ok());
    ASSERT_EQ(transport_.requests.size(), 2u);
    EXPECT_NE(transport_.requests[0].url.target.find("overwrite=true"), std::string::npos);
}

TEST_F(YandexDiskStorageTest, UploadWithoutHrefIsProtocolError) {
    auto storage = connected();
    transport_.reply(response(200, R"({"method": "PUT"})"));

    auto result = storage->upload(root_ / "a.txt");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Protocol));
}

TEST_F(YandexDiskStorageTest, NonStringHrefIsProtocolError) {
    auto storage = connected();
    transport_.reply(response(200, R"({"href": 42})"));
    transport_.reply(response(200, R"(["https://uploader.disk.yandex.net/t"])"));

    auto numeric = storage->upload(root_ / "a.txt");
    ASSERT_TRUE(numeric.is_error());
    EXPECT_TRUE(numeric.error().is(ErrorKind::Protocol));

    auto array = storage->upload(root_ / "a.txt");
    ASSERT_TRUE(array.is_error());
    EXPECT_TRUE(array.error().is(ErrorKind::Protocol));
    EXPECT_EQ(transport_.requests.size(), 2u);
}

TEST_F(YandexDiskStorageTest, UploadWithInvalidJsonIsProtocolError) {
    auto storage = connected();
    transport_.reply(response(200, "<html>not json</html>"));

    auto result = storage->upload(root_ / "a.txt");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Protocol));
}

TEST_F(YandexDiskStorageTest, FailedPutIsHttpError) {
    auto storage = connected();
    const auto file = root_ / "a.txt";
    dsync::test::write_file(file, "x");

    transport_.reply(response(200, R"({"href": "https://uploader.disk.yandex.net/t"})"));
    transport_.reply(response(507, "Insufficient Storage"));

    auto result = storage->upload(file);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Http));
    EXPECT_NE(result.error().message.find("507"), std::string::npos);
}

TEST_F(YandexDiskStorageTest, DeleteIsPermanent) {
    auto storage = connected();
    transport_.reply(response(204));

    ASSERT_TRUE(storage->remove("a.txt").is_ok());

    ASSERT_EQ(transport_.requests.size(), 1u);
    EXPECT_EQ(transport_.requests[0].method, HttpMethod::DELETE_METHOD);
    EXPECT_EQ(transport_.requests[0].url.target,
              "/v1/disk/resources?path=Backup%2Fa.txt&permanently=true");
}

TEST_F(YandexDiskStorageTest, DeletingMissingFileSucceeds) {
    auto storage = connected();
    transport_.reply(response(404, R"({"error": "DiskNotFoundError"})"));

    EXPECT_TRUE(storage->remove("gone.txt").is_ok());
}

TEST_F(YandexDiskStorageTest, DeleteTimeoutIsReported) {
    auto storage = connected();
    transport_.reply_error(ErrorKind::Timeout, "Read timed out after 30s");

    auto result = storage->remove("a.txt");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Timeout));
}

TEST_F(YandexDiskStorageTest, ListingKeepsOnlyFiles) {
    auto storage = connected();
    transport_.reply(response(200, R"({
        "_embedded": {
            "items": [
                {"name": "a.txt", "type": "file", "size": 12, "modified": "2024-01-02T03:04:05+00:00"},
                {"name": "photos", "type": "dir"},
                {"name": "b.bin", "type": "file", "size": 4096, "modified": "2024-02-01T00:00:00+00:00"}
            ],
            "limit": 1000
        }
    })"));

    auto listing = storage->list_remote();
    ASSERT_TRUE(listing.is_ok());
    ASSERT_EQ(listing.value().size(), 2u);
    EXPECT_EQ(listing.value().at("a.txt").size, 12u);
    EXPECT_EQ(listing.value().at("a.txt").modified, "2024-01-02T03:04:05+00:00");
    EXPECT_EQ(listing.value().at("b.bin").size, 4096u);
    EXPECT_EQ(listing.value().count("photos"), 0u);

    EXPECT_EQ(transport_.requests[0].url.target, "/v1/disk/resources?path=Backup&limit=1000");
}

TEST_F(YandexDiskStorageTest, ListingToleratesUnexpectedFieldTypes) {
    auto storage = connected();
    transport_.reply(response(200, R"({
        "_embedded": {
            "items": [
                {"type": "file", "name": "a.txt", "size": "12"},
                {"type": "file", "name": "b.txt", "size": 7, "modified": 1700000000},
                {"type": "file", "name": 17, "size": 3},
                {"type": ["file"], "name": "c.txt"},
                {"type": "file"},
                "not an object"
            ]
        }
    })"));

    auto listing = storage->list_remote();
    ASSERT_TRUE(listing.is_ok()) << listing.error().message;
    ASSERT_EQ(listing.value().size(), 2u);
    EXPECT_EQ(listing.value().at("a.txt").size, 0u);
    EXPECT_EQ(listing.value().at("b.txt").size, 7u);
    EXPECT_EQ(listing.value().at("b.txt").modified, "");
}

TEST_F(YandexDiskStorageTest, ListingThatIsNotAnObjectIsProtocolError) {
    auto storage = connected();
    transport_.reply(response(200, "[1, 2, 3]"));

    auto listing = storage->list_remote();
    ASSERT_TRUE(listing.is_error());
    EXPECT_TRUE(listing.error().is(ErrorKind::Protocol));
}

TEST_F(YandexDiskStorageTest, ListingOfMissingFolderIsNotFound) {
    auto storage = connected();
    transport_.reply(response(404));

    auto listing = storage->list_remote();
    ASSERT_TRUE(listing.is_error());
    EXPECT_TRUE(listing.error().is(ErrorKind::NotFound));
}

TEST_F(YandexDiskStorageTest, TrailingSlashOnFolderIsDropped) {
    auto storage = connected("disk:/Backup/");
    EXPECT_EQ(storage->cloud_folder(), "disk:/Backup");
    EXPECT_EQ(storage->remote_path("a.txt"), "disk:/Backup/a.txt");
}
