#pragma once

#include "dsync/core/result.hpp"
#include "dsync/network/http_response_parser.hpp"
#include "dsync/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <array>
#include <chrono>
#include <functional>
#include <string>

namespace dsync {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Blocking HTTP/1.1 client over Boost.Asio, TLS through OpenSSL
 *
 * One connection per request (Connection: close). Every network step runs
 * as an async operation on a private io_context that is driven until the
 * step completes or the request deadline passes, so a stalled peer turns
 * into an ErrorKind::Timeout instead of a hung agent.
 *
 * https URLs verify the peer certificate against the system trust store and
 * the requested host name. Plain http is accepted for local endpoints.
 *
 * Usage:
 * ```cpp
 * HttpsClient client;
 * HttpRequest request;
 * request.url = Url::parse("https://cloud-api.yandex.net/v1/disk").value();
 * auto response = client.send(request);
 * ```
 */
class HttpsClient : public HttpTransport {
public:
    struct Options {
        std::chrono::seconds timeout{30};   ///< Whole-request deadline
        bool verify_peer = true;
        std::string user_agent = "dsync/1.0";
    };

    HttpsClient();
    explicit HttpsClient(Options options);

    HttpsClient(const HttpsClient&) = delete;
    HttpsClient& operator=(const HttpsClient&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

    static constexpr std::size_t kUploadChunkSize = 64 * 1024;

private:
    using Clock = std::chrono::steady_clock;

    template<typename Stream>
    Result<HttpResponse> exchange(Stream& stream, const HttpRequest& request, Clock::time_point deadline);

    template<typename Stream>
    Result<void> write_all(Stream& stream, asio::const_buffer buffer, Clock::time_point deadline);

    template<typename Stream>
    Result<void> write_body(Stream& stream, const HttpRequest& request, Clock::time_point deadline);

    Result<tcp::resolver::results_type> resolve(const Url& url, Clock::time_point deadline);

    Result<void> connect(tcp::socket& socket,
                         const tcp::resolver::results_type& endpoints,
                         Clock::time_point deadline);

    /**
     * @brief Drive the io_context until ec leaves would_block or the deadline passes
     *
     * On timeout `cancel` aborts the pending operation and the io_context is
     * drained, so the handlers' captured locals are never touched after return.
     */
    Result<void> await(const boost::system::error_code& ec,
                       Clock::time_point deadline,
                       const std::function<void()>& cancel,
                       const char* step);

    HttpRequest prepare(const HttpRequest& request) const;

    Options options_;
    asio::io_context io_context_;
    asio::ssl::context ssl_context_;
    std::array<char, 16 * 1024> read_buffer_{};
};

} // namespace network
} // namespace dsync
