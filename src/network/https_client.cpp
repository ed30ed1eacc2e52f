#include "dsync/network/https_client.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

namespace dsync {
namespace network {
namespace fs = std::filesystem;
namespace {

using ssl_stream = asio::ssl::stream<tcp::socket>;

tcp::socket& socket_of(tcp::socket& socket) { return socket; }
tcp::socket& socket_of(ssl_stream& stream) { return stream.next_layer(); }

void close_socket(tcp::socket& socket) {
    boost::system::error_code ec;
    socket.close(ec);
    if (ec) {
        spdlog::debug("Socket close failed: {}", ec.message());
    }
}

bool is_end_of_stream(const boost::system::error_code& ec) {
    return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

} // namespace

HttpsClient::HttpsClient()
    : HttpsClient(Options{}) {}

HttpsClient::HttpsClient(Options options)
    : options_(std::move(options)),
      ssl_context_(asio::ssl::context::tls_client) {
    boost::system::error_code ec;
    ssl_context_.set_default_verify_paths(ec);
    if (ec) {
        spdlog::warn("Failed to load system CA certificates: {}", ec.message());
    }
}

Result<HttpResponse> HttpsClient::send(const HttpRequest& original) {
    const auto deadline = Clock::now() + options_.timeout;
    const HttpRequest request = prepare(original);

    spdlog::debug("{} {}", HttpMethodUtils::to_string(request.method), request.url.to_string());

    auto endpoints = resolve(request.url, deadline);
    if (endpoints.is_error()) {
        return Err<HttpResponse>(endpoints.error());
    }

    if (!request.url.is_tls()) {
        tcp::socket socket(io_context_);
        if (auto res = connect(socket, endpoints.value(), deadline); res.is_error()) {
            return Err<HttpResponse>(res.error());
        }
        return exchange(socket, request, deadline);
    }

    ssl_stream stream(io_context_, ssl_context_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), request.url.host.c_str())) {
        return Err<HttpResponse>(ErrorKind::Network, "Failed to set TLS server name for " + request.url.host);
    }
    if (options_.verify_peer) {
        stream.set_verify_mode(asio::ssl::verify_peer);
        stream.set_verify_callback(asio::ssl::host_name_verification(request.url.host));
    } else {
        stream.set_verify_mode(asio::ssl::verify_none);
    }

    if (auto res = connect(stream.next_layer(), endpoints.value(), deadline); res.is_error()) {
        return Err<HttpResponse>(res.error());
    }

    boost::system::error_code ec = asio::error::would_block;
    stream.async_handshake(asio::ssl::stream_base::client,
                           [&ec](const boost::system::error_code& result) { ec = result; });
    auto cancel = [&stream]() { close_socket(stream.next_layer()); };
    if (auto res = await(ec, deadline, cancel, "TLS handshake"); res.is_error()) {
        close_socket(stream.next_layer());
        return Err<HttpResponse>(res.error());
    }

    return exchange(stream, request, deadline);
}

template<typename Stream>
Result<HttpResponse> HttpsClient::exchange(Stream& stream, const HttpRequest& request, Clock::time_point deadline) {
    std::uint64_t content_length = request.body.size();
    if (request.body_file) {
        std::error_code size_ec;
        content_length = fs::file_size(*request.body_file, size_ec);
        if (size_ec) {
            close_socket(socket_of(stream));
            return Err<HttpResponse>(ErrorKind::Io,
                "Failed to read file " + request.body_file->string() + ": " + size_ec.message());
        }
    }

    const std::string head = request.serialize_head(content_length);
    if (auto res = write_all(stream, asio::buffer(head), deadline); res.is_error()) {
        close_socket(socket_of(stream));
        return Err<HttpResponse>(res.error());
    }

    if (auto res = write_body(stream, request, deadline); res.is_error()) {
        close_socket(socket_of(stream));
        return Err<HttpResponse>(res.error());
    }

    HttpResponseParser parser(request.method != HttpMethod::HEAD);
    while (!parser.is_complete()) {
        boost::system::error_code ec = asio::error::would_block;
        std::size_t bytes_read = 0;
        stream.async_read_some(asio::buffer(read_buffer_),
            [&ec, &bytes_read](const boost::system::error_code& result, std::size_t n) {
                ec = result;
                bytes_read = n;
            });

        auto cancel = [&stream]() { close_socket(socket_of(stream)); };
        auto waited = await(ec, deadline, cancel, "Read");
        if (waited.is_error() && !is_end_of_stream(ec)) {
            close_socket(socket_of(stream));
            return Err<HttpResponse>(waited.error());
        }

        if (bytes_read > 0) {
            auto parsed = parser.parse(read_buffer_.data(), bytes_read);
            if (parsed.is_error()) {
                close_socket(socket_of(stream));
                return Err<HttpResponse>(parsed.error());
            }
        }

        if (is_end_of_stream(ec) && !parser.is_complete()) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                close_socket(socket_of(stream));
                return Err<HttpResponse>(finished.error());
            }
        }
    }

    close_socket(socket_of(stream));

    HttpResponse response = parser.take_response();
    spdlog::debug("{} {} -> {} ({} bytes)",
                  HttpMethodUtils::to_string(request.method), request.url.target,
                  response.status_code, response.body.size());
    return Ok(std::move(response));
}

template<typename Stream>
Result<void> HttpsClient::write_all(Stream& stream, asio::const_buffer buffer, Clock::time_point deadline) {
    boost::system::error_code ec = asio::error::would_block;
    asio::async_write(stream, buffer,
        [&ec](const boost::system::error_code& result, std::size_t) { ec = result; });
    auto cancel = [&stream]() { close_socket(socket_of(stream)); };
    return await(ec, deadline, cancel, "Write");
}

template<typename Stream>
Result<void> HttpsClient::write_body(Stream& stream, const HttpRequest& request, Clock::time_point deadline) {
    if (!request.body_file) {
        if (request.body.empty()) {
            return Ok();
        }
        return write_all(stream, asio::buffer(request.body), deadline);
    }

    std::ifstream input(*request.body_file, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorKind::Io, "Failed to open file: " + request.body_file->string());
    }

    std::vector<char> chunk(kUploadChunkSize);
    while (input.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (auto res = write_all(stream, asio::buffer(chunk.data(), count), deadline); res.is_error()) {
            return res;
        }
    }

    if (input.bad()) {
        return Err<void>(ErrorKind::Io, "Failed to read file: " + request.body_file->string());
    }
    return Ok();
}

Result<tcp::resolver::results_type> HttpsClient::resolve(const Url& url, Clock::time_point deadline) {
    tcp::resolver resolver(io_context_);
    boost::system::error_code ec = asio::error::would_block;
    tcp::resolver::results_type results;

    resolver.async_resolve(url.host, std::to_string(url.port),
        [&ec, &results](const boost::system::error_code& result, tcp::resolver::results_type found) {
            ec = result;
            results = std::move(found);
        });

    auto cancel = [&resolver]() { resolver.cancel(); };
    if (auto res = await(ec, deadline, cancel, "Resolve"); res.is_error()) {
        return Err<tcp::resolver::results_type>(
            Error{res.error().kind, res.error().message + " (" + url.host + ")"});
    }
    return Ok(std::move(results));
}

Result<void> HttpsClient::connect(tcp::socket& socket,
                                  const tcp::resolver::results_type& endpoints,
                                  Clock::time_point deadline) {
    boost::system::error_code ec = asio::error::would_block;
    asio::async_connect(socket, endpoints,
        [&ec](const boost::system::error_code& result, const tcp::endpoint&) { ec = result; });

    auto cancel = [&socket]() { close_socket(socket); };
    return await(ec, deadline, cancel, "Connect");
}

Result<void> HttpsClient::await(const boost::system::error_code& ec,
                                Clock::time_point deadline,
                                const std::function<void()>& cancel,
                                const char* step) {
    io_context_.restart();
    while (ec == asio::error::would_block) {
        const auto now = Clock::now();
        if (now >= deadline) {
            cancel();
            // Let the aborted handler run before its captures go out of scope
            io_context_.restart();
            io_context_.run();
            return Err<void>(ErrorKind::Timeout,
                std::string(step) + " timed out after " + std::to_string(options_.timeout.count()) + "s");
        }
        io_context_.run_one_for(deadline - now);
    }

    if (ec) {
        return Err<void>(ErrorKind::Network, std::string(step) + " failed: " + ec.message());
    }
    return Ok();
}

HttpRequest HttpsClient::prepare(const HttpRequest& request) const {
    HttpRequest prepared = request;
    if (prepared.get_header("User-Agent").empty()) {
        prepared.set_header("User-Agent", options_.user_agent);
    }
    prepared.set_header("Connection", "close");
    return prepared;
}

} // namespace network
} // namespace dsync
