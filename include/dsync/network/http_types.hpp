#pragma once

#include "dsync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace dsync {
namespace network {

/**
 * @brief HTTP request methods used against the storage API
 */
enum class HttpMethod {
    GET,
    PUT,
    POST,
    DELETE_METHOD,  // Renamed to avoid Windows macro conflict
    HEAD
};

/**
 * @brief Case-insensitive header map lookups
 *
 * HTTP headers are case-insensitive per RFC 7230, but we store them as
 * received.
 */
inline std::string find_header(const std::unordered_map<std::string, std::string>& headers,
                               const std::string& name) {
    for (const auto& [key, value] : headers) {
#ifdef _WIN32
        if (_stricmp(key.c_str(), name.c_str()) == 0) {
#else
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
#endif
            return value;
        }
    }
    return "";
}

/**
 * @brief Absolute http(s) URL split into the parts a connection needs
 *
 * Example:
 * https://uploader1.disk.yandex.net:443/upload-target/123?x=1
 *   scheme = "https", host = "uploader1.disk.yandex.net", port = 443,
 *   target = "/upload-target/123?x=1"
 */
struct Url {
    std::string scheme;
    std::string host;
    uint16_t port = 443;
    std::string target = "/";

    bool is_tls() const { return scheme == "https"; }

    std::string to_string() const {
        std::ostringstream oss;
        oss << scheme << "://" << host;
        if ((is_tls() && port != 443) || (!is_tls() && port != 80)) {
            oss << ':' << port;
        }
        oss << target;
        return oss.str();
    }

    static Result<Url> parse(const std::string& text) {
        Url url;
        const auto scheme_end = text.find("://");
        if (scheme_end == std::string::npos) {
            return Err<Url>(ErrorKind::Protocol, "URL without scheme: " + text);
        }
        url.scheme = text.substr(0, scheme_end);
        if (url.scheme == "https") {
            url.port = 443;
        } else if (url.scheme == "http") {
            url.port = 80;
        } else {
            return Err<Url>(ErrorKind::Protocol, "Unsupported URL scheme: " + url.scheme);
        }

        const auto authority_start = scheme_end + 3;
        const auto path_start = text.find_first_of("/?", authority_start);
        const std::string authority = text.substr(authority_start, path_start - authority_start);
        if (authority.empty()) {
            return Err<Url>(ErrorKind::Protocol, "URL without host: " + text);
        }

        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            url.host = authority.substr(0, colon);
            const std::string port_text = authority.substr(colon + 1);
            unsigned long port = 0;
            try {
                port = std::stoul(port_text);
            } catch (const std::exception&) {
                return Err<Url>(ErrorKind::Protocol, "Invalid port in URL: " + text);
            }
            if (port == 0 || port > 65535) {
                return Err<Url>(ErrorKind::Protocol, "Invalid port in URL: " + text);
            }
            url.port = static_cast<uint16_t>(port);
        } else {
            url.host = authority;
        }
        if (url.host.empty()) {
            return Err<Url>(ErrorKind::Protocol, "URL without host: " + text);
        }

        if (path_start != std::string::npos) {
            url.target = text.substr(path_start);
            if (url.target.front() == '?') {
                url.target.insert(url.target.begin(), '/');
            }
        }
        return Ok(url);
    }
};

/**
 * @brief Percent-encode a query component (RFC 3986 unreserved set kept)
 */
inline std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

/**
 * @brief Append "?k=v&k2=v2" to a path, encoding every value
 */
inline std::string with_query(const std::string& path,
                              const std::vector<std::pair<std::string, std::string>>& params) {
    std::string target = path;
    char separator = '?';
    for (const auto& [key, value] : params) {
        target += separator;
        target += url_encode(key);
        target += '=';
        target += url_encode(value);
        separator = '&';
    }
    return target;
}

/**
 * @brief Outgoing HTTP request
 *
 * The body is either held in memory or streamed from body_file when set.
 * Streaming keeps uploads at constant memory regardless of file size.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    Url url;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::optional<std::filesystem::path> body_file;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /**
     * @brief Request line and headers in wire format (body excluded)
     *
     * Format:
     * PUT /target HTTP/1.1\r\n
     * Host: example.com\r\n
     * Content-Length: 13\r\n
     * \r\n
     */
    std::string serialize_head(std::uint64_t content_length) const;
};

/**
 * @brief Parsed HTTP response
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    /**
     * Warning: Only use this if you know the body contains text!
     */
    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::POST: return "POST";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
        }
        return "GET";
    }

    /// Methods whose requests carry a Content-Length even when empty
    static bool sends_body(HttpMethod method) {
        return method == HttpMethod::PUT || method == HttpMethod::POST;
    }
};

inline std::string HttpRequest::serialize_head(std::uint64_t content_length) const {
    std::ostringstream oss;

    oss << HttpMethodUtils::to_string(method) << ' ' << url.target << " HTTP/1.1\r\n";

    if (get_header("Host").empty()) {
        oss << "Host: " << url.host;
        if ((url.is_tls() && url.port != 443) || (!url.is_tls() && url.port != 80)) {
            oss << ':' << url.port;
        }
        oss << "\r\n";
    }

    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }

    if (content_length > 0 || HttpMethodUtils::sends_body(method)) {
        oss << "Content-Length: " << content_length << "\r\n";
    }

    oss << "\r\n";
    return oss.str();
}

/**
 * @brief Sends one request and returns the complete response
 *
 * Transport failures come back as Network/Timeout/Io errors. Any HTTP
 * status, including 4xx/5xx, is a successful transport result.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace network
} // namespace dsync
