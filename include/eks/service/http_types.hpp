#pragma once

/// @file http_types.hpp
/// @brief HTTP/1.1 request and response values plus request-head parsing.

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "eks/foundation/service_result.hpp"

namespace eks::service {

/// A parsed request. Header names are stored lower-cased.
struct HttpRequest {
    std::string method;
    std::string target;  ///< raw request-target
    std::string path;    ///< target without the query string, still encoded
    std::string query;
    std::string version;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    /// Path parameters captured by the matching route, percent-decoded.
    std::unordered_map<std::string, std::string> params;

    /// Correlation id assigned by the server.
    std::string requestId;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

    [[nodiscard]] std::string_view param(std::string_view name) const;
};

/// A response to be serialized by the server.
struct HttpResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    [[nodiscard]] static HttpResponse json(int status, std::string body);

    [[nodiscard]] static HttpResponse text(int status, std::string contentType, std::string body);

    HttpResponse& withHeader(std::string name, std::string value);

    /// Status line, headers (Content-Length, Connection: close) and body.
    [[nodiscard]] std::string serialize() const;
};

/// Standard reason phrase, "Unknown" for unlisted codes.
[[nodiscard]] std::string_view reasonPhrase(int status);

/// Parse the request line and header block (everything before the blank
/// line, CRLF separated). The body is left empty.
/// @return InvalidMessage on malformed input.
[[nodiscard]] foundation::ServiceResult<HttpRequest> parseRequestHead(std::string_view head);

/// Decode %XX escapes. "+" is left as-is (paths, not form data).
/// @return nullopt on a truncated or non-hex escape, or an encoded NUL.
[[nodiscard]] std::optional<std::string> percentDecode(std::string_view text);

}  // namespace eks::service
