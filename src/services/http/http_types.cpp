/// @file http_types.cpp
/// @brief HttpRequest / HttpResponse helpers and request-head parsing.

#include "eks/service/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace eks::service {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

bool isTokenChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

ServiceResult<HttpRequest> malformed(std::string what) {
    return ServiceResult<HttpRequest>::err(ServiceError(ErrorCode::InvalidMessage, std::move(what)));
}

}  // anonymous namespace

// ── HttpRequest ─────────────────────────────────────────────────────────────

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

std::string_view HttpRequest::param(std::string_view name) const {
    auto it = params.find(std::string(name));
    if (it == params.end()) {
        return {};
    }
    return it->second;
}

// ── HttpResponse ────────────────────────────────────────────────────────────

HttpResponse HttpResponse::json(int status, std::string body) {
    HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    return r;
}

HttpResponse HttpResponse::text(int status, std::string contentType, std::string body) {
    HttpResponse r;
    r.status = status;
    r.contentType = std::move(contentType);
    r.body = std::move(body);
    return r;
}

HttpResponse& HttpResponse::withHeader(std::string name, std::string value) {
    headers.emplace_back(std::move(name), std::move(value));
    return *this;
}

std::string HttpResponse::serialize() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << ' ' << reasonPhrase(status)
        << "\r\nContent-Type: " << contentType
        << "\r\nContent-Length: " << body.size()
        << "\r\nConnection: close";
    for (const auto& [name, value] : headers) {
        out << "\r\n" << name << ": " << value;
    }
    out << "\r\n\r\n" << body;
    return out.str();
}

std::string_view reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

// ── Parsing ─────────────────────────────────────────────────────────────────

ServiceResult<HttpRequest> parseRequestHead(std::string_view head) {
    HttpRequest req;

    auto lineEnd = head.find("\r\n");
    std::string_view requestLine = head.substr(0, lineEnd);
    std::string_view rest =
        lineEnd == std::string_view::npos ? std::string_view{} : head.substr(lineEnd + 2);

    // Request line: METHOD SP target SP HTTP/x.y
    auto sp1 = requestLine.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : requestLine.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos ||
        requestLine.find(' ', sp2 + 1) != std::string_view::npos) {
        return malformed("malformed request line");
    }

    auto method = requestLine.substr(0, sp1);
    auto target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
    auto version = requestLine.substr(sp2 + 1);

    if (method.empty() || !std::all_of(method.begin(), method.end(), isTokenChar)) {
        return malformed("invalid method");
    }
    if (target.empty() || target.front() != '/') {
        return malformed("request target must be an absolute path");
    }
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return malformed("unsupported HTTP version");
    }

    req.method = std::string(method);
    req.target = std::string(target);
    req.version = std::string(version);
    auto q = target.find('?');
    req.path = std::string(target.substr(0, q));
    if (q != std::string_view::npos) {
        req.query = std::string(target.substr(q + 1));
    }

    while (!rest.empty()) {
        auto end = rest.find("\r\n");
        std::string_view line = rest.substr(0, end);
        rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 2);
        if (line.empty()) {
            break;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return malformed("malformed header line");
        }
        auto name = line.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(), isTokenChar)) {
            return malformed("invalid header name");
        }
        auto value = trim(line.substr(colon + 1));

        auto key = toLower(name);
        auto [it, inserted] = req.headers.emplace(key, std::string(value));
        if (!inserted) {
            if (key == "content-length") {
                if (it->second != value) {
                    return malformed("conflicting Content-Length headers");
                }
                continue;
            }
            it->second += ", ";
            it->second += value;
        }
    }

    return ServiceResult<HttpRequest>::ok(std::move(req));
}

std::optional<std::string> percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out += text[i];
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::nullopt;
        }
        int hi = hexValue(text[i + 1]);
        int lo = hexValue(text[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        char decoded = static_cast<char>((hi << 4) | lo);
        if (decoded == '\0') {
            return std::nullopt;
        }
        out += decoded;
        i += 2;
    }
    return out;
}

}  // namespace eks::service
