#pragma once

/// @file route_table.hpp
/// @brief Method + path-pattern routing for the HTTP server.

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "eks/service/http_types.hpp"

namespace eks::service {

using RouteHandler = std::function<HttpResponse(const HttpRequest&)>;

/// One registered route.
struct RouteEntry {
    std::string method;
    std::string pattern;  ///< e.g. "/key/{name}"
    RouteHandler handler;
};

/// Outcome of RouteTable::resolve().
struct RouteMatch {
    enum class Status : uint8_t {
        Matched,
        MethodNotAllowed,  ///< the path exists under another method
        NotFound
    };

    Status status = Status::NotFound;
    RouteHandler handler;
    std::unordered_map<std::string, std::string> params;
    std::vector<std::string> allowedMethods;  ///< filled for MethodNotAllowed
};

/// Path-pattern routing table.
///
/// A pattern is a sequence of "/"-separated segments; a segment written
/// "{name}" captures exactly one non-empty path segment, percent-decoded.
/// Routes are tried in registration order.
///
/// Example:
/// @code
///   RouteTable routes;
///   routes.addRoute("GET", "/key/{name}", handleLookup);
///
///   auto match = routes.resolve("GET", "/key/alice");
///   // match.status == Matched, match.params["name"] == "alice"
/// @endcode
class RouteTable {
public:
    void addRoute(std::string method, std::string pattern, RouteHandler handler);

    [[nodiscard]] RouteMatch resolve(std::string_view method, std::string_view path) const;

    [[nodiscard]] std::size_t size() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<RouteEntry> routes_;
};

}  // namespace eks::service
