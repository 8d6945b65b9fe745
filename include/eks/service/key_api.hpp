#pragma once

/// @file key_api.hpp
/// @brief HTTP bindings of the key service plus health and metrics endpoints.

#include <atomic>
#include <chrono>
#include <string>

#include "eks/service/http_types.hpp"

namespace eks::foundation {
class ServiceMetrics;
}

namespace eks::service {

class KeyServer;
class RouteTable;

/// Maps HTTP requests onto KeyServer operations.
///
/// Routes:
///   - POST /challenge    → 200 Challenge
///   - POST /response     → 201 null
///   - GET  /key/{name}   → 200 {"pubkey": [..]}
///   - GET  /healthz      → 200 health JSON (liveness)
///   - GET  /readyz       → 200 when ready, 503 otherwise
///   - GET  /metrics      → Prometheus text
///
/// Example:
/// @code
///   KeyApi api(keyServer, metrics, "ember-keyserver");
///   RouteTable routes;
///   api.registerRoutes(routes);
///   api.setReady(true);
/// @endcode
class KeyApi {
public:
    KeyApi(KeyServer& server, foundation::ServiceMetrics& metrics, std::string serviceName);

    void registerRoutes(RouteTable& routes);

    /// When false, /readyz returns 503.
    void setReady(bool ready);

    [[nodiscard]] bool isReady() const;

    [[nodiscard]] HttpResponse handleChallenge(const HttpRequest& request);
    [[nodiscard]] HttpResponse handleResponse(const HttpRequest& request);
    [[nodiscard]] HttpResponse handleLookup(const HttpRequest& request);
    [[nodiscard]] HttpResponse handleHealth(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse handleReady(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse handleMetrics(const HttpRequest& request) const;

private:
    KeyServer& server_;
    foundation::ServiceMetrics& metrics_;
    std::string serviceName_;
    std::atomic<bool> ready_{false};
    std::chrono::steady_clock::time_point startTime_;
};

}  // namespace eks::service
