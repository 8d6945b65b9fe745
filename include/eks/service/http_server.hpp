#pragma once

/// @file http_server.hpp
/// @brief Minimal HTTP/1.1 server over POSIX sockets.
///
/// One accept thread polls the listening socket; every accepted connection
/// is handed to the JobScheduler worker pool, answered, and closed.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "eks/foundation/service_result.hpp"
#include "eks/service/http_types.hpp"

namespace eks::foundation {
class JobScheduler;
class ServiceMetrics;
}  // namespace eks::foundation

namespace eks::service {

class RouteTable;

/// Configuration for the HttpServer.
struct HttpServerConfig {
    /// IPv4 address to bind.
    std::string bindAddress = "127.0.0.1";

    /// TCP port; 0 picks an ephemeral port (see HttpServer::boundPort()).
    uint16_t port = 3030;

    /// Request header block limit; larger heads get 431.
    std::size_t maxHeaderBytes = 16 * 1024;

    /// Request body limit; larger bodies get 413.
    std::size_t maxBodyBytes = 64 * 1024;

    /// Time allowed to receive a complete request.
    std::chrono::milliseconds readTimeout{5000};
};

/// HTTP front end dispatching requests through a RouteTable.
///
/// Example:
/// @code
///   RouteTable routes;
///   registerKeyRoutes(routes, keyServer, metrics, ready);
///   HttpServer server({.bindAddress = "127.0.0.1", .port = 3030},
///                     routes, metrics, scheduler);
///   server.start();
///   // ...
///   server.stop();
/// @endcode
///
/// Unknown paths answer 404 and known paths with another method 405. Every
/// response carries an X-Request-Id header whose value is also the logging
/// correlation id while the request is handled.
class HttpServer {
public:
    HttpServer(HttpServerConfig config,
               const RouteTable& routes,
               foundation::ServiceMetrics& metrics,
               foundation::JobScheduler& scheduler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start the accept thread.
    /// @return ListenFailed / NetworkError when the socket cannot be set up.
    [[nodiscard]] foundation::ServiceResult<void> start();

    /// Stop accepting, join the accept thread and wait for in-flight
    /// connections to finish. Idempotent.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// The port actually bound (differs from the configured one for port 0).
    [[nodiscard]] uint16_t boundPort() const;

    /// Route a parsed request and record metrics. Exposed for tests.
    [[nodiscard]] HttpResponse dispatch(HttpRequest& request) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace eks::service
