/// @file http_server.cpp
/// @brief HttpServer implementation.
///
/// POSIX sockets with a poll-based accept loop. Connection handling runs on
/// the JobScheduler pool; stop() waits for it to drain.

#include "eks/service/http_server.hpp"

#include "eks/foundation/job_scheduler.hpp"
#include "eks/foundation/json_log_formatter.hpp"
#include "eks/foundation/service_logger.hpp"
#include "eks/foundation/service_metrics.hpp"
#include "eks/service/route_table.hpp"
#include "eks/service/wire_codec.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <charconv>
#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

// POSIX socket headers
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace eks::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::string_view kHeadTerminator = "\r\n\r\n";

ServiceResult<HttpRequest> readFailure(ErrorCode code, std::string what) {
    return ServiceResult<HttpRequest>::err(ServiceError(code, std::move(what)));
}

/// recv() with a deadline. Returns bytes read, 0 on orderly close, -1 on
/// error and -2 on timeout.
ssize_t recvUntil(int fd, char* buf, std::size_t len, Clock::time_point deadline) {
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            return -2;
        }
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        if (ret == 0) {
            return -2;
        }
        ssize_t n = recv(fd, buf, len, 0);
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        return n;
    }
}

bool sendAll(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

/// After an early rejection the peer may still be sending. Half-close and
/// discard what arrives, so close() does not reset the connection before the
/// error response is read.
void lingerAfterReject(int fd) {
    shutdown(fd, SHUT_WR);
    const auto deadline = Clock::now() + std::chrono::seconds(1);
    std::array<char, 4096> discard{};
    std::size_t drained = 0;
    while (drained < 256 * 1024) {
        auto n = recvUntil(fd, discard.data(), discard.size(), deadline);
        if (n <= 0) {
            break;
        }
        drained += static_cast<std::size_t>(n);
    }
}

std::string_view statusClass(int status) {
    if (status >= 500) return "5xx";
    if (status >= 400) return "4xx";
    if (status >= 300) return "3xx";
    if (status >= 200) return "2xx";
    return "1xx";
}

/// Client-supplied request ids are reused when short and printable.
bool acceptableRequestId(std::string_view id) {
    if (id.empty() || id.size() > 128) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return c > 0x20 && c < 0x7F;
    });
}

}  // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct HttpServer::Impl {
    HttpServerConfig config;
    const RouteTable& routes;
    foundation::ServiceMetrics& metrics;
    foundation::JobScheduler& scheduler;

    std::atomic<bool> running{false};
    std::thread acceptThread;
    int listenFd{-1};
    uint16_t boundPort{0};

    std::mutex inFlightMutex;
    std::condition_variable inFlightCv;
    std::size_t inFlight{0};

    Impl(HttpServerConfig cfg, const RouteTable& r, foundation::ServiceMetrics& m,
         foundation::JobScheduler& s)
        : config(std::move(cfg)), routes(r), metrics(m), scheduler(s) {}

    void run() {
        while (running.load(std::memory_order_relaxed)) {
            struct pollfd pfd{};
            pfd.fd = listenFd;
            pfd.events = POLLIN;

            // 500ms timeout keeps stop() responsive.
            int ret = poll(&pfd, 1, 500);
            if (ret <= 0 || (pfd.revents & POLLIN) == 0) {
                continue;
            }

            int clientFd = accept(listenFd, nullptr, nullptr);
            if (clientFd < 0) {
                continue;
            }

            {
                std::lock_guard lock(inFlightMutex);
                ++inFlight;
            }
            auto submitted = scheduler.submit([this, clientFd]() {
                serveConnection(clientFd);
                close(clientFd);
                finishOne();
            });
            if (submitted.hasError()) {
                EKS_LOG_ERROR(LogCategory::Http,
                              "could not dispatch connection: " +
                                  std::string(submitted.error().message()));
                auto busy = HttpResponse::json(503, wire::encodeError("server busy"));
                (void)sendAll(clientFd, busy.serialize());
                close(clientFd);
                finishOne();
            }
        }
    }

    void finishOne() {
        std::lock_guard lock(inFlightMutex);
        --inFlight;
        inFlightCv.notify_all();
    }

    /// Queued jobs reference this Impl, so stop() must not return before
    /// the last one finishes.
    void waitForDrain() {
        std::unique_lock lock(inFlightMutex);
        auto drained = [this] { return inFlight == 0; };
        if (!inFlightCv.wait_for(lock, config.readTimeout + std::chrono::seconds(5), drained)) {
            EKS_LOG_WARN(LogCategory::Http,
                         std::to_string(inFlight) + " connection(s) still in flight after " +
                             "the read timeout, waiting for them to finish");
            inFlightCv.wait(lock, drained);
        }
    }

    ServiceResult<HttpRequest> readRequest(int fd) {
        const auto deadline = Clock::now() + config.readTimeout;
        std::string buffer;
        std::array<char, 4096> chunk{};

        std::size_t headEnd = std::string::npos;
        while (headEnd == std::string::npos) {
            auto n = recvUntil(fd, chunk.data(), chunk.size(), deadline);
            if (n == -2) {
                return readFailure(ErrorCode::Timeout, "timed out reading request head");
            }
            if (n <= 0) {
                return readFailure(ErrorCode::ConnectionClosed, "connection closed");
            }
            auto searchFrom = buffer.size() >= 3 ? buffer.size() - 3 : 0;
            buffer.append(chunk.data(), static_cast<std::size_t>(n));
            headEnd = buffer.find(kHeadTerminator, searchFrom);
            if (headEnd == std::string::npos && buffer.size() > config.maxHeaderBytes) {
                return readFailure(ErrorCode::HeaderTooLarge, "request head too large");
            }
        }
        if (headEnd > config.maxHeaderBytes) {
            return readFailure(ErrorCode::HeaderTooLarge, "request head too large");
        }

        auto parsed = parseRequestHead(std::string_view(buffer).substr(0, headEnd + 2));
        if (parsed.hasError()) {
            return parsed;
        }
        auto& request = parsed.value();

        if (request.header("transfer-encoding")) {
            return readFailure(ErrorCode::LengthRequired, "chunked bodies are not supported");
        }

        std::size_t contentLength = 0;
        if (auto cl = request.header("content-length")) {
            auto [ptr, ec] = std::from_chars(cl->data(), cl->data() + cl->size(), contentLength);
            if (ec != std::errc{} || ptr != cl->data() + cl->size()) {
                return readFailure(ErrorCode::InvalidMessage, "invalid Content-Length");
            }
        }
        if (contentLength > config.maxBodyBytes) {
            return readFailure(ErrorCode::PayloadTooLarge, "request body too large");
        }

        std::string body = buffer.substr(headEnd + kHeadTerminator.size());
        while (body.size() < contentLength) {
            auto want = std::min(chunk.size(), contentLength - body.size());
            auto n = recvUntil(fd, chunk.data(), want, deadline);
            if (n == -2) {
                return readFailure(ErrorCode::Timeout, "timed out reading request body");
            }
            if (n <= 0) {
                return readFailure(ErrorCode::ConnectionClosed, "connection closed mid-body");
            }
            body.append(chunk.data(), static_cast<std::size_t>(n));
        }
        // Pipelined bytes past Content-Length are dropped with the connection.
        body.resize(contentLength);
        request.body = std::move(body);
        return parsed;
    }

    HttpResponse errorResponse(const ServiceError& error) const {
        switch (error.code()) {
            case ErrorCode::HeaderTooLarge:
                return HttpResponse::json(431, wire::encodeError("request header too large"));
            case ErrorCode::PayloadTooLarge:
                return HttpResponse::json(413, wire::encodeError("request body too large"));
            case ErrorCode::LengthRequired:
                return HttpResponse::json(411, wire::encodeError("content length required"));
            default:
                return HttpResponse::json(400, wire::encodeError("malformed request"));
        }
    }

    void serveConnection(int fd) {
        auto request = readRequest(fd);
        if (request.hasError()) {
            const auto code = request.error().code();
            if (code == ErrorCode::Timeout || code == ErrorCode::ConnectionClosed) {
                EKS_LOG_DEBUG(LogCategory::Http, std::string(request.error().message()));
                return;
            }
            EKS_LOG_DEBUG(LogCategory::Http,
                          "rejecting request: " + std::string(request.error().message()));
            auto response = errorResponse(request.error());
            auto requestId = foundation::generateCorrelationId();
            response.withHeader("X-Request-Id", requestId);
            recordMetrics(response.status, 0.0);
            if (sendAll(fd, response.serialize())) {
                lingerAfterReject(fd);
            }
            return;
        }

        auto response = dispatch(request.value());
        if (!sendAll(fd, response.serialize())) {
            EKS_LOG_DEBUG(LogCategory::Http, "client went away before the response was sent");
        }
    }

    HttpResponse dispatch(HttpRequest& request) const {
        const auto started = Clock::now();

        if (auto id = request.header("x-request-id"); id && acceptableRequestId(*id)) {
            request.requestId = std::string(*id);
        } else {
            request.requestId = foundation::generateCorrelationId();
        }
        foundation::CorrelationScope scope(request.requestId);

        HttpResponse response;
        auto match = routes.resolve(request.method, request.path);
        switch (match.status) {
            case RouteMatch::Status::Matched:
                request.params = std::move(match.params);
                try {
                    response = match.handler(request);
                } catch (const std::exception& e) {
                    EKS_LOG_ERROR(LogCategory::Http,
                                  "handler for " + request.path + " threw: " + e.what());
                    response = HttpResponse::json(500, wire::encodeError("internal error"));
                }
                break;
            case RouteMatch::Status::MethodNotAllowed: {
                response = HttpResponse::json(405, wire::encodeError("method not allowed"));
                std::string allow;
                for (const auto& m : match.allowedMethods) {
                    if (!allow.empty()) {
                        allow += ", ";
                    }
                    allow += m;
                }
                response.withHeader("Allow", allow);
                break;
            }
            case RouteMatch::Status::NotFound:
                response = HttpResponse::json(404, wire::encodeError("not found"));
                break;
        }

        response.withHeader("X-Request-Id", request.requestId);

        auto elapsed = std::chrono::duration<double, std::milli>(Clock::now() - started);
        recordMetrics(response.status, elapsed.count());
        EKS_LOG_DEBUG(LogCategory::Http, request.method + " " + request.path + " -> " +
                                             std::to_string(response.status));
        return response;
    }

    void recordMetrics(int status, double durationMs) const {
        metrics.incrementCounter("eks_http_requests_total");
        metrics.recordHistogram("eks_http_request_duration_ms", durationMs);
        metrics.incrementCounter("eks_http_responses_" + std::string(statusClass(status)) +
                                 "_total");
    }
};

// ── Public API ──────────────────────────────────────────────────────────────

HttpServer::HttpServer(HttpServerConfig config,
                       const RouteTable& routes,
                       foundation::ServiceMetrics& metrics,
                       foundation::JobScheduler& scheduler)
    : impl_(std::make_unique<Impl>(std::move(config), routes, metrics, scheduler)) {
    impl_->metrics.registerHistogram("eks_http_request_duration_ms",
                                     foundation::HistogramBuckets::defaultLatency());
}

HttpServer::~HttpServer() {
    stop();
}

ServiceResult<void> HttpServer::start() {
    if (impl_->running.load()) {
        return ServiceResult<void>::ok();
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(impl_->config.port);
    if (inet_pton(AF_INET, impl_->config.bindAddress.c_str(), &addr.sin_addr) != 1) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ListenFailed,
                         "invalid bind address: " + impl_->config.bindAddress));
    }

    impl_->listenFd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (impl_->listenFd < 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NetworkError,
                         std::string("failed to create socket: ") + std::strerror(errno)));
    }

    int optval = 1;
    setsockopt(impl_->listenFd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    auto fail = [this](const std::string& what) {
        std::string message = what + ": " + std::strerror(errno);
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return ServiceResult<void>::err(ServiceError(ErrorCode::ListenFailed, message));
    };

    if (bind(impl_->listenFd,
             reinterpret_cast<struct sockaddr*>(&addr),  // NOLINT
             sizeof(addr)) < 0) {
        return fail("failed to bind " + impl_->config.bindAddress + ":" +
                    std::to_string(impl_->config.port));
    }

    if (listen(impl_->listenFd, SOMAXCONN) < 0) {
        return fail("failed to listen");
    }

    struct sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(impl_->listenFd, reinterpret_cast<struct sockaddr*>(&bound),  // NOLINT
                    &boundLen) < 0) {
        return fail("getsockname failed");
    }
    impl_->boundPort = ntohs(bound.sin_port);

    impl_->running.store(true, std::memory_order_relaxed);
    impl_->acceptThread = std::thread([this]() { impl_->run(); });

    EKS_LOG_INFO(LogCategory::Http, "listening on " + impl_->config.bindAddress + ":" +
                                        std::to_string(impl_->boundPort));
    return ServiceResult<void>::ok();
}

void HttpServer::stop() {
    if (!impl_->running.exchange(false, std::memory_order_relaxed)) {
        return;
    }

    if (impl_->acceptThread.joinable()) {
        impl_->acceptThread.join();
    }
    if (impl_->listenFd >= 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
    }
    impl_->waitForDrain();
    EKS_LOG_INFO(LogCategory::Http, "http server stopped");
}

bool HttpServer::isRunning() const {
    return impl_->running.load(std::memory_order_relaxed);
}

uint16_t HttpServer::boundPort() const {
    return impl_->boundPort;
}

HttpResponse HttpServer::dispatch(HttpRequest& request) const {
    return impl_->dispatch(request);
}

}  // namespace eks::service
