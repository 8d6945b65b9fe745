/// @file key_api.cpp
/// @brief KeyApi route handlers.

#include "eks/service/key_api.hpp"

#include "eks/foundation/service_metrics.hpp"
#include "eks/service/key_server.hpp"
#include "eks/service/route_table.hpp"
#include "eks/service/wire_codec.hpp"

namespace eks::service {

using foundation::ErrorCode;

namespace {

HttpResponse errorReply(int status, std::string_view message) {
    return HttpResponse::json(status, wire::encodeError(message));
}

}  // anonymous namespace

KeyApi::KeyApi(KeyServer& server, foundation::ServiceMetrics& metrics, std::string serviceName)
    : server_(server),
      metrics_(metrics),
      serviceName_(std::move(serviceName)),
      startTime_(std::chrono::steady_clock::now()) {}

void KeyApi::registerRoutes(RouteTable& routes) {
    routes.addRoute("POST", "/challenge",
                    [this](const HttpRequest& r) { return handleChallenge(r); });
    routes.addRoute("POST", "/response",
                    [this](const HttpRequest& r) { return handleResponse(r); });
    routes.addRoute("GET", "/key/{name}",
                    [this](const HttpRequest& r) { return handleLookup(r); });
    routes.addRoute("GET", "/healthz",
                    [this](const HttpRequest& r) { return handleHealth(r); });
    routes.addRoute("GET", "/readyz",
                    [this](const HttpRequest& r) { return handleReady(r); });
    routes.addRoute("GET", "/metrics",
                    [this](const HttpRequest& r) { return handleMetrics(r); });
}

void KeyApi::setReady(bool ready) {
    ready_.store(ready, std::memory_order_relaxed);
    metrics_.setGauge("eks_health_ready", ready ? 1.0 : 0.0);
}

bool KeyApi::isReady() const {
    return ready_.load(std::memory_order_relaxed);
}

HttpResponse KeyApi::handleChallenge(const HttpRequest& request) {
    auto parsed = wire::decodeChallengeRequest(request.body);
    if (parsed.hasError()) {
        return errorReply(400, "invalid request body");
    }

    auto challenge = server_.issueChallenge(parsed.value());
    if (challenge.hasError()) {
        switch (challenge.error().code()) {
            case ErrorCode::InvalidKey:
            case ErrorCode::UnsupportedKeyType:
            case ErrorCode::KeyTooWeak:
                return errorReply(400, "invalid public key");
            default:
                return errorReply(500, "could not create challenge");
        }
    }
    return HttpResponse::json(200, wire::encodeChallenge(challenge.value()));
}

HttpResponse KeyApi::handleResponse(const HttpRequest& request) {
    auto parsed = wire::decodeChallengeResponse(request.body);
    if (parsed.hasError()) {
        return errorReply(400, "invalid request body");
    }

    auto record = server_.submitResponse(parsed.value());
    if (record.hasError()) {
        switch (record.error().code()) {
            case ErrorCode::InvalidName:
                return errorReply(400, "invalid name");
            case ErrorCode::ChallengeFailed:
            case ErrorCode::ChallengeExpired:
            case ErrorCode::MalformedState:
                return errorReply(400, "failed challenge");
            case ErrorCode::NameTaken:
                return errorReply(409, "name taken");
            default:
                return errorReply(500, "could not insert");
        }
    }
    return HttpResponse::json(201, "null");
}

HttpResponse KeyApi::handleLookup(const HttpRequest& request) {
    auto der = server_.lookupKey(request.param("name"));
    if (der.hasError()) {
        // Storage failures are logged by KeyServer and look like a miss here.
        return errorReply(404, "not found");
    }
    return HttpResponse::json(200, wire::encodePublicKey(der.value()));
}

HttpResponse KeyApi::handleHealth(const HttpRequest& /*request*/) const {
    auto health = metrics_.healthCheck();
    health.serviceName = serviceName_;
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - startTime_);
    return HttpResponse::json(200, wire::encodeHealth(health, uptime.count()));
}

HttpResponse KeyApi::handleReady(const HttpRequest& request) const {
    if (!isReady()) {
        return HttpResponse::json(503, wire::encodeNotReady(serviceName_));
    }
    return handleHealth(request);
}

HttpResponse KeyApi::handleMetrics(const HttpRequest& /*request*/) const {
    return HttpResponse::text(200, "text/plain; version=0.0.4; charset=utf-8", metrics_.scrape());
}

}  // namespace eks::service
