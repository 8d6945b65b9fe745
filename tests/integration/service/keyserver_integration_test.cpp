/// @file keyserver_integration_test.cpp
/// @brief Full register/lookup flow through a live HttpServer on loopback.

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "eks/crypto/state_cipher.hpp"
#include "eks/foundation/job_scheduler.hpp"
#include "eks/foundation/service_metrics.hpp"
#include "eks/service/http_server.hpp"
#include "eks/service/key_api.hpp"
#include "eks/service/key_repository.hpp"
#include "eks/service/key_server.hpp"
#include "eks/service/route_table.hpp"
#include "support/rsa_test_key.hpp"

using namespace eks::service;
using eks::crypto::StateCipher;
using eks::foundation::Bytes;
using eks::foundation::JobScheduler;
using eks::foundation::ServiceMetrics;
using eks::test::RsaTestKey;
using nlohmann::json;

namespace {

struct ClientResponse {
    int status = 0;
    std::unordered_map<std::string, std::string> headers;  ///< lower-cased names
    std::string body;
};

/// Connected loopback socket with a receive timeout, so a silent server
/// fails the test instead of hanging it.
int connectTo(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("socket failed");
    }
    struct timeval tv{};
    tv.tv_sec = 10;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {  // NOLINT
        close(fd);
        throw std::runtime_error("connect failed");
    }
    return fd;
}

void sendRaw(int fd, const std::string& raw) {
    std::size_t sent = 0;
    while (sent < raw.size()) {
        auto n = send(fd, raw.data() + sent, raw.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            close(fd);
            throw std::runtime_error("send failed");
        }
        sent += static_cast<std::size_t>(n);
    }
}

/// Read until the server closes (or the receive timeout fires).
std::string readAll(int fd) {
    std::string wire;
    char buf[4096];
    while (true) {
        auto n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        wire.append(buf, static_cast<std::size_t>(n));
    }
    return wire;
}

/// Send @p raw to 127.0.0.1:@p port and read until the server closes.
ClientResponse roundTrip(uint16_t port, const std::string& raw) {
    int fd = connectTo(port);
    sendRaw(fd, raw);
    std::string wire = readAll(fd);
    close(fd);

    ClientResponse response;
    auto headEnd = wire.find("\r\n\r\n");
    if (wire.compare(0, 9, "HTTP/1.1 ") != 0 || headEnd == std::string::npos) {
        throw std::runtime_error("malformed response: " + wire);
    }
    response.status = std::stoi(wire.substr(9, 3));
    response.body = wire.substr(headEnd + 4);

    auto pos = wire.find("\r\n") + 2;
    while (pos < headEnd) {
        auto end = wire.find("\r\n", pos);
        auto line = wire.substr(pos, end - pos);
        auto colon = line.find(':');
        std::string name = line.substr(0, colon);
        for (auto& c : name) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        response.headers[name] = line.substr(line.find_first_not_of(' ', colon + 1));
        pos = end + 2;
    }
    return response;
}

std::string request(const std::string& method, const std::string& target,
                    const std::string& body = {}, const std::string& extraHeaders = {}) {
    std::string raw = method + " " + target + " HTTP/1.1\r\nHost: localhost\r\n" + extraHeaders;
    if (!body.empty() || method == "POST") {
        raw += "Content-Type: application/json\r\nContent-Length: " +
               std::to_string(body.size()) + "\r\n";
    }
    raw += "\r\n" + body;
    return raw;
}

}  // namespace

// =============================================================================
// Test fixture
// =============================================================================

class KeyserverIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto cipher = StateCipher::generate();
        ASSERT_TRUE(cipher.hasValue());

        repo_ = std::make_shared<InMemoryKeyRepository>();
        keyServer_ = std::make_unique<KeyServer>(KeyServerConfig{}, std::move(cipher).value(),
                                                 repo_, metrics_);
        api_ = std::make_unique<KeyApi>(*keyServer_, metrics_, "ember-keyserver");
        api_->registerRoutes(routes_);

        HttpServerConfig config;
        config.bindAddress = "127.0.0.1";
        config.port = 0;
        config.maxBodyBytes = 8192;
        config.readTimeout = std::chrono::milliseconds(2000);

        scheduler_ = std::make_unique<JobScheduler>(2);
        http_ = std::make_unique<HttpServer>(config, routes_, metrics_, *scheduler_);
        auto started = http_->start();
        ASSERT_TRUE(started.hasValue()) << started.error().message();
        ASSERT_NE(http_->boundPort(), 0);
        api_->setReady(true);
    }

    void TearDown() override {
        if (http_) {
            http_->stop();
        }
        if (scheduler_) {
            scheduler_->shutdown();
        }
    }

    ClientResponse send(const std::string& raw) { return roundTrip(http_->boundPort(), raw); }

    /// POST /challenge + POST /response for @p key under @p name.
    ClientResponse registerKey(const RsaTestKey& key, const std::string& name,
                               bool tamperState = false) {
        auto challengeReply =
            send(request("POST", "/challenge", json{{"pubkey", key.publicDer()}}.dump()));
        EXPECT_EQ(challengeReply.status, 200) << challengeReply.body;
        auto challenge = json::parse(challengeReply.body);

        auto state = challenge["state"].get<Bytes>();
        if (tamperState) {
            state.back() ^= 0x01;
        }
        json body = {{"response", key.decrypt(challenge["challenge"].get<Bytes>())},
                     {"state", state},
                     {"nonce", challenge["nonce"]},
                     {"name", name}};
        return send(request("POST", "/response", body.dump()));
    }

    ServiceMetrics metrics_;
    RouteTable routes_;
    std::shared_ptr<InMemoryKeyRepository> repo_;
    std::unique_ptr<KeyServer> keyServer_;
    std::unique_ptr<KeyApi> api_;
    std::unique_ptr<JobScheduler> scheduler_;
    std::unique_ptr<HttpServer> http_;
};

// =============================================================================
// Registration flow
// =============================================================================

TEST_F(KeyserverIntegrationTest, RegisterThenLookup) {
    auto created = registerKey(RsaTestKey::shared(), "alice");
    EXPECT_EQ(created.status, 201);
    EXPECT_EQ(created.body, "null");

    auto found = send(request("GET", "/key/alice"));
    EXPECT_EQ(found.status, 200);
    EXPECT_EQ(found.headers["content-type"], "application/json");
    EXPECT_EQ(json::parse(found.body)["pubkey"].get<Bytes>(), RsaTestKey::shared().publicDer());
}

TEST_F(KeyserverIntegrationTest, SecondRegistrationOfNameConflicts) {
    ASSERT_EQ(registerKey(RsaTestKey::shared(), "alice").status, 201);

    auto conflict = registerKey(RsaTestKey::sharedOther(), "alice");
    EXPECT_EQ(conflict.status, 409);
    EXPECT_EQ(json::parse(conflict.body)["error"], "name taken");
}

TEST_F(KeyserverIntegrationTest, TamperedStateFails) {
    auto reply = registerKey(RsaTestKey::shared(), "alice", /*tamperState=*/true);
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(json::parse(reply.body)["error"], "failed challenge");
    EXPECT_EQ(send(request("GET", "/key/alice")).status, 404);
}

TEST_F(KeyserverIntegrationTest, PercentEncodedNameLookup) {
    ASSERT_EQ(registerKey(RsaTestKey::shared(), "alice smith").status, 201);
    EXPECT_EQ(send(request("GET", "/key/alice%20smith")).status, 200);
}

TEST_F(KeyserverIntegrationTest, UnknownNameIsNotFound) {
    auto reply = send(request("GET", "/key/nobody"));
    EXPECT_EQ(reply.status, 404);
    EXPECT_EQ(json::parse(reply.body)["error"], "not found");
}

TEST_F(KeyserverIntegrationTest, BadBodyIsRejected) {
    auto reply = send(request("POST", "/challenge", "{not json"));
    EXPECT_EQ(reply.status, 400);
    EXPECT_EQ(json::parse(reply.body)["error"], "invalid request body");
}

// =============================================================================
// Routing and framing
// =============================================================================

TEST_F(KeyserverIntegrationTest, EveryResponseCarriesRequestId) {
    auto generated = send(request("GET", "/healthz"));
    EXPECT_EQ(generated.status, 200);
    EXPECT_EQ(generated.headers["x-request-id"].size(), 36u);

    auto echoed = send(request("GET", "/healthz", {}, "X-Request-Id: trace-abc-123\r\n"));
    EXPECT_EQ(echoed.headers["x-request-id"], "trace-abc-123");
}

TEST_F(KeyserverIntegrationTest, WrongMethodIs405) {
    auto reply = send(request("GET", "/challenge"));
    EXPECT_EQ(reply.status, 405);
    EXPECT_EQ(reply.headers["allow"], "POST");
}

TEST_F(KeyserverIntegrationTest, UnknownPathIs404) {
    EXPECT_EQ(send(request("GET", "/nothing/here")).status, 404);
}

TEST_F(KeyserverIntegrationTest, MalformedRequestLineIs400) {
    auto reply = send("NONSENSE\r\n\r\n");
    EXPECT_EQ(reply.status, 400);
}

TEST_F(KeyserverIntegrationTest, OversizedBodyIs413) {
    // Only the head is sent; the declared length alone is over the limit.
    auto reply = send("POST /challenge HTTP/1.1\r\nHost: localhost\r\n"
                      "Content-Length: 9000\r\n\r\n");
    EXPECT_EQ(reply.status, 413);
}

TEST_F(KeyserverIntegrationTest, OversizedHeadIs431) {
    auto raw = request("GET", "/healthz", {}, "X-Padding: " + std::string(20000, 'a') + "\r\n");
    auto reply = send(raw);
    EXPECT_EQ(reply.status, 431);
    EXPECT_EQ(json::parse(reply.body)["error"], "request header too large");
    EXPECT_EQ(reply.headers["x-request-id"].size(), 36u);
}

TEST_F(KeyserverIntegrationTest, TransferEncodingIs411) {
    auto reply = send("POST /challenge HTTP/1.1\r\nHost: localhost\r\n"
                      "Transfer-Encoding: chunked\r\n\r\n");
    EXPECT_EQ(reply.status, 411);
    EXPECT_EQ(json::parse(reply.body)["error"], "content length required");
}

TEST_F(KeyserverIntegrationTest, StalledClientIsDisconnected) {
    int fd = connectTo(http_->boundPort());
    sendRaw(fd, "GET /healthz HTTP/1.1\r\nHost: loc");

    const auto started = std::chrono::steady_clock::now();
    std::string wire = readAll(fd);
    const auto waited = std::chrono::steady_clock::now() - started;
    close(fd);

    // Closed without a response once the 2000 ms read timeout ran out.
    EXPECT_TRUE(wire.empty()) << wire;
    EXPECT_GE(waited, std::chrono::milliseconds(1500));
    EXPECT_LT(waited, std::chrono::seconds(8));
}

TEST_F(KeyserverIntegrationTest, ReadinessAndMetrics) {
    EXPECT_EQ(send(request("GET", "/readyz")).status, 200);
    api_->setReady(false);
    EXPECT_EQ(send(request("GET", "/readyz")).status, 503);

    auto metrics = send(request("GET", "/metrics"));
    EXPECT_EQ(metrics.status, 200);
    EXPECT_NE(metrics.body.find("eks_http_requests_total"), std::string::npos);
}

// =============================================================================
// Shutdown
// =============================================================================

TEST(HttpServerShutdownTest, StopWaitsForInFlightHandler) {
    std::promise<void> entered;
    std::promise<void> release;
    auto releaseSignal = release.get_future().share();
    std::atomic<bool> handlerFinished{false};

    RouteTable routes;
    routes.addRoute("GET", "/slow", [&](const HttpRequest&) {
        entered.set_value();
        releaseSignal.wait();
        handlerFinished.store(true);
        return HttpResponse::json(200, "{}");
    });

    ServiceMetrics metrics;
    JobScheduler scheduler(2);
    HttpServerConfig config;
    config.bindAddress = "127.0.0.1";
    config.port = 0;
    config.readTimeout = std::chrono::milliseconds(100);

    HttpServer server(config, routes, metrics, scheduler);
    ASSERT_TRUE(server.start().hasValue());
    const auto port = server.boundPort();

    auto client = std::async(std::launch::async,
                             [port] { return roundTrip(port, request("GET", "/slow")); });
    ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);

    // Hold the handler past the read timeout plus the five second grace.
    auto stopping = std::async(std::launch::async, [&server] { server.stop(); });
    EXPECT_EQ(stopping.wait_for(std::chrono::milliseconds(5500)), std::future_status::timeout);
    EXPECT_FALSE(handlerFinished.load());

    release.set_value();
    ASSERT_EQ(stopping.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_TRUE(handlerFinished.load());
    EXPECT_EQ(client.get().status, 200);
    scheduler.shutdown();
}
