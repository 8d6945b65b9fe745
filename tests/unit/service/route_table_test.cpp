#include <gtest/gtest.h>

#include <string>

#include "eks/service/route_table.hpp"

using namespace eks::service;

namespace {

RouteHandler respondWith(std::string body) {
    return [body](const HttpRequest&) { return HttpResponse::json(200, body); };
}

}  // namespace

class RouteTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        routes_.addRoute("POST", "/challenge", respondWith("challenge"));
        routes_.addRoute("POST", "/response", respondWith("response"));
        routes_.addRoute("GET", "/key/{name}", respondWith("lookup"));
        routes_.addRoute("GET", "/healthz", respondWith("health"));
    }

    RouteTable routes_;
};

TEST_F(RouteTableTest, Size) {
    EXPECT_EQ(routes_.size(), 4u);
    routes_.clear();
    EXPECT_EQ(routes_.size(), 0u);
}

TEST_F(RouteTableTest, ExactMatch) {
    auto match = routes_.resolve("POST", "/challenge");
    ASSERT_EQ(match.status, RouteMatch::Status::Matched);
    ASSERT_TRUE(match.handler);
    EXPECT_EQ(match.handler(HttpRequest{}).body, "challenge");
    EXPECT_TRUE(match.params.empty());
}

TEST_F(RouteTableTest, CaptureSegment) {
    auto match = routes_.resolve("GET", "/key/alice");
    ASSERT_EQ(match.status, RouteMatch::Status::Matched);
    EXPECT_EQ(match.params.at("name"), "alice");
    EXPECT_EQ(match.handler(HttpRequest{}).body, "lookup");
}

TEST_F(RouteTableTest, CaptureIsPercentDecoded) {
    auto match = routes_.resolve("GET", "/key/alice%20smith%2Fwork");
    ASSERT_EQ(match.status, RouteMatch::Status::Matched);
    EXPECT_EQ(match.params.at("name"), "alice smith/work");
}

TEST_F(RouteTableTest, BadEscapeDoesNotMatch) {
    EXPECT_EQ(routes_.resolve("GET", "/key/bad%zz").status, RouteMatch::Status::NotFound);
}

TEST_F(RouteTableTest, CaptureNeedsExactlyOneSegment) {
    EXPECT_EQ(routes_.resolve("GET", "/key/").status, RouteMatch::Status::NotFound);
    EXPECT_EQ(routes_.resolve("GET", "/key").status, RouteMatch::Status::NotFound);
    EXPECT_EQ(routes_.resolve("GET", "/key/a/b").status, RouteMatch::Status::NotFound);
}

TEST_F(RouteTableTest, WrongMethodListsAllowed) {
    auto match = routes_.resolve("GET", "/challenge");
    EXPECT_EQ(match.status, RouteMatch::Status::MethodNotAllowed);
    ASSERT_EQ(match.allowedMethods.size(), 1u);
    EXPECT_EQ(match.allowedMethods[0], "POST");
    EXPECT_FALSE(match.handler);
}

TEST_F(RouteTableTest, UnknownPathIsNotFound) {
    EXPECT_EQ(routes_.resolve("GET", "/nope").status, RouteMatch::Status::NotFound);
    EXPECT_EQ(routes_.resolve("GET", "/").status, RouteMatch::Status::NotFound);
    EXPECT_EQ(routes_.resolve("GET", "/healthz/").status, RouteMatch::Status::NotFound);
}

TEST_F(RouteTableTest, MethodIsCaseSensitive) {
    EXPECT_EQ(routes_.resolve("post", "/challenge").status,
              RouteMatch::Status::MethodNotAllowed);
}

TEST_F(RouteTableTest, SamePathSeveralMethods) {
    routes_.addRoute("DELETE", "/key/{name}", respondWith("delete"));

    auto match = routes_.resolve("PUT", "/key/alice");
    EXPECT_EQ(match.status, RouteMatch::Status::MethodNotAllowed);
    EXPECT_EQ(match.allowedMethods.size(), 2u);

    auto del = routes_.resolve("DELETE", "/key/alice");
    ASSERT_EQ(del.status, RouteMatch::Status::Matched);
    EXPECT_EQ(del.handler(HttpRequest{}).body, "delete");
}
