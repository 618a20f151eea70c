#include <gtest/gtest.h>

#include <stdexcept>

#include "core/request.hpp"
#include "net/request_builder.hpp"

using namespace ssebridge;

// --- SseRequestTest ---

TEST(SseRequestTest, GetDefaults) {
  auto req = SseRequest::get("https://example.com/events");

  EXPECT_EQ(req.url(), "https://example.com/events");
  EXPECT_EQ(req.method(), HttpMethod::Get);
  EXPECT_TRUE(req.headers().empty());
  EXPECT_FALSE(req.body().has_value());
}

TEST(SseRequestTest, BlankUrlRejected) {
  EXPECT_THROW(SseRequest(""), std::invalid_argument);
  EXPECT_THROW(SseRequest::get("   \t"), std::invalid_argument);
}

TEST(SseRequestTest, PostRequiresBody) {
  EXPECT_THROW(SseRequest("https://example.com", HttpMethod::Post), std::invalid_argument);
  EXPECT_NO_THROW(SseRequest::post("https://example.com", "{}"));
}

// --- RequestBuilderTest ---

TEST(RequestBuilderTest, GetCarriesHeadersWithoutBody) {
  auto req = SseRequest::get("http://localhost/stream", {{"Authorization", "Bearer abc"}, {"X-Id", "1"}});
  auto http = net::build_http_request(req);

  EXPECT_EQ(http.method, "GET");
  EXPECT_EQ(http.url, "http://localhost/stream");
  EXPECT_EQ(http.headers.get("authorization"), "Bearer abc");
  EXPECT_EQ(http.headers.get("X-Id"), "1");
  EXPECT_TRUE(http.body.empty());
  EXPECT_TRUE(http.content_type.empty());
}

TEST(RequestBuilderTest, PostBodyLabelledJson) {
  auto req = SseRequest::post("http://localhost/chat", "{\"q\":\"hi\"}");
  auto http = net::build_http_request(req);

  EXPECT_EQ(http.method, "POST");
  EXPECT_EQ(http.body, "{\"q\":\"hi\"}");
  EXPECT_EQ(http.content_type, "application/json; charset=utf-8");
}
