#include <gtest/gtest.h>

#include "tutor/config.hpp"
#include "tutor/upstream_connection.hpp"
#include "tutor/url.hpp"

TEST(QueryParamsTest, DecodesAndKeepsFirstValue) {
  auto params = tutor::ParseQueryParams("scenario=a1_taxi_bogota&user=Ana%20Mar%C3%ADa&user=other&flag");
  EXPECT_EQ(params["scenario"], "a1_taxi_bogota");
  EXPECT_EQ(params["user"], "Ana María");
  ASSERT_TRUE(params.count("flag"));
  EXPECT_TRUE(params["flag"].empty());
  EXPECT_TRUE(tutor::ParseQueryParams("").empty());
}

TEST(QueryParamsTest, PlusIsSpaceAndBadEscapesStayLiteral) {
  EXPECT_EQ(tutor::PercentDecode("a+b"), "a b");
  EXPECT_EQ(tutor::PercentDecode("100%"), "100%");
  EXPECT_EQ(tutor::PercentDecode("%zz"), "%zz");
  EXPECT_EQ(tutor::PercentDecode("%41"), "A");
}

TEST(QueryParamsTest, EncodeKeepsUnreservedCharacters) {
  EXPECT_EQ(tutor::PercentEncode("gpt-realtime-mini-2025-12-15"), "gpt-realtime-mini-2025-12-15");
  EXPECT_EQ(tutor::PercentEncode("a b/c"), "a%20b%2Fc");
}

TEST(WebSocketUrlTest, ParsesSecureUrlWithDefaults) {
  std::string error;
  auto url = tutor::ParseWebSocketUrl("wss://api.openai.com/v1/realtime?model=x", error);
  ASSERT_TRUE(url.has_value()) << error;
  EXPECT_TRUE(url->tls);
  EXPECT_EQ(url->host, "api.openai.com");
  EXPECT_EQ(url->port, "443");
  EXPECT_EQ(url->target, "/v1/realtime?model=x");
}

TEST(WebSocketUrlTest, ParsesPlainUrlWithPort) {
  std::string error;
  auto url = tutor::ParseWebSocketUrl("ws://127.0.0.1:19001?model=m", error);
  ASSERT_TRUE(url.has_value()) << error;
  EXPECT_FALSE(url->tls);
  EXPECT_EQ(url->host, "127.0.0.1");
  EXPECT_EQ(url->port, "19001");
  EXPECT_EQ(url->target, "/?model=m");

  auto bare = tutor::ParseWebSocketUrl("ws://localhost", error);
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->port, "80");
  EXPECT_EQ(bare->target, "/");
}

TEST(WebSocketUrlTest, RejectsInvalidUrls) {
  std::string error;
  EXPECT_FALSE(tutor::ParseWebSocketUrl("https://api.openai.com", error).has_value());
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(tutor::ParseWebSocketUrl("ws:///path", error).has_value());
  EXPECT_FALSE(tutor::ParseWebSocketUrl("ws://host:/path", error).has_value());
  EXPECT_FALSE(tutor::ParseWebSocketUrl("ws://host:80a/path", error).has_value());
}

TEST(UpstreamUrlTest, AppendsEncodedModel) {
  tutor::AppConfig config;
  EXPECT_EQ(tutor::BuildUpstreamUrl(config),
            "wss://api.openai.com/v1/realtime?model=gpt-realtime-mini-2025-12-15");
  config.realtime_url = "ws://127.0.0.1:9000/v1/realtime?beta=1";
  config.realtime_model = "my model";
  EXPECT_EQ(tutor::BuildUpstreamUrl(config), "ws://127.0.0.1:9000/v1/realtime?beta=1&model=my%20model");
}

TEST(UpstreamCredentialsTest, HeaderModeUsesAuthorization) {
  boost::beast::http::fields fields;
  tutor::ApplyCredentials({"sk-test", tutor::UpstreamAuthMode::kHeader}, fields);
  EXPECT_EQ(fields[boost::beast::http::field::authorization], "Bearer sk-test");
  EXPECT_EQ(fields["OpenAI-Beta"], "realtime=v1");
  EXPECT_EQ(fields.count(boost::beast::http::field::sec_websocket_protocol), 0u);
}

TEST(UpstreamCredentialsTest, SubprotocolModeUsesNegotiationHeader) {
  boost::beast::http::fields fields;
  tutor::ApplyCredentials({"sk-test", tutor::UpstreamAuthMode::kSubprotocol}, fields);
  EXPECT_EQ(fields[boost::beast::http::field::sec_websocket_protocol],
            "realtime, openai-insecure-api-key.sk-test, openai-beta.realtime-v1");
  EXPECT_EQ(fields.count(boost::beast::http::field::authorization), 0u);
}
