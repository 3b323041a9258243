#include "cadence/client/anthropic_client.hpp"
#include "cadence/client/http_web_scraper.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace cadence::test {

using json = nlohmann::json;
using std::chrono::seconds;

TEST(ParseCompletionTest, ReadsFirstTextBlock) {
  auto completion = parse_completion(R"({
    "model": "claude-x",
    "content": [{"type": "text", "text": "Hi there"},
                {"type": "text", "text": "ignored"}],
    "usage": {"input_tokens": 3, "output_tokens": 2}
  })");

  ASSERT_TRUE(completion.has_value());
  EXPECT_EQ(completion->text, "Hi there");
  EXPECT_EQ(completion->model, "claude-x");
  EXPECT_EQ(completion->usage["output_tokens"], 2);
}

TEST(ParseCompletionTest, NonTextFirstBlockHasNoText) {
  auto completion = parse_completion(R"({
    "content": [{"type": "tool_use", "id": "t1"},
                {"type": "text", "text": "later"}]
  })");

  ASSERT_TRUE(completion.has_value());
  EXPECT_FALSE(completion->text.has_value());
}

TEST(ParseCompletionTest, RejectsMalformedBodies) {
  EXPECT_FALSE(parse_completion("not json").has_value());
  EXPECT_FALSE(parse_completion(R"({"model": "m"})").has_value());
}

class AnthropicClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    http_ = std::make_shared<FakeHttp>();
    config_.base_url = "https://llm.example.com/";
  }

  std::shared_ptr<FakeHttp> http_;
  LlmConfig config_;
};

TEST_F(AnthropicClientTest, StripsTrailingSlashFromBaseUrl) {
  AnthropicClient client("key", config_, http_);
  EXPECT_EQ(client.messages_url(), "https://llm.example.com/v1/messages");
}

TEST_F(AnthropicClientTest, MissingKeyNamesEnvironmentVariable) {
  AnthropicClient client("", config_, http_);

  auto result = client.complete({.model = "m", .prompt = "p", .max_tokens = 10},
                                seconds(1));

  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().is_configuration_error());
  EXPECT_EQ(result.error().message, "missing API key (set ANTHROPIC_API_KEY)");
  EXPECT_TRUE(http_->requests.empty());
}

TEST_F(AnthropicClientTest, SendsMessagesRequest) {
  http_->response = {.status = 200,
                     .headers = {},
                     .body = R"({"content":[{"type":"text","text":"ok"}]})"};
  AnthropicClient client("secret", config_, http_);

  auto result = client.complete(
      {.model = "claude-test", .prompt = "hello", .max_tokens = 123}, seconds(1));

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->text, "ok");
  ASSERT_EQ(http_->requests.size(), 1u);
  const auto& req = http_->requests[0];
  EXPECT_EQ(req.method, http::HttpMethod::POST);
  EXPECT_EQ(req.url, "https://llm.example.com/v1/messages");
  EXPECT_EQ(req.header("x-api-key"), "secret");
  EXPECT_EQ(req.header("anthropic-version"), "2023-06-01");

  auto body = json::parse(req.body);
  EXPECT_EQ(body["model"], "claude-test");
  EXPECT_EQ(body["max_tokens"], 123);
  EXPECT_EQ(body["messages"][0]["role"], "user");
  EXPECT_EQ(body["messages"][0]["content"], "hello");
}

TEST_F(AnthropicClientTest, ClassifiesErrorStatuses) {
  AnthropicClient client("secret", config_, http_);
  CompletionRequest request{.model = "m", .prompt = "p", .max_tokens = 1};

  http_->response = {.status = 401,
                     .headers = {},
                     .body = R"({"error":{"message":"bad key"}})"};
  auto auth = client.complete(request, seconds(1));
  ASSERT_FALSE(auth.has_value());
  EXPECT_EQ(auth.error().message, "authentication failed (401): bad key");

  http_->response = {.status = 429, .headers = {}, .body = "slow down"};
  auto limited = client.complete(request, seconds(1));
  ASSERT_FALSE(limited.has_value());
  EXPECT_EQ(limited.error().message, "rate limited (429): slow down");

  http_->response = {.status = 500, .headers = {}, .body = "{}"};
  auto server = client.complete(request, seconds(1));
  ASSERT_FALSE(server.has_value());
  EXPECT_EQ(server.error().code, make_error_code(Error::HttpError));
  EXPECT_EQ(server.error().message, "API error (500): {}");
}

TEST_F(AnthropicClientTest, TransportErrorPropagates) {
  http_->error = ExecutionError{make_error_code(Error::Timeout), "read timed out"};
  AnthropicClient client("secret", config_, http_);

  auto result =
      client.complete({.model = "m", .prompt = "p", .max_tokens = 1}, seconds(1));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(Error::Timeout));
}

TEST(HttpWebScraperTest, TruncatesContentAndEchoesSelector) {
  auto http = std::make_shared<FakeHttp>();
  http->response = {.status = 200, .headers = {}, .body = "abcdefghij"};
  HttpWebScraper scraper(ScraperConfig{.enabled = true, .max_content_bytes = 4},
                         http);

  auto result = scraper.scrape("http://example.com", ".title", seconds(1));

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ((*result)["content"], "abcd");
  EXPECT_EQ((*result)["status"], 200);
  EXPECT_EQ((*result)["selector"], ".title");
  ASSERT_EQ(http->requests.size(), 1u);
  EXPECT_EQ(http->requests[0].method, http::HttpMethod::GET);
}

TEST(HttpWebScraperTest, ErrorStatusFails) {
  auto http = std::make_shared<FakeHttp>();
  http->response = {.status = 404, .headers = {}, .body = ""};
  HttpWebScraper scraper(ScraperConfig{}, http);

  auto result = scraper.scrape("http://example.com/x", std::nullopt, seconds(1));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message, "GET http://example.com/x returned status 404");
}

}  // namespace cadence::test
