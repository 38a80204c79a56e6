#include <catch2/catch_test_macros.hpp>

#include "upstream/gemini_api.h"
#include "upstream/upstream_error.h"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

TEST_CASE("GeminiApi builds a single user turn", "[gemini]") {
  auto body = json::parse(promptgate::GeminiApi::BuildRequestBody("hello \"world\""));
  REQUIRE(body["contents"].size() == 1);
  REQUIRE(body["contents"][0]["role"] == "user");
  REQUIRE(body["contents"][0]["parts"][0]["text"] == "hello \"world\"");
}

TEST_CASE("GeminiApi concatenates the first candidate's text parts", "[gemini]") {
  auto text = promptgate::GeminiApi::ExtractText(R"({
    "candidates": [
      {"content": {"parts": [{"text": "Hello, "}, {"text": "world."}]}},
      {"content": {"parts": [{"text": "ignored"}]}}
    ]
  })");
  REQUIRE(text == "Hello, world.");
}

TEST_CASE("GeminiApi returns empty text for a candidate without parts", "[gemini]") {
  REQUIRE(promptgate::GeminiApi::ExtractText(R"({"candidates":[{"finishReason":"SAFETY"}]})")
              .empty());
}

TEST_CASE("GeminiApi rejects responses without candidates", "[gemini]") {
  REQUIRE_THROWS_AS(promptgate::GeminiApi::ExtractText("not json"),
                    promptgate::UpstreamError);
  try {
    promptgate::GeminiApi::ExtractText(R"({"promptFeedback":{"blockReason":"SAFETY"}})");
    FAIL("expected UpstreamError");
  } catch (const promptgate::UpstreamError& ex) {
    REQUIRE(std::string(ex.what()).find("blockReason=\"SAFETY\"") != std::string::npos);
  }
}

TEST_CASE("GeminiApi describes API errors by status", "[gemini]") {
  auto described = promptgate::GeminiApi::DescribeError(
      404, R"({"error":{"code":404,"message":"models/x is not found","status":"NOT_FOUND"}})");
  REQUIRE(described == "404 NOT_FOUND: models/x is not found");
  REQUIRE(promptgate::ClassifyUpstreamFailure(described) ==
          promptgate::UpstreamFailureKind::kNotFound);

  auto quota = promptgate::GeminiApi::DescribeError(
      429, R"({"error":{"message":"Quota exceeded","status":"RESOURCE_EXHAUSTED"}})");
  REQUIRE(quota == "429 RESOURCE_EXHAUSTED: Quota exceeded");
  REQUIRE(promptgate::ClassifyUpstreamFailure(quota) ==
          promptgate::UpstreamFailureKind::kRateLimited);
}

TEST_CASE("GeminiApi falls back to a truncated raw body", "[gemini]") {
  auto described = promptgate::GeminiApi::DescribeError(502, std::string(500, 'x'));
  REQUIRE(described == "502: " + std::string(300, 'x'));
  REQUIRE(promptgate::GeminiApi::DescribeError(503, "") == "503");
}
