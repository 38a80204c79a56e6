#include "upstream/gemini_api.h"

#include "net/cancellation_token.h"
#include "upstream/upstream_error.h"

#include <nlohmann/json.hpp>

#include <utility>

using json = nlohmann::json;

namespace promptgate {

namespace {
constexpr std::size_t kMaxErrorBodyChars = 300;
}  // namespace

GeminiApi::GeminiApi(GeminiApiOptions options)
    : options_(std::move(options)), http_(options_.io_timeout) {
  while (!options_.endpoint.empty() && options_.endpoint.back() == '/') {
    options_.endpoint.pop_back();
  }
}

std::string GeminiApi::BuildRequestBody(const std::string& prompt) {
  json body = {
      {"contents", json::array({{{"role", "user"},
                                 {"parts", json::array({{{"text", prompt}}})}}})}};
  return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string GeminiApi::ExtractText(const std::string& body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::exception& ex) {
    throw UpstreamError(std::string("malformed completion response: ") + ex.what());
  }
  if (!j.contains("candidates") || !j["candidates"].is_array() ||
      j["candidates"].empty()) {
    std::string reason = "no candidates in completion response";
    if (j.contains("promptFeedback") && j["promptFeedback"].contains("blockReason")) {
      reason += " (blockReason=" + j["promptFeedback"]["blockReason"].dump() + ")";
    }
    throw UpstreamError(reason);
  }
  const auto& candidate = j["candidates"][0];
  std::string text;
  if (candidate.contains("content") && candidate["content"].contains("parts") &&
      candidate["content"]["parts"].is_array()) {
    for (const auto& part : candidate["content"]["parts"]) {
      if (part.contains("text") && part["text"].is_string()) {
        text += part["text"].get<std::string>();
      }
    }
  }
  return text;
}

std::string GeminiApi::DescribeError(int status, const std::string& body) {
  std::string description = std::to_string(status);
  try {
    auto j = json::parse(body);
    if (j.contains("error") && j["error"].is_object()) {
      const auto& err = j["error"];
      if (err.contains("status") && err["status"].is_string()) {
        description += " " + err["status"].get<std::string>();
      }
      if (err.contains("message") && err["message"].is_string()) {
        description += ": " + err["message"].get<std::string>();
      }
      return description;
    }
  } catch (const json::exception&) {
    // Not the JSON error envelope; report the raw body below.
  }
  if (!body.empty()) {
    description += ": " + body.substr(0, kMaxErrorBodyChars);
  }
  return description;
}

std::string GeminiApi::Generate(const std::string& model,
                                const std::string& prompt,
                                const CancellationToken* cancel) {
  std::string url = options_.endpoint + "/models/" + model + ":generateContent";
  auto response = http_.Post(url, BuildRequestBody(prompt),
                             {{"x-goog-api-key", options_.api_key}}, cancel);
  if (response.status < 200 || response.status >= 300) {
    throw UpstreamError(DescribeError(response.status, response.body),
                        response.status);
  }
  return ExtractText(response.body);
}

}  // namespace promptgate
