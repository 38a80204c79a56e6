#pragma once

#include "net/http_client.h"
#include "upstream/completion_client.h"

#include <chrono>
#include <string>

namespace promptgate {

struct GeminiApiOptions {
  // Base URL up to the API version, e.g.
  // "https://generativelanguage.googleapis.com/v1beta".
  std::string endpoint{"https://generativelanguage.googleapis.com/v1beta"};
  std::string api_key;
  std::chrono::milliseconds io_timeout{std::chrono::seconds(30)};
};

// UpstreamModelApi backed by the Gemini generateContent REST call.
class GeminiApi : public UpstreamModelApi {
 public:
  explicit GeminiApi(GeminiApiOptions options);

  std::string Generate(const std::string& model, const std::string& prompt,
                       const CancellationToken* cancel) override;
  std::string Name() const override { return "gemini"; }

  // Request body for a single-turn text prompt.
  static std::string BuildRequestBody(const std::string& prompt);

  // Concatenates the text parts of the first candidate. Throws UpstreamError
  // when the body is not JSON or carries no candidate text (e.g. a safety
  // block); an empty string is returned for a candidate with empty parts.
  static std::string ExtractText(const std::string& body);

  // "<status> <STATUS_NAME>: <message>" from an error response body, falling
  // back to the raw body when it is not the usual error envelope.
  static std::string DescribeError(int status, const std::string& body);

 private:
  GeminiApiOptions options_;
  HttpClient http_;
};

}  // namespace promptgate
