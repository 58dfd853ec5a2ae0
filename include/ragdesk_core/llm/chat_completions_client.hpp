#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "ragdesk_core/llm/generator.hpp"
#include "ragdesk_core/net/http_client.hpp"

namespace ragdesk_core {

struct ChatCompletionsOptions {
  std::string endpoint;  // service root, e.g. https://<resource>.services.ai.azure.com/
  std::string api_key;
  std::string model;
  double temperature = 0.2;
  long timeout_seconds = 60;
};

using HttpTransport = std::function<HttpResponse(const HttpRequest &)>;

// Generator for OpenAI-compatible `/openai/v1/chat/completions` endpoints (Azure AI Foundry).
// The prompt is sent as a single user message.
class ChatCompletionsGenerator : public Generator {
 public:
  explicit ChatCompletionsGenerator(ChatCompletionsOptions options,
                                    HttpTransport transport = perform_http_request);

  std::string generate(const std::string &prompt) override;

  static std::string chat_completions_url(const std::string &endpoint);
  static nlohmann::json build_request_body(const std::string &prompt,
                                           const ChatCompletionsOptions &options);
  // Throws UpstreamError when the response carries no message content
  static std::string extract_content(const nlohmann::json &response);

 private:
  ChatCompletionsOptions options_;
  HttpTransport transport_;
};

}  // namespace ragdesk_core
