#include "ragdesk_core/llm/chat_completions_client.hpp"

#include "ragdesk_core/errors.hpp"

namespace ragdesk_core {

ChatCompletionsGenerator::ChatCompletionsGenerator(ChatCompletionsOptions options,
                                                   HttpTransport transport)
    : options_(std::move(options)), transport_(std::move(transport)) {}

std::string ChatCompletionsGenerator::chat_completions_url(const std::string &endpoint) {
  std::string base = endpoint;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/openai/v1/chat/completions";
}

nlohmann::json ChatCompletionsGenerator::build_request_body(const std::string &prompt,
                                                            const ChatCompletionsOptions &options) {
  nlohmann::json body;
  body["model"] = options.model;
  body["temperature"] = options.temperature;
  body["messages"] = nlohmann::json::array({{{"role", "user"}, {"content", prompt}}});
  return body;
}

std::string ChatCompletionsGenerator::extract_content(const nlohmann::json &response) {
  if (!response.contains("choices") || !response["choices"].is_array() ||
      response["choices"].empty()) {
    throw UpstreamError("Chat completions response missing choices");
  }
  const auto &choice = response["choices"][0];
  if (!choice.contains("message") || !choice["message"].is_object()) {
    throw UpstreamError("Chat completions response missing message");
  }
  const auto &message = choice["message"];
  if (!message.contains("content") || !message["content"].is_string()) {
    throw UpstreamError("Chat completions message missing text content");
  }
  return message["content"].get<std::string>();
}

std::string ChatCompletionsGenerator::generate(const std::string &prompt) {
  if (options_.endpoint.empty()) {
    throw UpstreamError("Chat completions endpoint is not configured (AZURE_OPENAI_ENDPOINT)");
  }
  if (options_.api_key.empty()) {
    throw UpstreamError("Chat completions API key is not configured (AZURE_OPENAI_API_KEY)");
  }

  const HttpRequest request{
      .method = "POST",
      .url = chat_completions_url(options_.endpoint),
      .headers = {"Content-Type: application/json", "api-key: " + options_.api_key,
                  "Authorization: Bearer " + options_.api_key},
      .body = build_request_body(prompt, options_).dump(),
      .timeout_seconds = options_.timeout_seconds,
  };

  const HttpResponse response = transport_(request);
  if (response.status != 200) {
    const std::string body_preview =
        response.body.size() > 512 ? response.body.substr(0, 512) + "..." : response.body;
    throw UpstreamError("Chat completions failed with status " + std::to_string(response.status) +
                        " body: " + body_preview);
  }

  try {
    return extract_content(nlohmann::json::parse(response.body));
  } catch (const nlohmann::json::exception &e) {
    throw UpstreamError(std::string("Failed to parse chat completions response: ") + e.what());
  }
}

}  // namespace ragdesk_core
