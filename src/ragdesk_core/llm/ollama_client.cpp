#include "ragdesk_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace ragdesk_core {

// Owns its own ollama-hpp client instead of the library's global one, whose
// setServerURL replaces the HTTP client under any request still in flight.
OllamaConnection::OllamaConnection(const std::string &ollama_url, int read_timeout_seconds)
    : ollama_url_(ollama_url),
      read_timeout_seconds_(read_timeout_seconds),
      server_(std::make_unique<Ollama>(ollama_url)) {
  if (read_timeout_seconds_ > 0) {
    server_->setReadTimeout(read_timeout_seconds_);
  }
}

OllamaConnection::~OllamaConnection() = default;

bool OllamaConnection::is_running() {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return server_->is_running();
}

nlohmann::json OllamaConnection::embed(const std::string &model,
                                       const std::vector<std::string> &inputs) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  try {
    // /api/embed accepts an array as input and returns one embedding per entry
    ollama::request request = ollama::request::from_embedding(model, inputs.front());
    request["input"] = inputs;
    ollama::response response = server_->generate_embeddings(request);
    return response.as_json();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::string OllamaConnection::generate(const std::string &model, const std::string &prompt) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  try {
    ollama::response response = server_->generate(model, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Generation failed: " + std::string(e.what()));
  }
}

OllamaClient::OllamaClient(std::shared_ptr<OllamaConnection> connection,
                           const std::string &embedding_model)
    : connection_(std::move(connection)), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  if (!connection_->is_running()) {
    throw OllamaError("Ollama server is not running at " + connection_->url());
  }
}

std::vector<std::vector<float>> OllamaClient::embed(const std::vector<std::string> &texts) const {
  if (texts.empty()) {
    return {};
  }

  try {
    auto json_response = connection_->embed(embedding_model_, texts);
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embeddings field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (embeddings.size() != texts.size()) {
      throw OllamaError("Ollama returned " + std::to_string(embeddings.size()) +
                        " embeddings for " + std::to_string(texts.size()) + " inputs");
    }
    return embeddings.get<std::vector<std::vector<float>>>();

  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

OllamaGenerator::OllamaGenerator(std::shared_ptr<OllamaConnection> connection,
                                 const std::string &model)
    : connection_(std::move(connection)), model_(model) {}

std::string OllamaGenerator::generate(const std::string &prompt) {
  return connection_->generate(model_, prompt);
}

}  // namespace ragdesk_core
