#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ragdesk_core/errors.hpp"
#include "ragdesk_core/llm/embedder.hpp"
#include "ragdesk_core/llm/generator.hpp"

class Ollama;

namespace ragdesk_core {

class OllamaError : public UpstreamError {
 public:
  explicit OllamaError(const std::string &message) : UpstreamError(message) {}
};

// One ollama-hpp client bound to a single server. The URL and read timeout are
// set once here and never changed afterwards; every request goes through the
// same mutex, so the embedder and the generator can share one connection.
// Constructing it does not contact the server.
class OllamaConnection {
 public:
  OllamaConnection(const std::string &ollama_url, int read_timeout_seconds);
  ~OllamaConnection();

  OllamaConnection(const OllamaConnection &) = delete;
  OllamaConnection &operator=(const OllamaConnection &) = delete;

  bool is_running();

  // Raw /api/embed response for a batch of inputs
  nlohmann::json embed(const std::string &model, const std::vector<std::string> &inputs);

  std::string generate(const std::string &model, const std::string &prompt);

  const std::string &url() const {
    return ollama_url_;
  }
  int read_timeout_seconds() const {
    return read_timeout_seconds_;
  }

 private:
  std::string ollama_url_;
  int read_timeout_seconds_;
  std::unique_ptr<Ollama> server_;
  std::mutex request_mutex_;
};

// Embeddings through Ollama's batched /api/embed endpoint
class OllamaClient : public Embedder {
 public:
  // Throws OllamaError when the server does not answer
  OllamaClient(std::shared_ptr<OllamaConnection> connection, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) const override;

  std::string model_id() const override {
    return embedding_model_;
  }

  const std::shared_ptr<OllamaConnection> &connection() const {
    return connection_;
  }

 private:
  std::shared_ptr<OllamaConnection> connection_;
  std::string embedding_model_;

  void setup_server_connection();
};

// Completion through Ollama /api/generate, non-streaming
class OllamaGenerator : public Generator {
 public:
  OllamaGenerator(std::shared_ptr<OllamaConnection> connection, const std::string &model);

  std::string generate(const std::string &prompt) override;

  const std::shared_ptr<OllamaConnection> &connection() const {
    return connection_;
  }

 private:
  std::shared_ptr<OllamaConnection> connection_;
  std::string model_;
};

}  // namespace ragdesk_core
