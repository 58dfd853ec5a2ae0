#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ragdesk_core {

class Config {
 public:
  std::string api_base_url;

  // Ingestion
  std::string data_dir;
  std::string store_dir;
  std::string tokenizer_path;
  int chunk_max_tokens;
  int chunk_overlap_tokens;
  int embedding_batch_size;
  std::vector<std::string> excluded_prefixes;

  // Models
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  std::string azure_endpoint;
  std::string azure_api_key;
  std::string azure_model;

  // Answering
  float guardrail_threshold;
  int generation_timeout_seconds;
  std::string default_provider;

  // Load configuration from a JSON file at the given path, then apply environment overrides
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    Config config = from_json(json_config);
    config.apply_environment();
    config.validate();
    return config;
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
    config.data_dir = json_config.value("data_dir", std::string("./data"));
    config.store_dir = json_config.value("store_dir", std::string("./store"));
    config.tokenizer_path =
        json_config.value("tokenizer_path", std::string("./models/cl100k_base.tiktoken"));
    config.chunk_max_tokens = json_config.value("chunk_max_tokens", 400);
    config.chunk_overlap_tokens = json_config.value("chunk_overlap_tokens", 60);
    config.embedding_batch_size = json_config.value("embedding_batch_size", 32);
    config.excluded_prefixes = json_config.value(
        "excluded_prefixes", std::vector<std::string>{"Discord RAG FAQ Chatbot"});

    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
    config.generation_model = json_config.value("generation_model", std::string("deepseek-r1"));
    config.azure_endpoint = json_config.value("azure_endpoint", std::string(""));
    config.azure_model = json_config.value("azure_model", std::string("DeepSeek-R1"));

    config.guardrail_threshold = json_config.value("guardrail_threshold", 0.55f);
    config.generation_timeout_seconds = json_config.value("generation_timeout_seconds", 60);
    config.default_provider = json_config.value("default_provider", std::string("azure"));

    config.validate();
    return config;
  }

  // Secrets only come from the environment
  void apply_environment() {
    if (const char* endpoint = std::getenv("AZURE_OPENAI_ENDPOINT"); endpoint && *endpoint) {
      azure_endpoint = endpoint;
    }
    if (const char* key = std::getenv("AZURE_OPENAI_API_KEY"); key && *key) {
      azure_api_key = key;
    }
    if (const char* model = std::getenv("AZURE_OPENAI_MODEL"); model && *model) {
      azure_model = model;
    }
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be host:port");
    }
    if (data_dir.empty()) {
      throw std::runtime_error("data_dir cannot be empty");
    }
    if (store_dir.empty()) {
      throw std::runtime_error("store_dir cannot be empty");
    }
    if (tokenizer_path.empty()) {
      throw std::runtime_error("tokenizer_path cannot be empty");
    }
    if (chunk_max_tokens <= 0) {
      throw std::runtime_error("chunk_max_tokens must be greater than 0");
    }
    if (chunk_overlap_tokens < 0) {
      throw std::runtime_error("chunk_overlap_tokens cannot be negative");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (guardrail_threshold < -1.0f || guardrail_threshold > 1.0f) {
      throw std::runtime_error("guardrail_threshold must be within [-1, 1]");
    }
    if (generation_timeout_seconds < 0) {
      throw std::runtime_error("generation_timeout_seconds cannot be negative");
    }
    if (default_provider.empty()) {
      throw std::runtime_error("default_provider cannot be empty");
    }
  }
};

}  // namespace ragdesk_core
