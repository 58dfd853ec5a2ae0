#pragma once

#include <memory>
#include <string>

namespace ragdesk_core {
class Config;
class Embedder;
class Retriever;
class GeneratorRegistry;
class AnswerService;
class IngestionService;
class OllamaConnection;
}  // namespace ragdesk_core

namespace ragdesk_core {

// Application context for the serving process. Everything is built eagerly at
// startup and shared read-only by request handlers.
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<const Embedder> embedder,
                  std::shared_ptr<const Retriever> retriever,
                  std::shared_ptr<const GeneratorRegistry> generators,
                  std::shared_ptr<const AnswerService> answer_service,
                  std::string default_provider)
      : embedder_(embedder),
        retriever_(retriever),
        generators_(generators),
        answer_service_(answer_service),
        default_provider_(std::move(default_provider)) {}

  // Connects to Ollama, loads the store and registers the generation providers.
  // Throws StoreLoadError, ModelMismatchError or UpstreamError.
  static std::shared_ptr<ServiceProvider> from_config(const Config &config);

  // The offline pipeline needs the embedder and tokenizer but no loaded store
  static std::shared_ptr<IngestionService> make_ingestion_service(const Config &config);

  // The ollama provider generates through the given connection, which is not
  // contacted until the first request
  static std::shared_ptr<GeneratorRegistry> make_generator_registry(
      const Config &config, std::shared_ptr<OllamaConnection> ollama);

  // Public getters for each service
  const Embedder &get_embedder() const {
    return *embedder_;
  }
  const Retriever &get_retriever() const {
    return *retriever_;
  }
  const GeneratorRegistry &get_generator_registry() const {
    return *generators_;
  }
  const AnswerService &get_answer_service() const {
    return *answer_service_;
  }
  const std::string &get_default_provider() const {
    return default_provider_;
  }

 private:
  std::shared_ptr<const Embedder> embedder_;
  std::shared_ptr<const Retriever> retriever_;
  std::shared_ptr<const GeneratorRegistry> generators_;
  std::shared_ptr<const AnswerService> answer_service_;
  std::string default_provider_;
};

}  // namespace ragdesk_core
