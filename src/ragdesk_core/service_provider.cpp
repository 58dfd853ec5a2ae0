#include "ragdesk_core/service_provider.hpp"

#include <iostream>
#include <utility>

#include "ragdesk_core/chunking/token_chunker.hpp"
#include "ragdesk_core/config.hpp"
#include "ragdesk_core/errors.hpp"
#include "ragdesk_core/extractors/content_extractor_factory.hpp"
#include "ragdesk_core/ingest/document_loader.hpp"
#include "ragdesk_core/ingest/ingestion_service.hpp"
#include "ragdesk_core/llm/chat_completions_client.hpp"
#include "ragdesk_core/llm/generator_registry.hpp"
#include "ragdesk_core/llm/ollama_client.hpp"
#include "ragdesk_core/services/answer_service.hpp"
#include "ragdesk_core/services/retriever.hpp"
#include "ragdesk_core/store/store_builder.hpp"

namespace ragdesk_core {

std::shared_ptr<GeneratorRegistry> ServiceProvider::make_generator_registry(
    const Config &config, std::shared_ptr<OllamaConnection> ollama) {
  auto registry = std::make_shared<GeneratorRegistry>();
  auto think_stripper = std::make_shared<DelimitedBlockSanitizer>("<think>", "</think>");

  registry->register_provider(
      "ollama",
      std::make_shared<OllamaGenerator>(std::move(ollama), config.generation_model),
      think_stripper);

  if (config.azure_endpoint.empty() || config.azure_api_key.empty()) {
    std::cerr << "Warning: AZURE_OPENAI_ENDPOINT or AZURE_OPENAI_API_KEY is not set, "
                 "the 'azure' provider will fail until configured"
              << std::endl;
  }
  ChatCompletionsOptions azure_options;
  azure_options.endpoint = config.azure_endpoint;
  azure_options.api_key = config.azure_api_key;
  azure_options.model = config.azure_model;
  azure_options.timeout_seconds = config.generation_timeout_seconds;
  registry->register_provider("azure", std::make_shared<ChatCompletionsGenerator>(azure_options),
                              think_stripper);

  if (!registry->contains(config.default_provider)) {
    throw InvalidInputError("default_provider '" + config.default_provider +
                            "' is not a registered provider");
  }
  return registry;
}

std::shared_ptr<ServiceProvider> ServiceProvider::from_config(const Config &config) {
  // Embedding and generation share one Ollama connection
  auto ollama = std::make_shared<OllamaConnection>(config.ollama_url,
                                                   config.generation_timeout_seconds);
  auto embedder = std::make_shared<OllamaClient>(ollama, config.embedding_model);
  auto retriever =
      std::make_shared<Retriever>(EmbeddingStore::load(config.store_dir), embedder);
  auto generators = make_generator_registry(config, ollama);

  AnswerOptions options;
  options.guardrail_threshold = config.guardrail_threshold;
  options.generation_timeout = std::chrono::seconds(config.generation_timeout_seconds);
  auto answer_service = std::make_shared<AnswerService>(retriever, generators, options);

  return std::make_shared<ServiceProvider>(embedder, retriever, generators, answer_service,
                                           config.default_provider);
}

std::shared_ptr<IngestionService> ServiceProvider::make_ingestion_service(const Config &config) {
  auto tokenizer = std::make_shared<const BpeTokenizer>(BpeTokenizer::from_file(config.tokenizer_path));
  std::cout << "Tokenizer: " << tokenizer->name() << " (" << tokenizer->vocab_size()
            << " tokens)" << std::endl;

  ChunkingOptions chunking;
  chunking.max_tokens = static_cast<size_t>(config.chunk_max_tokens);
  chunking.overlap_tokens = static_cast<size_t>(config.chunk_overlap_tokens);

  auto loader = std::make_shared<DocumentLoader>(std::make_shared<ContentExtractorFactory>(),
                                                 config.excluded_prefixes);
  auto chunker = std::make_shared<TokenChunker>(tokenizer, chunking);
  auto embedder = std::make_shared<OllamaClient>(
      std::make_shared<OllamaConnection>(config.ollama_url, config.generation_timeout_seconds),
      config.embedding_model);
  auto builder =
      std::make_shared<StoreBuilder>(embedder, static_cast<size_t>(config.embedding_batch_size));
  return std::make_shared<IngestionService>(loader, chunker, builder);
}

}  // namespace ragdesk_core
