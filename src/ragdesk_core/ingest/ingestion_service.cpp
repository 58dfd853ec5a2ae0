#include "ragdesk_core/ingest/ingestion_service.hpp"

#include <iostream>

#include "ragdesk_core/chunking/token_chunker.hpp"
#include "ragdesk_core/errors.hpp"
#include "ragdesk_core/ingest/document_loader.hpp"
#include "ragdesk_core/store/store_builder.hpp"

namespace ragdesk_core {

IngestionService::IngestionService(std::shared_ptr<DocumentLoader> loader,
                                   std::shared_ptr<TokenChunker> chunker,
                                   std::shared_ptr<StoreBuilder> builder)
    : loader_(std::move(loader)), chunker_(std::move(chunker)), builder_(std::move(builder)) {}

IngestionReport IngestionService::ingest(const std::filesystem::path &data_dir,
                                         const std::filesystem::path &store_dir) const {
  std::cout << "Scanning documents in " << data_dir.string() << std::endl;
  const std::vector<Document> documents = loader_->load(data_dir);

  std::vector<ChunkRecord> chunks;
  for (const auto &document : documents) {
    std::vector<ChunkRecord> document_chunks;
    try {
      document_chunks = chunker_->chunk_document(document);
    } catch (const TokenizerError &e) {
      throw IngestionError("Failed to tokenize " + document.path.string() + ": " + e.what());
    }
    std::cout << "Chunked " << document.path.filename().string() << " into "
              << document_chunks.size() << " chunks" << std::endl;
    chunks.insert(chunks.end(), std::make_move_iterator(document_chunks.begin()),
                  std::make_move_iterator(document_chunks.end()));
  }

  if (chunks.empty()) {
    throw IngestionError("No documents with text found in " + data_dir.string() +
                         " (supported: .txt, .md, .pdf, .docx)");
  }

  EmbeddingStore store = builder_->build(std::move(chunks), chunker_->tokenizer().name());
  store.save(store_dir);

  IngestionReport report;
  report.documents = documents.size();
  report.chunks = store.size();
  report.dim = store.embeddings().dim;
  report.model = store.meta().model;
  report.store_dir = store_dir;
  std::cout << "Saved " << report.chunks << " chunks and embeddings to " << store_dir.string()
            << std::endl;
  return report;
}

}  // namespace ragdesk_core
