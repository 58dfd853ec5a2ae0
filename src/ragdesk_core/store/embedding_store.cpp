#include "ragdesk_core/store/embedding_store.hpp"

#include <fstream>
#include <limits>
#include <iostream>

#include <nlohmann/json.hpp>

#include "ragdesk_core/errors.hpp"
#include "ragdesk_core/util/digest.hpp"

namespace ragdesk_core {

namespace {

constexpr const char *kTempSuffix = ".tmp";
constexpr const char *kBackupSuffix = ".bak";

nlohmann::json meta_to_json(const StoreMeta &meta) {
  nlohmann::json json_meta;
  json_meta["model"] = meta.model;
  json_meta["count"] = meta.count;
  if (meta.dim) {
    json_meta["dim"] = *meta.dim;
  }
  if (meta.tokenizer) {
    json_meta["tokenizer"] = *meta.tokenizer;
  }
  if (meta.chunk_digest) {
    json_meta["chunk_digest"] = *meta.chunk_digest;
  }
  return json_meta;
}

StoreMeta meta_from_json(const nlohmann::json &json_meta) {
  StoreMeta meta;
  meta.model = json_meta.at("model").get<std::string>();
  meta.count = json_meta.at("count").get<size_t>();
  if (json_meta.contains("dim")) {
    meta.dim = json_meta["dim"].get<size_t>();
  }
  if (json_meta.contains("tokenizer")) {
    meta.tokenizer = json_meta["tokenizer"].get<std::string>();
  }
  if (json_meta.contains("chunk_digest")) {
    meta.chunk_digest = json_meta["chunk_digest"].get<std::string>();
  }
  return meta;
}

std::vector<ChunkRecord> read_chunks(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw StoreLoadError("Could not open " + path.string());
  }

  std::vector<ChunkRecord> chunks;
  std::string line;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    try {
      const auto record = nlohmann::json::parse(line);
      chunks.push_back({.doc_id = record.at("doc_id").get<std::string>(),
                        .source = record.at("source").get<std::string>(),
                        .chunk_id = record.at("chunk_id").get<std::string>(),
                        .text = record.at("text").get<std::string>()});
    } catch (const nlohmann::json::exception &e) {
      throw StoreLoadError("Malformed chunk record on line " + std::to_string(line_number) +
                           " of " + path.string() + ": " + e.what());
    }
  }
  return chunks;
}

void write_chunks(const std::filesystem::path &path, const std::vector<ChunkRecord> &chunks) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw IngestionError("Could not open " + path.string() + " for writing");
  }
  for (const auto &chunk : chunks) {
    nlohmann::json record;
    record["doc_id"] = chunk.doc_id;
    record["source"] = chunk.source;
    record["chunk_id"] = chunk.chunk_id;
    record["text"] = chunk.text;
    out << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  }
  if (!out) {
    throw IngestionError("Failed writing " + path.string());
  }
}

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

struct StagedFile {
  std::filesystem::path temp;
  std::filesystem::path final_path;
  std::filesystem::path backup;
  bool backed_up = false;
  bool placed = false;
};

// Puts back every artifact moved aside so far and drops the staged files
void roll_back(std::vector<StagedFile> &files) {
  std::error_code ec;
  for (auto &file : files) {
    if (file.placed) {
      remove_quietly(file.final_path);
    }
    if (file.backed_up) {
      std::filesystem::rename(file.backup, file.final_path, ec);
      if (ec) {
        std::cerr << "Warning: could not restore " << file.final_path.string() << " from "
                  << file.backup.string() << ": " << ec.message() << std::endl;
      }
    }
    remove_quietly(file.temp);
  }
}

// Replaces the artifacts as a unit. Existing files are moved aside first, so a
// failure at any rename leaves the previous store in place.
void commit_staged(std::vector<StagedFile> &files) {
  std::error_code ec;
  for (auto &file : files) {
    if (!std::filesystem::exists(file.final_path, ec)) {
      continue;
    }
    std::filesystem::rename(file.final_path, file.backup, ec);
    if (ec) {
      const std::string message = "Could not move " + file.final_path.string() + " aside: " +
                                  ec.message();
      roll_back(files);
      throw IngestionError(message);
    }
    file.backed_up = true;
  }

  for (auto &file : files) {
    std::filesystem::rename(file.temp, file.final_path, ec);
    if (ec) {
      const std::string message = "Could not move " + file.temp.string() + " into place: " +
                                  ec.message();
      roll_back(files);
      throw IngestionError(message);
    }
    file.placed = true;
  }

  for (const auto &file : files) {
    if (file.backed_up) {
      remove_quietly(file.backup);
    }
  }
}

}  // namespace

EmbeddingStore::EmbeddingStore(std::vector<ChunkRecord> chunks, EmbeddingMatrix embeddings,
                               StoreMeta meta)
    : chunks_(std::move(chunks)), embeddings_(std::move(embeddings)), meta_(std::move(meta)) {
  validate();
}

void EmbeddingStore::validate() const {
  if (meta_.model.empty()) {
    throw StoreLoadError("Store metadata has no embedding model");
  }
  if (chunks_.size() != meta_.count) {
    throw StoreLoadError("Store has " + std::to_string(chunks_.size()) +
                         " chunks but metadata count is " + std::to_string(meta_.count));
  }
  if (embeddings_.rows != meta_.count) {
    throw StoreLoadError("Store has " + std::to_string(embeddings_.rows) +
                         " embedding rows but metadata count is " + std::to_string(meta_.count));
  }
  if (embeddings_.rows > 0 && embeddings_.dim == 0) {
    throw StoreLoadError("Embedding matrix has zero dimension");
  }
  if (embeddings_.dim != 0 &&
      embeddings_.rows > std::numeric_limits<size_t>::max() / embeddings_.dim) {
    throw StoreLoadError("Embedding matrix shape overflows");
  }
  if (embeddings_.data.size() != embeddings_.rows * embeddings_.dim) {
    throw StoreLoadError("Embedding matrix buffer does not match its shape");
  }
  if (meta_.dim && embeddings_.rows > 0 && *meta_.dim != embeddings_.dim) {
    throw StoreLoadError("Embedding dimension " + std::to_string(embeddings_.dim) +
                         " does not match metadata dim " + std::to_string(*meta_.dim));
  }
  if (meta_.chunk_digest && *meta_.chunk_digest != compute_chunk_digest(chunks_)) {
    throw StoreLoadError("Chunk order digest mismatch, chunks.jsonl was modified after ingestion");
  }
}

std::string EmbeddingStore::compute_chunk_digest(const std::vector<ChunkRecord> &chunks) {
  std::string ids;
  for (const auto &chunk : chunks) {
    ids += chunk.chunk_id;
    ids += '\n';
  }
  return digest::sha256_hex(ids);
}

EmbeddingStore EmbeddingStore::load(const std::filesystem::path &store_dir) {
  const auto embeddings_path = store_dir / kEmbeddingsFile;
  const auto chunks_path = store_dir / kChunksFile;
  const auto meta_path = store_dir / kMetaFile;
  for (const auto &path : {embeddings_path, chunks_path, meta_path}) {
    if (!std::filesystem::exists(path)) {
      throw StoreLoadError("Missing store artifact: " + path.string());
    }
  }

  StoreMeta meta;
  {
    std::ifstream meta_stream(meta_path);
    if (!meta_stream.is_open()) {
      throw StoreLoadError("Could not open " + meta_path.string());
    }
    try {
      nlohmann::json json_meta;
      meta_stream >> json_meta;
      meta = meta_from_json(json_meta);
    } catch (const nlohmann::json::exception &e) {
      throw StoreLoadError("Malformed " + meta_path.string() + ": " + e.what());
    }
  }

  EmbeddingMatrix embeddings;
  try {
    embeddings = read_npy(embeddings_path);
  } catch (const NpyError &e) {
    throw StoreLoadError(e.what());
  }

  EmbeddingStore store(read_chunks(chunks_path), std::move(embeddings), std::move(meta));
  std::cout << "Loaded store from " << store_dir.string() << ": " << store.size()
            << " chunks, model " << store.meta().model << std::endl;
  return store;
}

void EmbeddingStore::save(const std::filesystem::path &store_dir) const {
  std::error_code ec;
  std::filesystem::create_directories(store_dir, ec);
  if (ec) {
    throw IngestionError("Could not create store directory " + store_dir.string() + ": " +
                         ec.message());
  }

  std::vector<StagedFile> files;
  for (const char *name : {kEmbeddingsFile, kChunksFile, kMetaFile}) {
    StagedFile file;
    file.temp = store_dir / (std::string(name) + kTempSuffix);
    file.final_path = store_dir / name;
    file.backup = store_dir / (std::string(name) + kBackupSuffix);
    files.push_back(std::move(file));
  }

  try {
    try {
      write_npy(files[0].temp, embeddings_);
    } catch (const NpyError &e) {
      throw IngestionError(e.what());
    }
    write_chunks(files[1].temp, chunks_);

    std::ofstream meta_stream(files[2].temp, std::ios::trunc);
    if (!meta_stream.is_open()) {
      throw IngestionError("Could not open " + files[2].temp.string() + " for writing");
    }
    meta_stream << meta_to_json(meta_).dump(2) << "\n";
    meta_stream.close();
    if (!meta_stream) {
      throw IngestionError("Failed writing " + files[2].temp.string());
    }
  } catch (const std::exception &) {
    for (const auto &file : files) {
      remove_quietly(file.temp);
    }
    throw;
  }

  commit_staged(files);
}

}  // namespace ragdesk_core
