#pragma once

#include <cstddef>
#include <string>

namespace ragdesk_core {

// One line of chunks.jsonl. chunk_id is "{doc_id}::{sequence_index}".
struct ChunkRecord {
  std::string doc_id;
  std::string source;
  std::string chunk_id;
  std::string text;
};

std::string make_chunk_id(const std::string& doc_id, size_t sequence_index);

}  // namespace ragdesk_core
