#include "ragdesk_core/types.hpp"

namespace ragdesk_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "Text";
    case FileType::Markdown:
      return "Markdown";
    case FileType::PDF:
      return "PDF";
    case FileType::Word:
      return "Word";
    default:
      return "Unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  if (str == "Text")
    return FileType::Text;
  if (str == "Markdown")
    return FileType::Markdown;
  if (str == "PDF")
    return FileType::PDF;
  if (str == "Word")
    return FileType::Word;
  return FileType::Unknown;
}

std::string make_chunk_id(const std::string& doc_id, size_t sequence_index) {
  return doc_id + "::" + std::to_string(sequence_index);
}

std::string to_string(GuardrailDecision decision) {
  switch (decision) {
    case GuardrailDecision::Passed:
      return "passed";
    case GuardrailDecision::Refused:
      return "refused";
    default:
      return "unknown";
  }
}

ContextSummary summarize(const Context& context) {
  return {.source = context.source, .title = context.title, .score = context.score};
}

std::vector<ContextSummary> summarize(const std::vector<Context>& contexts) {
  std::vector<ContextSummary> summaries;
  summaries.reserve(contexts.size());
  for (const auto& context : contexts) {
    summaries.push_back(summarize(context));
  }
  return summaries;
}

nlohmann::json to_json(const Context& context, bool include_text) {
  nlohmann::json json_context;
  if (include_text) {
    json_context["text"] = context.text;
  }
  json_context["source"] = context.source;
  json_context["title"] = context.title;
  json_context["score"] = context.score;
  return json_context;
}

nlohmann::json to_json(const std::vector<Context>& contexts, bool include_text) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto& context : contexts) {
    results.push_back(to_json(context, include_text));
  }
  return results;
}

nlohmann::json to_json(const ContextSummary& summary) {
  return {{"source", summary.source}, {"title", summary.title}, {"score", summary.score}};
}

nlohmann::json to_json(const AnswerResponse& response) {
  nlohmann::json contexts = nlohmann::json::array();
  for (const auto& summary : response.contexts) {
    contexts.push_back(to_json(summary));
  }

  nlohmann::json meta;
  meta["k"] = response.meta.k;
  meta["provider"] = response.meta.provider;
  meta["generated_at"] = response.meta.generated_at;
  meta["guardrail"] = to_string(response.meta.guardrail);
  meta["threshold"] = response.meta.threshold;
  if (response.meta.top_score.has_value()) {
    meta["top_score"] = *response.meta.top_score;
  }

  nlohmann::json json_response;
  json_response["answer"] = response.answer;
  json_response["contexts"] = contexts;
  json_response["meta"] = meta;
  return json_response;
}

}  // namespace ragdesk_core
