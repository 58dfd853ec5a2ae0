#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ragdesk_core {

// A retrieved chunk presented as evidence for an answer
struct Context {
  std::string text;
  std::string source;
  std::string title;
  float score = 0.0f;
};

// A Context without its chunk text, as returned inside an AnswerResponse
struct ContextSummary {
  std::string source;
  std::string title;
  float score = 0.0f;
};

ContextSummary summarize(const Context& context);
std::vector<ContextSummary> summarize(const std::vector<Context>& contexts);

enum class GuardrailDecision { Passed, Refused };
std::string to_string(GuardrailDecision decision);

struct AnswerMeta {
  int k = 0;
  std::string provider;
  std::string generated_at;
  GuardrailDecision guardrail = GuardrailDecision::Refused;
  float threshold = 0.0f;
  std::optional<float> top_score;
};

struct AnswerResponse {
  std::string answer;
  std::vector<ContextSummary> contexts;
  AnswerMeta meta;
};

nlohmann::json to_json(const Context& context, bool include_text);
nlohmann::json to_json(const std::vector<Context>& contexts, bool include_text);
nlohmann::json to_json(const ContextSummary& summary);
nlohmann::json to_json(const AnswerResponse& response);

}  // namespace ragdesk_core
