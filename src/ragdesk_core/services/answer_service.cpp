#include "ragdesk_core/services/answer_service.hpp"

#include <iostream>
#include <sstream>

#include "ragdesk_core/errors.hpp"
#include "ragdesk_core/llm/generator_registry.hpp"
#include "ragdesk_core/services/retriever.hpp"
#include "ragdesk_core/util/deadline.hpp"
#include "ragdesk_core/util/time.hpp"

namespace ragdesk_core {

AnswerService::AnswerService(std::shared_ptr<const Retriever> retriever,
                             std::shared_ptr<const GeneratorRegistry> generators,
                             AnswerOptions options)
    : retriever_(std::move(retriever)), generators_(std::move(generators)), options_(options) {}

std::string AnswerService::build_prompt(const std::string &query,
                                        const std::vector<Context> &contexts) {
  std::ostringstream prompt;
  prompt << "You are a helpful assistant. Answer ONLY using the context. If the answer is not "
            "in the context, say you don't know.\n\n";
  prompt << "Question: " << query << "\n\n";
  prompt << "Context:\n";
  for (size_t i = 0; i < contexts.size(); ++i) {
    if (i > 0) {
      prompt << "\n\n";
    }
    prompt << "[" << i + 1 << "] " << contexts[i].text;
  }
  prompt << "\n\nRequirements:\n";
  prompt << "- Be concise.\n";
  prompt << "- Cite sources like [1], [2] that correspond to the context indices above.";
  return prompt.str();
}

AnswerResponse AnswerService::answer(const std::string &query, int k,
                                     const std::string &provider) const {
  if (query.empty()) {
    throw InvalidInputError("Query cannot be empty");
  }
  if (k < 1) {
    throw InvalidInputError("k must be at least 1, got " + std::to_string(k));
  }
  const GenerationBackend &backend = generators_->get(provider);

  const std::vector<Context> contexts = retriever_->search(query, k);

  AnswerResponse response;
  response.contexts = summarize(contexts);
  response.meta.k = k;
  response.meta.provider = provider;
  response.meta.threshold = options_.guardrail_threshold;
  if (!contexts.empty()) {
    response.meta.top_score = contexts.front().score;
  }

  if (contexts.empty() || contexts.front().score < options_.guardrail_threshold) {
    std::cout << "Guardrail refused query (top score "
              << (contexts.empty() ? std::string("n/a") : std::to_string(contexts.front().score))
              << ", threshold " << options_.guardrail_threshold << ")" << std::endl;
    response.answer = kRefusalAnswer;
    response.meta.guardrail = GuardrailDecision::Refused;
    response.meta.generated_at = time::current_time_iso8601();
    return response;
  }

  const std::string prompt = build_prompt(query, contexts);
  std::shared_ptr<Generator> generator = backend.generator;
  const std::string raw = run_with_deadline(
      [generator, prompt]() { return generator->generate(prompt); },
      options_.generation_timeout, "Generation with provider '" + provider + "'");

  response.answer = backend.sanitizer->sanitize(raw);
  response.meta.guardrail = GuardrailDecision::Passed;
  response.meta.generated_at = time::current_time_iso8601();
  return response;
}

}  // namespace ragdesk_core
