#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "ragdesk_core/types/context.hpp"

namespace ragdesk_core {

class Retriever;
class GeneratorRegistry;

inline constexpr const char *kRefusalAnswer =
    "I couldn’t find a reliable answer in the provided documents.";

struct AnswerOptions {
  float guardrail_threshold = 0.55f;
  std::chrono::milliseconds generation_timeout{std::chrono::seconds(60)};
};

/**
 * @class AnswerService
 * @brief Retrieval, confidence guardrail, prompt, generation and response envelope.
 *
 * When retrieval finds nothing or the best score is below the guardrail
 * threshold the generator is not called and the fixed refusal is returned.
 * Returned contexts never include chunk text.
 */
class AnswerService {
 public:
  AnswerService(std::shared_ptr<const Retriever> retriever,
                std::shared_ptr<const GeneratorRegistry> generators,
                AnswerOptions options = {});

  // Throws InvalidInputError, UpstreamError or TimeoutError
  AnswerResponse answer(const std::string &query, int k, const std::string &provider) const;

  // Numbered-context prompt; only chunk text is interpolated
  static std::string build_prompt(const std::string &query, const std::vector<Context> &contexts);

  const AnswerOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<const Retriever> retriever_;
  std::shared_ptr<const GeneratorRegistry> generators_;
  AnswerOptions options_;
};

}  // namespace ragdesk_core
