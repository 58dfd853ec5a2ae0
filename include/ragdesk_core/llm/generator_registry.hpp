#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ragdesk_core/llm/generator.hpp"
#include "ragdesk_core/llm/output_sanitizer.hpp"

namespace ragdesk_core {

struct GenerationBackend {
  std::shared_ptr<Generator> generator;
  OutputSanitizerPtr sanitizer;
};

// Provider name -> generation backend. Populated at startup, read-only afterwards.
class GeneratorRegistry {
 public:
  // A null sanitizer registers the identity sanitizer
  void register_provider(const std::string &provider, std::shared_ptr<Generator> generator,
                         OutputSanitizerPtr sanitizer = nullptr);

  bool contains(const std::string &provider) const;

  // Throws InvalidInputError for unknown providers
  const GenerationBackend &get(const std::string &provider) const;

  std::vector<std::string> providers() const;

 private:
  std::map<std::string, GenerationBackend> backends_;
};

}  // namespace ragdesk_core
