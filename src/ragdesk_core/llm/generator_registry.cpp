#include "ragdesk_core/llm/generator_registry.hpp"

#include "ragdesk_core/errors.hpp"

namespace ragdesk_core {

void GeneratorRegistry::register_provider(const std::string &provider,
                                          std::shared_ptr<Generator> generator,
                                          OutputSanitizerPtr sanitizer) {
  if (provider.empty()) {
    throw InvalidInputError("Provider name cannot be empty");
  }
  if (!generator) {
    throw InvalidInputError("Provider '" + provider + "' registered without a generator");
  }
  if (!sanitizer) {
    sanitizer = std::make_shared<IdentitySanitizer>();
  }
  backends_[provider] = GenerationBackend{std::move(generator), std::move(sanitizer)};
}

bool GeneratorRegistry::contains(const std::string &provider) const {
  return backends_.find(provider) != backends_.end();
}

const GenerationBackend &GeneratorRegistry::get(const std::string &provider) const {
  auto it = backends_.find(provider);
  if (it == backends_.end()) {
    throw InvalidInputError("Unknown provider: '" + provider + "'");
  }
  return it->second;
}

std::vector<std::string> GeneratorRegistry::providers() const {
  std::vector<std::string> names;
  for (const auto &[name, backend] : backends_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace ragdesk_core
