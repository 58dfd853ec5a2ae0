#pragma once

#include <string>

namespace ragdesk_core {

// A text generation backend. Failures are reported as UpstreamError and never retried.
class Generator {
 public:
  virtual ~Generator() = default;

  virtual std::string generate(const std::string &prompt) = 0;
};

}  // namespace ragdesk_core
