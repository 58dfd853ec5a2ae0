#pragma once

#include <string>
#include <vector>

namespace ragdesk_core {

// Turns texts into dense vectors. One vector per input, in input order.
// Implementations must be deterministic for a given model id and safe to call concurrently.
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) const = 0;

  virtual std::string model_id() const = 0;
};

}  // namespace ragdesk_core
