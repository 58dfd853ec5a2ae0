#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace ragdesk_core {

class NpyError : public std::runtime_error {
 public:
  explicit NpyError(const std::string &message) : std::runtime_error(message) {}
};

// Dense row-major float matrix
struct EmbeddingMatrix {
  size_t rows = 0;
  size_t dim = 0;
  std::vector<float> data;

  const float *row(size_t i) const {
    return data.data() + i * dim;
  }
};

// Writes a NumPy .npy v1.0 file: '<f4', C order, shape (rows, dim)
void write_npy(const std::filesystem::path &path, const EmbeddingMatrix &matrix);

// Reads a 2-D little-endian float32 or float64 C-order .npy file; shape (0,) is an empty matrix
EmbeddingMatrix read_npy(const std::filesystem::path &path);

}  // namespace ragdesk_core
