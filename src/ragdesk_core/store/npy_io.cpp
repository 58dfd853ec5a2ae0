#include "ragdesk_core/store/npy_io.hpp"

#include <bit>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <new>
#include <sstream>

namespace ragdesk_core {

namespace {

constexpr char kMagic[] = "\x93NUMPY";
constexpr size_t kMagicSize = 6;
constexpr size_t kAlignment = 64;

std::string dict_value(const std::string &header, const std::string &key) {
  const std::string quoted = "'" + key + "'";
  size_t pos = header.find(quoted);
  if (pos == std::string::npos) {
    throw NpyError("npy header is missing '" + key + "'");
  }
  pos = header.find(':', pos + quoted.size());
  if (pos == std::string::npos) {
    throw NpyError("npy header is malformed near '" + key + "'");
  }
  ++pos;
  while (pos < header.size() && header[pos] == ' ') {
    ++pos;
  }
  if (pos >= header.size()) {
    throw NpyError("npy header is malformed near '" + key + "'");
  }

  size_t end;
  if (header[pos] == '\'') {
    end = header.find('\'', pos + 1);
    if (end == std::string::npos) {
      throw NpyError("npy header has an unterminated string");
    }
    return header.substr(pos + 1, end - pos - 1);
  }
  if (header[pos] == '(') {
    end = header.find(')', pos);
    if (end == std::string::npos) {
      throw NpyError("npy header has an unterminated shape");
    }
    return header.substr(pos, end - pos + 1);
  }
  end = header.find_first_of(",}", pos);
  return header.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

std::vector<size_t> parse_shape(const std::string &tuple) {
  std::vector<size_t> shape;
  std::string inner = tuple.substr(1, tuple.size() - 2);
  std::stringstream ss(inner);
  std::string item;
  while (std::getline(ss, item, ',')) {
    size_t first = item.find_first_not_of(' ');
    if (first == std::string::npos) {
      continue;
    }
    try {
      shape.push_back(static_cast<size_t>(std::stoull(item.substr(first))));
    } catch (const std::exception &) {
      throw NpyError("npy shape is not numeric: " + tuple);
    }
  }
  return shape;
}

}  // namespace

void write_npy(const std::filesystem::path &path, const EmbeddingMatrix &matrix) {
  if constexpr (std::endian::native != std::endian::little) {
    throw NpyError("Writing .npy files requires a little-endian host");
  }
  if (matrix.data.size() != matrix.rows * matrix.dim) {
    throw NpyError("Matrix buffer holds " + std::to_string(matrix.data.size()) +
                   " values, expected " + std::to_string(matrix.rows * matrix.dim));
  }

  std::string header = "{'descr': '<f4', 'fortran_order': False, 'shape': (" +
                       std::to_string(matrix.rows) + ", " + std::to_string(matrix.dim) + "), }";
  // magic + version + uint16 length + header + '\n' is padded to the alignment
  const size_t preamble = kMagicSize + 2 + 2;
  const size_t unpadded = preamble + header.size() + 1;
  header.append((kAlignment - unpadded % kAlignment) % kAlignment, ' ');
  header.push_back('\n');

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw NpyError("Could not open " + path.string() + " for writing");
  }

  const uint16_t header_len = static_cast<uint16_t>(header.size());
  const char version[2] = {1, 0};
  const char length[2] = {static_cast<char>(header_len & 0xFF),
                          static_cast<char>((header_len >> 8) & 0xFF)};
  out.write(kMagic, kMagicSize);
  out.write(version, 2);
  out.write(length, 2);
  out.write(header.data(), static_cast<std::streamsize>(header.size()));
  out.write(reinterpret_cast<const char *>(matrix.data.data()),
            static_cast<std::streamsize>(matrix.data.size() * sizeof(float)));
  if (!out) {
    throw NpyError("Failed writing " + path.string());
  }
}

EmbeddingMatrix read_npy(const std::filesystem::path &path) {
  if constexpr (std::endian::native != std::endian::little) {
    throw NpyError("Reading .npy files requires a little-endian host");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw NpyError("Could not open " + path.string());
  }

  char magic[kMagicSize];
  unsigned char version[2];
  in.read(magic, kMagicSize);
  in.read(reinterpret_cast<char *>(version), 2);
  if (!in || std::memcmp(magic, kMagic, kMagicSize) != 0) {
    throw NpyError(path.string() + " is not a .npy file");
  }

  size_t header_len = 0;
  if (version[0] == 1) {
    unsigned char len[2];
    in.read(reinterpret_cast<char *>(len), 2);
    header_len = static_cast<size_t>(len[0]) | (static_cast<size_t>(len[1]) << 8);
  } else if (version[0] == 2 || version[0] == 3) {
    unsigned char len[4];
    in.read(reinterpret_cast<char *>(len), 4);
    header_len = static_cast<size_t>(len[0]) | (static_cast<size_t>(len[1]) << 8) |
                 (static_cast<size_t>(len[2]) << 16) | (static_cast<size_t>(len[3]) << 24);
  } else {
    throw NpyError("Unsupported .npy version " + std::to_string(version[0]));
  }

  std::string header(header_len, '\0');
  in.read(header.data(), static_cast<std::streamsize>(header_len));
  if (!in) {
    throw NpyError(path.string() + " has a truncated header");
  }

  const std::string descr = dict_value(header, "descr");
  if (descr != "<f4" && descr != "<f8") {
    throw NpyError("Unsupported .npy dtype '" + descr + "', expected '<f4'");
  }
  if (dict_value(header, "fortran_order") != "False") {
    throw NpyError("Fortran-ordered .npy arrays are not supported");
  }

  const std::vector<size_t> shape = parse_shape(dict_value(header, "shape"));
  EmbeddingMatrix matrix;
  if (shape.size() == 1 && shape[0] == 0) {
    return matrix;
  }
  if (shape.size() != 2) {
    throw NpyError("Expected a 2-D embedding matrix in " + path.string());
  }
  matrix.rows = shape[0];
  matrix.dim = shape[1];
  if (matrix.rows > 0 && matrix.dim == 0) {
    throw NpyError("Embedding matrix in " + path.string() + " has zero columns");
  }

  const size_t item_size = descr == "<f4" ? sizeof(float) : sizeof(double);
  const size_t max_items =
      static_cast<size_t>(std::numeric_limits<std::streamsize>::max()) / item_size;
  if (matrix.dim != 0 && matrix.rows > max_items / matrix.dim) {
    throw NpyError("Shape (" + std::to_string(matrix.rows) + ", " + std::to_string(matrix.dim) +
                   ") in " + path.string() + " is too large");
  }
  const size_t count = matrix.rows * matrix.dim;
  const size_t payload = count * item_size;

  // Check the payload against the file before allocating for it
  const std::streampos data_start = in.tellg();
  in.seekg(0, std::ios::end);
  const std::streampos file_end = in.tellg();
  in.seekg(data_start);
  if (!in || data_start < 0 || file_end < data_start ||
      static_cast<size_t>(file_end - data_start) < payload) {
    throw NpyError(path.string() + " is truncated: expected " + std::to_string(matrix.rows) +
                   " x " + std::to_string(matrix.dim) + " values");
  }

  try {
    matrix.data.resize(count);
    if (descr == "<f4") {
      in.read(reinterpret_cast<char *>(matrix.data.data()), static_cast<std::streamsize>(payload));
    } else {
      std::vector<double> wide(count);
      in.read(reinterpret_cast<char *>(wide.data()), static_cast<std::streamsize>(payload));
      for (size_t i = 0; i < count; ++i) {
        matrix.data[i] = static_cast<float>(wide[i]);
      }
    }
  } catch (const std::bad_alloc &) {
    throw NpyError("Not enough memory for the " + std::to_string(matrix.rows) + " x " +
                   std::to_string(matrix.dim) + " matrix in " + path.string());
  } catch (const std::length_error &) {
    throw NpyError("Matrix in " + path.string() + " exceeds the maximum buffer size");
  }
  if (!in) {
    throw NpyError(path.string() + " is truncated: expected " + std::to_string(matrix.rows) +
                   " x " + std::to_string(matrix.dim) + " values");
  }
  return matrix;
}

}  // namespace ragdesk_core
