#include <gtest/gtest.h>

#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include "ragdesk_core/store/npy_io.hpp"
#include "../../common/utilities_test.hpp"

namespace ragdesk_core {

class NpyIoTest : public ragdesk_tests::TempDirTestBase {
 protected:
  // Writes a v1.0 file with an arbitrary header and raw payload
  std::filesystem::path write_raw_npy(const std::string& filename, std::string header,
                                      const std::string& payload) {
    const size_t unpadded = 10 + header.size() + 1;
    header.append((64 - unpadded % 64) % 64, ' ');
    header.push_back('\n');

    std::string bytes = "\x93NUMPY";
    bytes.push_back(1);
    bytes.push_back(0);
    bytes.push_back(static_cast<char>(header.size() & 0xFF));
    bytes.push_back(static_cast<char>((header.size() >> 8) & 0xFF));
    bytes += header;
    bytes += payload;
    return create_test_file(filename, bytes);
  }

  template <typename T>
  static std::string as_bytes(const std::vector<T>& values) {
    std::string bytes(values.size() * sizeof(T), '\0');
    std::memcpy(bytes.data(), values.data(), bytes.size());
    return bytes;
  }
};

TEST_F(NpyIoTest, WriteThenRead_PreservesShapeAndValues) {
  EmbeddingMatrix matrix{.rows = 2, .dim = 3, .data = {0.5f, -1.0f, 2.25f, 3.0f, 0.0f, -0.125f}};
  auto path = temp_dir_ / "embeddings.npy";

  write_npy(path, matrix);
  EmbeddingMatrix loaded = read_npy(path);

  EXPECT_EQ(loaded.rows, 2u);
  EXPECT_EQ(loaded.dim, 3u);
  EXPECT_EQ(loaded.data, matrix.data);
  EXPECT_EQ(loaded.row(1)[2], -0.125f);
}

TEST_F(NpyIoTest, Write_HeaderIsAlignedForNumpy) {
  EmbeddingMatrix matrix{.rows = 1, .dim = 4, .data = {1.0f, 2.0f, 3.0f, 4.0f}};
  auto path = temp_dir_ / "aligned.npy";

  write_npy(path, matrix);

  const auto size = std::filesystem::file_size(path);
  EXPECT_EQ((size - 4 * sizeof(float)) % 64, 0u);
}

TEST_F(NpyIoTest, Write_BufferShapeMismatchThrows) {
  EmbeddingMatrix matrix{.rows = 2, .dim = 3, .data = {1.0f}};

  EXPECT_THROW(write_npy(temp_dir_ / "bad.npy", matrix), NpyError);
}

TEST_F(NpyIoTest, Read_Float64IsNarrowed) {
  auto path = write_raw_npy("wide.npy",
                            "{'descr': '<f8', 'fortran_order': False, 'shape': (2, 2), }",
                            as_bytes(std::vector<double>{1.0, 0.5, -2.0, 4.0}));

  EmbeddingMatrix loaded = read_npy(path);

  EXPECT_EQ(loaded.rows, 2u);
  EXPECT_EQ(loaded.dim, 2u);
  EXPECT_EQ(loaded.data, (std::vector<float>{1.0f, 0.5f, -2.0f, 4.0f}));
}

TEST_F(NpyIoTest, Read_EmptyVectorShapeIsEmptyMatrix) {
  auto path = write_raw_npy("empty.npy",
                            "{'descr': '<f4', 'fortran_order': False, 'shape': (0,), }", "");

  EmbeddingMatrix loaded = read_npy(path);

  EXPECT_EQ(loaded.rows, 0u);
  EXPECT_TRUE(loaded.data.empty());
}

TEST_F(NpyIoTest, Read_FortranOrderThrows) {
  auto path = write_raw_npy("fortran.npy",
                            "{'descr': '<f4', 'fortran_order': True, 'shape': (1, 2), }",
                            as_bytes(std::vector<float>{1.0f, 2.0f}));

  EXPECT_THROW({ (void)read_npy(path); }, NpyError);
}

TEST_F(NpyIoTest, Read_UnsupportedDtypeThrows) {
  auto path = write_raw_npy("ints.npy",
                            "{'descr': '<i4', 'fortran_order': False, 'shape': (1, 2), }",
                            as_bytes(std::vector<int>{1, 2}));

  EXPECT_THROW({ (void)read_npy(path); }, NpyError);
}

TEST_F(NpyIoTest, Read_TruncatedPayloadThrows) {
  auto path = write_raw_npy("short.npy",
                            "{'descr': '<f4', 'fortran_order': False, 'shape': (2, 2), }",
                            as_bytes(std::vector<float>{1.0f, 2.0f, 3.0f}));

  EXPECT_THROW({ (void)read_npy(path); }, NpyError);
}

TEST_F(NpyIoTest, Read_OverflowingShapeThrows) {
  // 2 * 2^63 wraps to zero elements in size_t arithmetic
  auto path = write_raw_npy(
      "overflow.npy",
      "{'descr': '<f4', 'fortran_order': False, 'shape': (2, 9223372036854775808), }", "");

  EXPECT_THROW({ (void)read_npy(path); }, NpyError);
}

TEST_F(NpyIoTest, Read_ShapeLargerThanFileThrowsBeforeAllocating) {
  auto path = write_raw_npy(
      "huge.npy", "{'descr': '<f4', 'fortran_order': False, 'shape': (4000000000, 1024), }",
      as_bytes(std::vector<float>{1.0f, 2.0f}));

  EXPECT_THROW({ (void)read_npy(path); }, NpyError);
}

TEST_F(NpyIoTest, Read_ZeroColumnsWithRowsThrows) {
  auto path = write_raw_npy("flat.npy",
                            "{'descr': '<f4', 'fortran_order': False, 'shape': (3, 0), }", "");

  EXPECT_THROW({ (void)read_npy(path); }, NpyError);
}

TEST_F(NpyIoTest, Read_BadMagicThrows) {
  auto path = create_test_file("text.npy", "definitely not numpy");

  EXPECT_THROW({ (void)read_npy(path); }, NpyError);
}

TEST_F(NpyIoTest, Read_MissingFileThrows) {
  EXPECT_THROW({ (void)read_npy(temp_dir_ / "absent.npy"); }, NpyError);
}

}  // namespace ragdesk_core
