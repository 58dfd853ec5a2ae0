#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ragdesk_core/errors.hpp"
#include "ragdesk_core/store/embedding_store.hpp"
#include "../../common/utilities_test.hpp"

namespace ragdesk_core {

using ragdesk_tests::TestUtilities;

class EmbeddingStoreTest : public ragdesk_tests::TempDirTestBase {
 protected:
  EmbeddingStore create_store() {
    return TestUtilities::create_test_store(
        {TestUtilities::create_test_chunk("d1", 0, "first chunk", "docs/a.txt"),
         TestUtilities::create_test_chunk("d1", 1, "second chunk \"quoted\"\nline", "docs/a.txt"),
         TestUtilities::create_test_chunk("d2", 0, "third chunk", "docs/b.md")},
        {{1.0f, 0.0f}, {0.0f, 1.0f}, {0.5f, 0.5f}});
  }

  static std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
  }
};

TEST_F(EmbeddingStoreTest, SaveThenLoad_PreservesOrderAndMeta) {
  EmbeddingStore store = create_store();

  store.save(temp_dir_);
  EmbeddingStore loaded = EmbeddingStore::load(temp_dir_);

  ASSERT_EQ(loaded.size(), 3u);
  for (size_t i = 0; i < loaded.size(); ++i) {
    EXPECT_EQ(loaded.chunks()[i].chunk_id, store.chunks()[i].chunk_id);
    EXPECT_EQ(loaded.chunks()[i].text, store.chunks()[i].text);
    EXPECT_EQ(loaded.chunks()[i].source, store.chunks()[i].source);
    EXPECT_EQ(loaded.chunks()[i].doc_id, store.chunks()[i].doc_id);
  }
  EXPECT_EQ(loaded.embeddings().data, store.embeddings().data);
  EXPECT_EQ(loaded.meta().model, "test-embed");
  EXPECT_EQ(loaded.meta().count, 3u);
  EXPECT_EQ(loaded.meta().dim.value_or(0), 2u);
  EXPECT_EQ(loaded.meta().chunk_digest.value_or(""), store.meta().chunk_digest.value_or("-"));
}

TEST_F(EmbeddingStoreTest, Save_WritesJsonLinesAndNoTempFiles) {
  create_store().save(temp_dir_);

  std::istringstream lines(read_file(temp_dir_ / EmbeddingStore::kChunksFile));
  std::string line;
  size_t count = 0;
  while (std::getline(lines, line)) {
    auto record = nlohmann::json::parse(line);
    EXPECT_TRUE(record.contains("doc_id"));
    EXPECT_TRUE(record.contains("source"));
    EXPECT_TRUE(record.contains("chunk_id"));
    EXPECT_TRUE(record.contains("text"));
    ++count;
  }
  EXPECT_EQ(count, 3u);

  for (const auto& entry : std::filesystem::directory_iterator(temp_dir_)) {
    EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
  }
}

TEST_F(EmbeddingStoreTest, Save_OverwriteLeavesOnlyNewArtifacts) {
  create_store().save(temp_dir_);
  EmbeddingStore replacement = TestUtilities::create_test_store(
      {TestUtilities::create_test_chunk("d3", 0, "replacement chunk")}, {{0.0f, 0.0f, 1.0f}});

  replacement.save(temp_dir_);

  EmbeddingStore loaded = EmbeddingStore::load(temp_dir_);
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded.chunks()[0].text, "replacement chunk");
  size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(temp_dir_)) {
    EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
    EXPECT_NE(entry.path().extension(), ".bak") << entry.path();
    ++entries;
  }
  EXPECT_EQ(entries, 3u);
}

TEST_F(EmbeddingStoreTest, Save_FailedSwapKeepsPreviousStore) {
  // Arrange
  create_store().save(temp_dir_);
  const std::string old_embeddings = read_file(temp_dir_ / EmbeddingStore::kEmbeddingsFile);
  const std::string old_chunks = read_file(temp_dir_ / EmbeddingStore::kChunksFile);
  const std::string old_meta = read_file(temp_dir_ / EmbeddingStore::kMetaFile);

  // A non-empty directory where meta.json would be moved aside makes the third
  // rename fail after the first two artifacts have already been moved
  const auto blocker = temp_dir_ / (std::string(EmbeddingStore::kMetaFile) + ".bak");
  std::filesystem::create_directories(blocker);
  TestUtilities::write_file(blocker / "keep", "x");

  EmbeddingStore replacement = TestUtilities::create_test_store(
      {TestUtilities::create_test_chunk("d3", 0, "replacement chunk")}, {{0.0f, 0.0f, 1.0f}});

  // Act
  EXPECT_THROW({ replacement.save(temp_dir_); }, IngestionError);

  // Assert
  EXPECT_EQ(read_file(temp_dir_ / EmbeddingStore::kEmbeddingsFile), old_embeddings);
  EXPECT_EQ(read_file(temp_dir_ / EmbeddingStore::kChunksFile), old_chunks);
  EXPECT_EQ(read_file(temp_dir_ / EmbeddingStore::kMetaFile), old_meta);
  EXPECT_EQ(EmbeddingStore::load(temp_dir_).size(), 3u);
  for (const auto& entry : std::filesystem::directory_iterator(temp_dir_)) {
    EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
  }
  EXPECT_FALSE(std::filesystem::exists(
      temp_dir_ / (std::string(EmbeddingStore::kEmbeddingsFile) + ".bak")));
  EXPECT_FALSE(std::filesystem::exists(
      temp_dir_ / (std::string(EmbeddingStore::kChunksFile) + ".bak")));
}

TEST_F(EmbeddingStoreTest, Load_MissingArtifactThrows) {
  create_store().save(temp_dir_);
  std::filesystem::remove(temp_dir_ / EmbeddingStore::kEmbeddingsFile);

  EXPECT_THROW({ (void)EmbeddingStore::load(temp_dir_); }, StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Load_MissingDirectoryThrows) {
  EXPECT_THROW({ (void)EmbeddingStore::load(temp_dir_ / "never_ingested"); }, StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Load_ReorderedChunksFailDigest) {
  create_store().save(temp_dir_);
  std::istringstream lines(read_file(temp_dir_ / EmbeddingStore::kChunksFile));
  std::vector<std::string> records;
  std::string line;
  while (std::getline(lines, line)) {
    records.push_back(line);
  }
  ASSERT_EQ(records.size(), 3u);
  create_test_file(EmbeddingStore::kChunksFile, records[1] + "\n" + records[0] + "\n" + records[2] + "\n");

  EXPECT_THROW({ (void)EmbeddingStore::load(temp_dir_); }, StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Load_CountMismatchThrows) {
  create_store().save(temp_dir_);
  create_test_file(EmbeddingStore::kMetaFile, R"({"model": "test-embed", "count": 4})");

  EXPECT_THROW({ (void)EmbeddingStore::load(temp_dir_); }, StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Load_MalformedMetaThrows) {
  create_store().save(temp_dir_);
  create_test_file(EmbeddingStore::kMetaFile, R"({"count": 3})");

  EXPECT_THROW({ (void)EmbeddingStore::load(temp_dir_); }, StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Load_MalformedChunkLineThrows) {
  create_store().save(temp_dir_);
  create_test_file(EmbeddingStore::kChunksFile, "{\"doc_id\": \"d1\"}\nnot json\n");

  EXPECT_THROW({ (void)EmbeddingStore::load(temp_dir_); }, StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Load_MetaWithoutOptionalFieldsIsAccepted) {
  create_store().save(temp_dir_);
  create_test_file(EmbeddingStore::kMetaFile, R"({"model": "test-embed", "count": 3})");

  EmbeddingStore loaded = EmbeddingStore::load(temp_dir_);

  EXPECT_EQ(loaded.size(), 3u);
  EXPECT_FALSE(loaded.meta().dim.has_value());
  EXPECT_FALSE(loaded.meta().chunk_digest.has_value());
}

TEST_F(EmbeddingStoreTest, Constructor_RowCountMismatchThrows) {
  EmbeddingMatrix matrix{.rows = 1, .dim = 2, .data = {1.0f, 0.0f}};
  StoreMeta meta;
  meta.model = "test-embed";
  meta.count = 2;

  EXPECT_THROW(
      {
        EmbeddingStore store(TestUtilities::create_test_chunks(2), matrix, meta);
      },
      StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Constructor_DimMismatchThrows) {
  EmbeddingMatrix matrix{.rows = 1, .dim = 2, .data = {1.0f, 0.0f}};
  StoreMeta meta;
  meta.model = "test-embed";
  meta.count = 1;
  meta.dim = 3;

  EXPECT_THROW({ EmbeddingStore store(TestUtilities::create_test_chunks(1), matrix, meta); },
               StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Constructor_OverflowingShapeThrows) {
  EmbeddingMatrix matrix{.rows = 2, .dim = size_t{1} << 63, .data = {}};
  StoreMeta meta;
  meta.model = "test-embed";
  meta.count = 2;

  EXPECT_THROW({ EmbeddingStore store(TestUtilities::create_test_chunks(2), matrix, meta); },
               StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Load_OverflowingNpyShapeIsStoreLoadError) {
  create_store().save(temp_dir_);
  std::string header =
      "{'descr': '<f4', 'fortran_order': False, 'shape': (3, 9223372036854775808), }";
  const size_t unpadded = 10 + header.size() + 1;
  header.append((64 - unpadded % 64) % 64, ' ');
  header.push_back('\n');
  std::string bytes = "\x93NUMPY";
  bytes.push_back(1);
  bytes.push_back(0);
  bytes.push_back(static_cast<char>(header.size() & 0xFF));
  bytes.push_back(static_cast<char>((header.size() >> 8) & 0xFF));
  bytes += header;
  TestUtilities::write_file(temp_dir_ / EmbeddingStore::kEmbeddingsFile, bytes);

  EXPECT_THROW({ (void)EmbeddingStore::load(temp_dir_); }, StoreLoadError);
}

TEST_F(EmbeddingStoreTest, Constructor_EmptyModelThrows) {
  EXPECT_THROW({ EmbeddingStore store({}, EmbeddingMatrix{}, StoreMeta{}); }, StoreLoadError);
}

TEST_F(EmbeddingStoreTest, EmptyStoreRoundTrips) {
  EmbeddingStore empty = TestUtilities::create_test_store({}, {});
  empty.save(temp_dir_);

  EmbeddingStore loaded = EmbeddingStore::load(temp_dir_);

  EXPECT_TRUE(loaded.empty());
}

TEST(EmbeddingStoreDigestTest, DigestDependsOnOrder) {
  auto chunks = TestUtilities::create_test_chunks(3);
  const std::string digest = EmbeddingStore::compute_chunk_digest(chunks);
  std::swap(chunks[0], chunks[2]);

  EXPECT_EQ(digest.size(), 64u);
  EXPECT_NE(EmbeddingStore::compute_chunk_digest(chunks), digest);
}

}  // namespace ragdesk_core
