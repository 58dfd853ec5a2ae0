#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "ragdesk_core/errors.hpp"
#include "ragdesk_core/llm/ollama_client.hpp"

namespace ragdesk_core {

// Port 1 on loopback has no listener, so every request is refused immediately
class OllamaConnectionTest : public ::testing::Test {
 protected:
  std::shared_ptr<OllamaConnection> unreachable() const {
    return std::make_shared<OllamaConnection>("http://127.0.0.1:1", 5);
  }
};

TEST_F(OllamaConnectionTest, Construction_DoesNotContactServer) {
  std::shared_ptr<OllamaConnection> connection;
  EXPECT_NO_THROW(connection = unreachable());

  EXPECT_EQ(connection->url(), "http://127.0.0.1:1");
  EXPECT_EQ(connection->read_timeout_seconds(), 5);
  EXPECT_FALSE(connection->is_running());
}

TEST_F(OllamaConnectionTest, Client_UnreachableServerThrows) {
  EXPECT_THROW({ OllamaClient client(unreachable(), "nomic-embed-text"); }, OllamaError);
}

TEST_F(OllamaConnectionTest, Generator_UnreachableServerIsUpstreamError) {
  OllamaGenerator generator(unreachable(), "llama3");

  EXPECT_THROW({ (void)generator.generate("Say hi"); }, UpstreamError);
}

TEST_F(OllamaConnectionTest, Generators_ShareOneConnection) {
  auto connection = unreachable();
  OllamaGenerator first(connection, "llama3");
  OllamaGenerator second(connection, "qwen3");

  EXPECT_EQ(first.connection(), connection);
  EXPECT_EQ(second.connection(), connection);
}

TEST_F(OllamaConnectionTest, ConcurrentEmbedAndGenerateFailCleanly) {
  // Interleaved embedding and generation requests on one connection must each
  // fail with their own error, never touch another request's HTTP client
  auto connection = unreachable();
  OllamaGenerator generator(connection, "llama3");

  constexpr int kThreads = 8;
  std::atomic<int> upstream_errors{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      try {
        if (i % 2 == 0) {
          (void)connection->embed("nomic-embed-text", {"chunk " + std::to_string(i)});
        } else {
          (void)generator.generate("prompt " + std::to_string(i));
        }
      } catch (const UpstreamError &) {
        ++upstream_errors;
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(upstream_errors.load(), kThreads);
}

}  // namespace ragdesk_core
