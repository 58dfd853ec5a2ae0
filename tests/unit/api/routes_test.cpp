#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "ragdesk_api/routes.hpp"
#include "ragdesk_core/errors.hpp"
#include "ragdesk_core/llm/generator_registry.hpp"
#include "ragdesk_core/service_provider.hpp"
#include "ragdesk_core/services/answer_service.hpp"
#include "ragdesk_core/services/retriever.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace ragdesk_api {

using ragdesk_tests::HashingEmbedder;
using ragdesk_tests::MockGenerator;
using ragdesk_tests::TestUtilities;
using testing::_;
using testing::Return;

class RoutesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto embedder = std::make_shared<HashingEmbedder>();
    const std::vector<std::string> texts = {"Attendance is mandatory in Week 2.",
                                            "Parking permits are required for all staff cars."};
    std::vector<ragdesk_core::ChunkRecord> chunks = {
        TestUtilities::create_test_chunk("a", 0, texts[0], "data/week2.md"),
        TestUtilities::create_test_chunk("b", 0, texts[1], "data/parking.txt")};
    auto retriever = std::make_shared<ragdesk_core::Retriever>(
        TestUtilities::create_test_store(chunks, embedder->embed(texts)), embedder);

    generator_ = std::make_shared<testing::NiceMock<MockGenerator>>();
    auto registry = std::make_shared<ragdesk_core::GeneratorRegistry>();
    registry->register_provider("ollama", generator_,
                                std::make_shared<ragdesk_core::DelimitedBlockSanitizer>());
    registry->register_provider(
        "slow", std::make_shared<ragdesk_tests::SlowGenerator>(std::chrono::milliseconds(500), ""));

    ragdesk_core::AnswerOptions options;
    options.generation_timeout = std::chrono::milliseconds(50);
    auto answer_service = std::make_shared<ragdesk_core::AnswerService>(retriever, registry, options);

    services_ = std::make_shared<ragdesk_core::ServiceProvider>(embedder, retriever, registry,
                                                                answer_service, "ollama");
    routes_ = std::make_unique<Routes>(services_);
  }

  static crow::request make_request(const std::string& body) {
    crow::request req;
    req.body = body;
    return req;
  }

  static nlohmann::json body_of(const crow::response& res) {
    return nlohmann::json::parse(res.body);
  }

  std::shared_ptr<testing::NiceMock<MockGenerator>> generator_;
  std::shared_ptr<ragdesk_core::ServiceProvider> services_;
  std::unique_ptr<Routes> routes_;
};

TEST(HttpStatusTest, MapsErrorKinds) {
  EXPECT_EQ(http_status_for(ragdesk_core::ErrorKind::InvalidInput), 400);
  EXPECT_EQ(http_status_for(ragdesk_core::ErrorKind::Timeout), 504);
  EXPECT_EQ(http_status_for(ragdesk_core::ErrorKind::Upstream), 502);
  EXPECT_EQ(http_status_for(ragdesk_core::ErrorKind::StoreLoad), 500);
  EXPECT_EQ(http_status_for(ragdesk_core::ErrorKind::ModelMismatch), 500);
}

TEST_F(RoutesTest, Health_ReturnsOk) {
  crow::response res = routes_->handle_health_check(make_request(""));

  EXPECT_EQ(res.code, 200);
  EXPECT_EQ(body_of(res)["ok"], true);
}

TEST_F(RoutesTest, Answer_MissingQueryIs400) {
  for (const std::string body : {R"({})", R"({"query": ""})", R"({"query": 42})", R"([1, 2])"}) {
    crow::response res = routes_->handle_answer(make_request(body));

    EXPECT_EQ(res.code, 400) << body;
    EXPECT_EQ(body_of(res), (nlohmann::json{{"error", "Missing 'query'"}})) << body;
  }
}

TEST_F(RoutesTest, Answer_MalformedJsonIs400) {
  crow::response res = routes_->handle_answer(make_request("{not json"));

  EXPECT_EQ(res.code, 400);
  EXPECT_EQ(body_of(res)["kind"], "InvalidInput");
}

TEST_F(RoutesTest, Answer_ReturnsEnvelopeWithDefaults) {
  EXPECT_CALL(*generator_, generate(_)).WillOnce(Return("<think>hm</think>Week 2 [1]."));

  crow::response res =
      routes_->handle_answer(make_request(R"({"query": "When is attendance mandatory?"})"));

  ASSERT_EQ(res.code, 200);
  nlohmann::json body = body_of(res);
  EXPECT_EQ(body["answer"], "Week 2 [1].");
  EXPECT_EQ(body["meta"]["k"], 4);
  EXPECT_EQ(body["meta"]["provider"], "ollama");
  EXPECT_EQ(body["meta"]["guardrail"], "passed");
  ASSERT_EQ(body["contexts"].size(), 2u);
  EXPECT_EQ(body["contexts"][0]["title"], "week2.md");
  EXPECT_FALSE(body["contexts"][0].contains("text"));
}

TEST_F(RoutesTest, Answer_LowConfidenceIsRefusedWith200) {
  EXPECT_CALL(*generator_, generate(_)).Times(0);

  crow::response res =
      routes_->handle_answer(make_request(R"({"query": "Which day is pizza day?", "k": 1})"));

  ASSERT_EQ(res.code, 200);
  nlohmann::json body = body_of(res);
  EXPECT_EQ(body["answer"], ragdesk_core::kRefusalAnswer);
  EXPECT_EQ(body["meta"]["guardrail"], "refused");
  EXPECT_EQ(body["meta"]["k"], 1);
}

TEST_F(RoutesTest, Answer_UnknownProviderIs400) {
  crow::response res = routes_->handle_answer(
      make_request(R"({"query": "When is attendance mandatory?", "provider": "gpt-9"})"));

  EXPECT_EQ(res.code, 400);
  EXPECT_EQ(body_of(res)["kind"], "InvalidInput");
}

TEST_F(RoutesTest, Answer_InvalidKIs400) {
  crow::response res = routes_->handle_answer(
      make_request(R"({"query": "When is attendance mandatory?", "k": 0})"));

  EXPECT_EQ(res.code, 400);
}

TEST_F(RoutesTest, Answer_UpstreamFailureIs502) {
  EXPECT_CALL(*generator_, generate(_))
      .WillOnce(testing::Throw(ragdesk_core::UpstreamError("HTTP 503 from provider")));

  crow::response res =
      routes_->handle_answer(make_request(R"({"query": "When is attendance mandatory?"})"));

  EXPECT_EQ(res.code, 502);
  EXPECT_EQ(body_of(res)["kind"], "Upstream");
}

TEST_F(RoutesTest, Answer_GenerationTimeoutIs504) {
  crow::response res = routes_->handle_answer(
      make_request(R"({"query": "When is attendance mandatory?", "provider": "slow"})"));

  EXPECT_EQ(res.code, 504);
  EXPECT_EQ(body_of(res)["kind"], "Timeout");
}

TEST_F(RoutesTest, Search_ReturnsContextsWithOptionalText) {
  crow::response without_text =
      routes_->handle_search(make_request(R"({"query": "attendance", "k": 1})"));
  crow::response with_text = routes_->handle_search(
      make_request(R"({"query": "attendance", "k": 1, "include_text": true})"));

  ASSERT_EQ(without_text.code, 200);
  ASSERT_EQ(with_text.code, 200);
  ASSERT_EQ(body_of(without_text).size(), 1u);
  EXPECT_FALSE(body_of(without_text)[0].contains("text"));
  EXPECT_EQ(body_of(with_text)[0]["text"], "Attendance is mandatory in Week 2.");
  EXPECT_EQ(body_of(with_text)[0]["source"], "data/week2.md");
}

TEST_F(RoutesTest, Search_MissingQueryIs400) {
  crow::response res = routes_->handle_search(make_request(R"({"k": 2})"));

  EXPECT_EQ(res.code, 400);
}

}  // namespace ragdesk_api
