#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ragdesk_core/llm/openai_embedding_client.hpp"
#include "../../common/mocks_test.hpp"

namespace ragdesk_core {

using ::testing::_;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

class OpenAIEmbeddingClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    transport_ = std::make_shared<testing::StrictMock<ragdesk_tests::MockHttpTransport>>();
    cost_tracker_ = std::make_shared<CostTracker>();
    options_.url = "https://embeddings.test/v1/embeddings";
    options_.model = "text-embedding-3-small";
    options_.api_key = "sk-test";
    options_.batch_size = 512;
  }

  std::unique_ptr<OpenAIEmbeddingClient> make_client() {
    return std::make_unique<OpenAIEmbeddingClient>(options_, transport_, cost_tracker_);
  }

  std::shared_ptr<testing::StrictMock<ragdesk_tests::MockHttpTransport>> transport_;
  std::shared_ptr<CostTracker> cost_tracker_;
  OpenAIEmbeddingOptions options_;
};

TEST_F(OpenAIEmbeddingClientTest, Constructor_RejectsMissingDependencies) {
  EXPECT_THROW({ OpenAIEmbeddingClient client(options_, nullptr, cost_tracker_); },
               std::invalid_argument);
  EXPECT_THROW({ OpenAIEmbeddingClient client(options_, transport_, nullptr); },
               std::invalid_argument);
  options_.batch_size = 0;
  EXPECT_THROW(make_client(), std::invalid_argument);
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_EmptyInputMakesNoRequest) {
  auto client = make_client();
  EXPECT_TRUE(client->get_embeddings({}).empty());
  EXPECT_TRUE(cost_tracker_->session_calls().empty());
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_SendsModelInputAndBearerKey) {
  std::string sent_body;
  std::vector<std::string> sent_headers;
  EXPECT_CALL(*transport_, post_json(options_.url, _, _))
      .WillOnce(Invoke([&](const std::string&, const std::vector<std::string>& headers,
                           const std::string& body) {
        sent_headers = headers;
        sent_body = body;
        return HttpResponse{200, ragdesk_tests::MockUtilities::create_embeddings_response(
                                     {{0.1f, 0.2f}, {0.3f, 0.4f}}, 12)};
      }));

  auto client = make_client();
  auto embeddings = client->get_embeddings({"first text", "second text"});

  ASSERT_EQ(embeddings.size(), 2u);
  EXPECT_EQ(embeddings[0], (std::vector<float>{0.1f, 0.2f}));
  EXPECT_EQ(embeddings[1], (std::vector<float>{0.3f, 0.4f}));

  auto request = nlohmann::json::parse(sent_body);
  EXPECT_EQ(request["model"], "text-embedding-3-small");
  EXPECT_EQ(request["input"], (nlohmann::json{"first text", "second text"}));
  EXPECT_THAT(sent_headers, Contains("Authorization: Bearer sk-test"));
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_OrdersByResponseIndex) {
  const std::string body = R"({
    "data": [
      {"index": 1, "embedding": [2.0]},
      {"index": 0, "embedding": [1.0]}
    ],
    "usage": {"total_tokens": 4}
  })";
  EXPECT_CALL(*transport_, post_json(_, _, _)).WillOnce(Return(HttpResponse{200, body}));

  auto embeddings = make_client()->get_embeddings({"a", "b"});
  ASSERT_EQ(embeddings.size(), 2u);
  EXPECT_EQ(embeddings[0], std::vector<float>{1.0f});
  EXPECT_EQ(embeddings[1], std::vector<float>{2.0f});
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_SplitsIntoBatchesAndKeepsOrder) {
  options_.batch_size = 2;
  std::vector<size_t> batch_sizes;
  EXPECT_CALL(*transport_, post_json(_, _, _))
      .Times(3)
      .WillRepeatedly(Invoke([&](const std::string&, const std::vector<std::string>&,
                                 const std::string& body) {
        batch_sizes.push_back(nlohmann::json::parse(body)["input"].size());
        return ragdesk_tests::MockUtilities::echo_embeddings(body);
      }));

  std::vector<std::string> texts = {"a", "bb", "ccc", "dddd", "eeeee"};
  auto embeddings = make_client()->get_embeddings(texts);

  EXPECT_EQ(batch_sizes, (std::vector<size_t>{2, 2, 1}));
  ASSERT_EQ(embeddings.size(), texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    EXPECT_FLOAT_EQ(embeddings[i][0], static_cast<float>(texts[i].size()));
  }
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_TracksUsagePerRequest) {
  options_.batch_size = 2;
  EXPECT_CALL(*transport_, post_json(_, _, _))
      .Times(2)
      .WillRepeatedly(Invoke([](const std::string&, const std::vector<std::string>&,
                                const std::string& body) {
        return ragdesk_tests::MockUtilities::echo_embeddings(body, 1000);
      }));

  make_client()->get_embeddings({"a", "b", "c"});

  const auto& calls = cost_tracker_->session_calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].usage.model, "text-embedding-3-small");
  EXPECT_EQ(calls[0].usage.input_tokens, 2000);
  EXPECT_EQ(calls[0].usage.item_count, 2u);
  EXPECT_EQ(calls[1].usage.input_tokens, 1000);
  // 3000 tokens at $0.02 per million
  EXPECT_NEAR(cost_tracker_->session_summary().total_cost, 0.00006, 1e-12);
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_UsageOfEarlierBatchesSurvivesLaterFailure) {
  options_.batch_size = 1;
  EXPECT_CALL(*transport_, post_json(_, _, _))
      .WillOnce(Invoke([](const std::string&, const std::vector<std::string>&,
                          const std::string& body) {
        return ragdesk_tests::MockUtilities::echo_embeddings(body);
      }))
      .WillOnce(Return(HttpResponse{503, "upstream down"}));

  EXPECT_THROW(make_client()->get_embeddings({"a", "b"}), ServiceUnavailableError);
  EXPECT_EQ(cost_tracker_->session_calls().size(), 1u);
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_MissingKeyIsAuthenticationError) {
  options_.api_key.clear();
  EXPECT_THROW(make_client()->get_embeddings({"text"}), AuthenticationError);
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_UnauthorizedIsAuthenticationError) {
  EXPECT_CALL(*transport_, post_json(_, _, _))
      .WillOnce(Return(HttpResponse{
          401, ragdesk_tests::MockUtilities::create_error_body("Incorrect API key provided")}));
  try {
    make_client()->get_embeddings({"text"});
    FAIL() << "Expected AuthenticationError";
  } catch (const AuthenticationError& e) {
    EXPECT_THAT(e.what(), HasSubstr("Incorrect API key provided"));
  }
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_RateLimitAndServerErrorsAreUnavailable) {
  for (long status : {408L, 429L, 500L, 502L, 503L}) {
    EXPECT_CALL(*transport_, post_json(_, _, _)).WillOnce(Return(HttpResponse{status, "{}"}));
    EXPECT_THROW(make_client()->get_embeddings({"text"}), ServiceUnavailableError)
        << "status " << status;
  }
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_OtherClientErrorsAreEmbeddingErrors) {
  EXPECT_CALL(*transport_, post_json(_, _, _))
      .WillOnce(Return(HttpResponse{
          400, ragdesk_tests::MockUtilities::create_error_body("input too long")}));
  try {
    make_client()->get_embeddings({"text"});
    FAIL() << "Expected EmbeddingError";
  } catch (const AuthenticationError&) {
    FAIL() << "400 is not an authentication failure";
  } catch (const ServiceUnavailableError&) {
    FAIL() << "400 is not retryable";
  } catch (const EmbeddingError& e) {
    EXPECT_THAT(e.what(), HasSubstr("input too long"));
  }
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_TransportFailureIsUnavailable) {
  EXPECT_CALL(*transport_, post_json(_, _, _))
      .WillOnce(Throw(HttpTransportError("Couldn't connect to server")));
  EXPECT_THROW(make_client()->get_embeddings({"text"}), ServiceUnavailableError);
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_MalformedBodyIsEmbeddingError) {
  EXPECT_CALL(*transport_, post_json(_, _, _))
      .WillOnce(Return(HttpResponse{200, "not json"}))
      .WillOnce(Return(HttpResponse{200, R"({"object":"list"})"}))
      .WillOnce(Return(HttpResponse{
          200, ragdesk_tests::MockUtilities::create_embeddings_response({{1.0f}})}));

  auto client = make_client();
  EXPECT_THROW(client->get_embeddings({"a"}), EmbeddingError);
  EXPECT_THROW(client->get_embeddings({"a"}), EmbeddingError);
  // One embedding for two inputs
  EXPECT_THROW(client->get_embeddings({"a", "b"}), EmbeddingError);
  EXPECT_TRUE(cost_tracker_->session_calls().empty());
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbedding_ReturnsSingleVector) {
  EXPECT_CALL(*transport_, post_json(_, _, _))
      .WillOnce(Return(HttpResponse{
          200, ragdesk_tests::MockUtilities::create_embeddings_response({{0.5f, 0.25f}})}));
  EXPECT_EQ(make_client()->get_embedding("query"), (std::vector<float>{0.5f, 0.25f}));
}

TEST_F(OpenAIEmbeddingClientTest, GetEmbeddings_RecordsEachBatchBeforeTheNextRequest) {
  options_.batch_size = 1;
  auto tracker = std::make_shared<testing::NiceMock<ragdesk_tests::MockCostTracker>>();
  OpenAIEmbeddingClient client(options_, transport_, tracker);

  testing::InSequence sequence;
  EXPECT_CALL(*transport_, post_json(_, _, _))
      .WillOnce(Invoke([](const std::string&, const std::vector<std::string>&,
                          const std::string& body) {
        return ragdesk_tests::MockUtilities::echo_embeddings(body);
      }));
  EXPECT_CALL(*tracker, track_call(_));
  EXPECT_CALL(*transport_, post_json(_, _, _)).WillOnce(Return(HttpResponse{503, "busy"}));

  EXPECT_THROW(client.get_embeddings({"first", "second"}), ServiceUnavailableError);
  EXPECT_EQ(tracker->session_calls().size(), 1u);
}

}  // namespace ragdesk_core
