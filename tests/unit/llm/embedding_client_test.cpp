#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../common/mocks_test.hpp"

namespace ragdesk_core {

using ::testing::ElementsAre;
using ::testing::Return;

TEST(EmbeddingClientTest, GetEmbedding_WrapsSingleTextInBatch) {
  ragdesk_tests::MockEmbeddingClient client;
  EXPECT_CALL(client, get_embeddings(ElementsAre("only text")))
      .WillOnce(Return(std::vector<std::vector<float>>{{1.0f, 2.0f}}));
  EXPECT_EQ(client.get_embedding("only text"), (std::vector<float>{1.0f, 2.0f}));
}

TEST(EmbeddingClientTest, GetEmbedding_WrongCountIsEmbeddingError) {
  ragdesk_tests::MockEmbeddingClient client;
  EXPECT_CALL(client, get_embeddings(testing::_))
      .WillOnce(Return(std::vector<std::vector<float>>{}));
  EXPECT_THROW(client.get_embedding("text"), EmbeddingError);
}

TEST(EmbeddingClientTest, ErrorHierarchy_DistinguishesAuthFromUnavailable) {
  try {
    throw AuthenticationError("bad key");
  } catch (const ServiceUnavailableError&) {
    FAIL() << "authentication errors are not retryable";
  } catch (const EmbeddingError& e) {
    EXPECT_STREQ(e.what(), "bad key");
  }
}

}  // namespace ragdesk_core
