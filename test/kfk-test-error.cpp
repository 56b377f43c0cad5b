/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-test-error.cpp
 * @brief The unit test for the kfk error categories and the closed-error
 *        classification.
 */

#include <gtest/gtest.h>

#include <string>
#include <system_error>

#include "rdkafka.h"

#include "kafka/kfk-kafka-util.hpp"
#include "kfk-error.hpp"

TEST(Kfk_Errc, CategoryAndMessages) {
  std::error_code ec = kfk::Kfk_Errc::kClientClosed;

  EXPECT_EQ(std::string{"kfk"}, ec.category().name());
  EXPECT_EQ("client is closed", ec.message());
  EXPECT_EQ("config is nil",
            make_error_code(kfk::Kfk_Errc::kNilConfig).message());
  EXPECT_EQ("transactional ID required for transactions",
            make_error_code(kfk::Kfk_Errc::kNoTransactionalId).message());
  EXPECT_EQ("AWS region is required for MSK IAM authentication",
            make_error_code(kfk::Kfk_Errc::kMissingAwsRegion).message());
  EXPECT_FALSE(make_error_code(kfk::Kfk_Errc::kOk));
}

TEST(Kfk_Errc, ContextConditions) {
  std::error_code canceled = kfk::Kfk_Errc::kContextCanceled;
  std::error_code exceeded = kfk::Kfk_Errc::kDeadlineExceeded;

  EXPECT_TRUE(canceled == std::errc::operation_canceled);
  EXPECT_TRUE(exceeded == std::errc::timed_out);
  EXPECT_FALSE(canceled == exceeded);
}

TEST(Kfk_Errc, RdkafkaCategory) {
  auto ec = kfk::toErrorCode(RD_KAFKA_RESP_ERR_TOPIC_ALREADY_EXISTS);

  EXPECT_TRUE(ec);
  EXPECT_EQ(std::string{"rdkafka"}, ec.category().name());
  EXPECT_EQ(RD_KAFKA_RESP_ERR_TOPIC_ALREADY_EXISTS, ec.value());
  EXPECT_EQ(std::string{rd_kafka_err2str(RD_KAFKA_RESP_ERR_TOPIC_ALREADY_EXISTS)},
            ec.message());

  EXPECT_FALSE(kfk::toErrorCode(RD_KAFKA_RESP_ERR_NO_ERROR));
  EXPECT_FALSE(kfk::toErrorCode(static_cast<const rd_kafka_error_t *>(nullptr)));
}

TEST(Kfk_Errc, ClosedErrorClassification) {
  EXPECT_FALSE(kfk::isClosedError(std::error_code{}));
  EXPECT_FALSE(kfk::isClosedError(std::error_code{}, "client closed"));

  EXPECT_TRUE(kfk::isClosedError(kfk::Kfk_Errc::kEndOfStream));
  EXPECT_TRUE(kfk::isClosedError(kfk::Kfk_Errc::kContextCanceled));
  EXPECT_TRUE(kfk::isClosedError(kfk::Kfk_Errc::kClientClosed));
  EXPECT_TRUE(kfk::isClosedError(std::make_error_code(std::errc::broken_pipe)));
  EXPECT_TRUE(
      kfk::isClosedError(std::make_error_code(std::errc::connection_aborted)));
  EXPECT_TRUE(kfk::isClosedError(kfk::toErrorCode(RD_KAFKA_RESP_ERR__DESTROY)));

  auto transport = kfk::toErrorCode(RD_KAFKA_RESP_ERR__TRANSPORT);
  EXPECT_FALSE(kfk::isClosedError(transport));
  EXPECT_TRUE(kfk::isClosedError(transport, "read: connection reset by peer"));
  EXPECT_TRUE(
      kfk::isClosedError(transport, "use of closed network connection"));

  EXPECT_FALSE(kfk::isClosedError(kfk::Kfk_Errc::kDeadlineExceeded));
  EXPECT_FALSE(kfk::isClosedError(kfk::Kfk_Errc::kMarshal));
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
