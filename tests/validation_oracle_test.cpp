#include "dumptruck/discovery/validation_oracle.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace dumptruck;

class ValidationOracleTest : public ::testing::Test {
protected:
  ValidationOracleTest() : oracle_{fake_, tool_} {
  }

  ToolConfig tool_;
  test::FakeRunner fake_;
  ValidationOracle oracle_;
};

TEST_F(ValidationOracleTest, HelpDocument_IsSanitized) {
  fake_.respond({"aws", "ec2", "help"}, 0, "  EC2()\n\n\x1b[1mDESCRIPTION\x1b[0m\n");

  auto doc = oracle_.help_document({"ec2"});

  ASSERT_TRUE(doc.has_value());
  ASSERT_EQ(doc->size(), 2);
  EXPECT_EQ((*doc)[0], "EC2()");
  EXPECT_EQ((*doc)[1], "[1mDESCRIPTION[0m");
}

TEST_F(ValidationOracleTest, HelpDocument_IsMemoizedPerPath) {
  fake_.respond({"aws", "ec2", "help"}, 0, "doc");

  (void)oracle_.help_document({"ec2"});
  (void)oracle_.help_document({"ec2"});

  EXPECT_EQ(fake_.call_count({"aws", "ec2", "help"}), 1);
}

TEST_F(ValidationOracleTest, ServiceIsValid_WhenHelpFetchCompletes) {
  fake_.respond({"aws", "ec2", "help"}, 0, "doc");

  EXPECT_TRUE(oracle_.service_is_valid("ec2"));
}

TEST_F(ValidationOracleTest, ServiceIsValid_IgnoresExitStatusOfHelp) {
  // Only the probe completing matters, not what the tool answered
  fake_.respond({"aws", "odd", "help"}, 252, "");

  EXPECT_TRUE(oracle_.service_is_valid("odd"));
}

TEST_F(ValidationOracleTest, ServiceIsInvalid_WhenHelpFetchTimesOut) {
  fake_.fail_with({"aws", "slow", "help"}, Error::Timeout);

  EXPECT_FALSE(oracle_.service_is_valid("slow"));
}

TEST_F(ValidationOracleTest, ServiceValidity_IsMemoized) {
  fake_.fail_with({"aws", "slow", "help"}, Error::Timeout);

  EXPECT_FALSE(oracle_.service_is_valid("slow"));
  EXPECT_FALSE(oracle_.service_is_valid("slow"));
  EXPECT_EQ(fake_.call_count({"aws", "slow", "help"}), 1);
}

TEST_F(ValidationOracleTest, EmptyServiceName_IsInvalidWithoutProbe) {
  EXPECT_FALSE(oracle_.service_is_valid(""));
  EXPECT_TRUE(fake_.calls().empty());
}

TEST_F(ValidationOracleTest, CommandIsValid_ProbesSubcommandHelp) {
  fake_.respond({"aws", "ec2", "describe-regions", "help"}, 0, "doc");

  EXPECT_TRUE(oracle_.command_is_valid("ec2", "describe-regions"));
  EXPECT_EQ(fake_.call_count({"aws", "ec2", "describe-regions", "help"}), 1);
}

TEST_F(ValidationOracleTest, CommandIsInvalid_WhenSubcommandHelpFails) {
  fake_.fail_with({"aws", "ec2", "list-x", "help"}, Error::SpawnFailed);

  EXPECT_FALSE(oracle_.command_is_valid("ec2", "list-x"));
}

TEST_F(ValidationOracleTest, OperationIsRunnable_OnlyOnZeroExit) {
  fake_.respond({"aws", "ec2", "describe-regions"}, 0, "{}");
  fake_.respond({"aws", "ec2", "describe-hosts"}, 254, "");
  fake_.fail_with({"aws", "ec2", "describe-images"}, Error::Timeout);

  EXPECT_TRUE(oracle_.operation_is_runnable({"ec2", "describe-regions"}));
  EXPECT_FALSE(oracle_.operation_is_runnable({"ec2", "describe-hosts"}));
  EXPECT_FALSE(oracle_.operation_is_runnable({"ec2", "describe-images"}));
}

TEST_F(ValidationOracleTest, OperationIsRunnable_IgnoresOutputContent) {
  fake_.respond({"aws", "s3", "list-buckets"}, 0, "");

  EXPECT_TRUE(oracle_.operation_is_runnable({"s3", "list-buckets"}));
}

TEST(ValidationOracleToolTest, UsesConfiguredToolCommand) {
  ToolConfig tool;
  tool.command = "/opt/bin/fakecli";
  test::FakeRunner fake;
  fake.respond({"/opt/bin/fakecli", "alpha", "help"}, 0, "doc");
  ValidationOracle oracle{fake, tool};

  EXPECT_TRUE(oracle.service_is_valid("alpha"));
  ASSERT_EQ(fake.calls().size(), 1);
  EXPECT_EQ(fake.calls()[0].front(), "/opt/bin/fakecli");
}
