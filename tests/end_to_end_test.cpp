#include "dumptruck/app/application.hpp"
#include "dumptruck/cli/commands.hpp"

#include "test_utils.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "gtest/gtest.h"

using namespace dumptruck;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

constexpr const char* kRootHelp =
    "AWS()\n\nNAME\n       aws -\n\nAVAILABLE SSEERRVVIICCEESS\n"
    "       +o alpha\n\nSEE ALSO\n";

constexpr const char* kAlphaHelp =
    "ALPHA()\n\nAVAILABLE CCOOMMMMAANNDDSS\n"
    "       +o delete-items\n       +o list-items\n\nSEE ALSO\n";

// Stands in for the real CLI: one service, one dump command, and a second
// service whose help never finishes.
constexpr const char* kFakeToolScript = R"(#!/bin/sh
case "$*" in
  "help")
    printf 'AWS()\n\nAVAILABLE SSEERRVVIICCEESS\n       +o alpha\n       +o beta\n\nSEE ALSO\n' ;;
  "alpha help")
    printf 'AVAILABLE CCOOMMMMAANNDDSS\n       +o delete-items\n       +o list-items\n\nEND\n' ;;
  "alpha list-items help") echo doc ;;
  "alpha list-items") echo '[]' ;;
  "alpha list-items --output json") printf '[]' ;;
  "alpha list-items --output text") exit 255 ;;
  "beta help") sleep 5 ;;
  *) exit 2 ;;
esac
)";

auto scripted_alpha() -> std::unique_ptr<test::FakeRunner> {
  auto fake = std::make_unique<test::FakeRunner>();
  fake->respond({"aws", "help"}, 0, kRootHelp);
  fake->respond({"aws", "alpha", "help"}, 0, kAlphaHelp);
  fake->respond({"aws", "alpha", "list-items", "help"}, 0, "doc");
  fake->respond({"aws", "alpha", "list-items"}, 0, "[]");
  fake->respond({"aws", "alpha", "list-items", "--output", "json"}, 0, "[]");
  return fake;
}

}  // namespace

class EndToEndTest : public ::testing::Test {
protected:
  auto config_for_json() const -> DumpConfig {
    DumpConfig config;
    config.output.directory = tmp_.path().string();
    config.output.formats = {{"json", "json"}};
    return config;
  }

  test::TempDir tmp_;
};

TEST_F(EndToEndTest, Dump_WritesOnlyTheValidatedArtifact) {
  Application app(config_for_json(), scripted_alpha());

  auto result = app.dump();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(test::list_files(tmp_.path()),
            (std::vector<std::string>{"json/alpha/list-items.json"}));
  EXPECT_EQ(test::read_file(tmp_.path() / "json/alpha/list-items.json"), "[]");
}

TEST_F(EndToEndTest, Dump_DefaultFormats_OnlySucceedingFormatIsWritten) {
  // text and table are not scripted, so those captures exit non-zero
  DumpConfig config;
  config.output.directory = tmp_.path().string();
  ASSERT_EQ(config.output.formats, default_output_formats());
  Application app(std::move(config), scripted_alpha());

  auto result = app.dump();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(test::list_files(tmp_.path()),
            (std::vector<std::string>{"json/alpha/list-items.json"}));
  EXPECT_EQ(test::read_file(tmp_.path() / "json/alpha/list-items.json"), "[]");
  EXPECT_FALSE(fs::exists(tmp_.path() / "text"));
  EXPECT_FALSE(fs::exists(tmp_.path() / "table"));
}

TEST_F(EndToEndTest, Dump_RepeatedHelpProbesAreMemoized) {
  auto fake = scripted_alpha();
  auto* probe = fake.get();
  Application app(config_for_json(), std::move(fake));

  ASSERT_TRUE(app.dump().has_value());
  ASSERT_TRUE(app.dump().has_value());

  EXPECT_EQ(probe->call_count({"aws", "help"}), 1);
  EXPECT_EQ(probe->call_count({"aws", "alpha", "help"}), 1);
  EXPECT_EQ(probe->call_count({"aws", "alpha", "list-items", "help"}), 1);
}

TEST_F(EndToEndTest, Dump_RootHelpFailure_FailsRun) {
  auto fake = std::make_unique<test::FakeRunner>();
  fake->fail_with({"aws", "help"}, Error::SpawnFailed);
  Application app(config_for_json(), std::move(fake));

  auto result = app.dump();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::SpawnFailed);
  EXPECT_TRUE(test::list_files(tmp_.path()).empty());
}

TEST_F(EndToEndTest, Dump_OutputPathBlocked_StopsWithError) {
  std::ofstream(tmp_.path() / "json") << "file where a directory belongs";
  Application app(config_for_json(), scripted_alpha());

  auto result = app.dump();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::NotADirectory);
}

TEST_F(EndToEndTest, List_VisitsWithoutWriting) {
  Application app(config_for_json(), scripted_alpha());

  std::vector<DumpCommand> listed;
  auto result = app.list([&](const DumpCommand& cmd) {
    listed.push_back(cmd);
    return Visit::Continue;
  });

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(listed, (std::vector<DumpCommand>{{"alpha", "list-items"}}));
  EXPECT_TRUE(test::list_files(tmp_.path()).empty());
}

TEST_F(EndToEndTest, RealSubprocess_AgainstScriptedTool) {
  auto tool = tmp_.path() / "fakecli";
  std::ofstream(tool) << kFakeToolScript;
  fs::permissions(tool, fs::perms::owner_all);

  DumpConfig config;
  config.tool.command = tool.string();
  config.tool.timeout = 1s;
  config.output.directory = (tmp_.path() / "out").string();
  config.output.formats = {{"text", "log"}, {"json", "json"}};
  Application app(std::move(config));

  auto result = app.dump();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(test::list_files(tmp_.path() / "out"),
            (std::vector<std::string>{"json/alpha/list-items.json"}));
  EXPECT_EQ(test::read_file(tmp_.path() / "out/json/alpha/list-items.json"),
            "[]");
}

TEST(ResolveConfigTest, NoFile_UsesDefaults) {
  auto config = cli::resolve_config(cli::ConfigOptions{});

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->tool.command, "aws");
  EXPECT_EQ(config->output.directory, "./dumptruck");
}

TEST(ResolveConfigTest, FlagsOverrideFile) {
  test::TempDir tmp;
  auto path = tmp.path() / "dumptruck.yaml";
  std::ofstream(path) << "tool:\n  command: fromfile\n  timeout_sec: 10\n"
                         "output:\n  directory: file-out\n";

  cli::ConfigOptions opts;
  opts.config_file = path.string();
  opts.output_dir = "flag-out";
  opts.timeout_sec = 20;
  opts.log_level = "debug";

  auto config = cli::resolve_config(opts);

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->tool.command, "fromfile");
  EXPECT_EQ(config->tool.timeout, 20s);
  EXPECT_EQ(config->output.directory, "flag-out");
  EXPECT_EQ(config->logging.level, "debug");
}

TEST(ResolveConfigTest, InvalidOverride_IsRejected) {
  cli::ConfigOptions opts;
  opts.timeout_sec = 0;

  auto config = cli::resolve_config(opts);

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::InvalidArgument);
}

TEST(ResolveConfigTest, HugeTimeout_IsRejected) {
  cli::ConfigOptions opts;
  opts.timeout_sec = 10'000'000'000'000'000;

  auto config = cli::resolve_config(opts);

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::InvalidArgument);
}

TEST(ResolveConfigTest, MissingConfigFile_IsError) {
  cli::ConfigOptions opts;
  opts.config_file = "/nonexistent/dumptruck.yaml";

  auto config = cli::resolve_config(opts);

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::FileNotFound);
}
