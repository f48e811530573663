#include <chrono>
#include <thread>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <remex/envelope.h>
#include "local_backend.h"
#include "test_utils.h"

namespace {

using Clock = std::chrono::steady_clock;

class LocalBackendTest : public ::testing::Test {
 protected:
  LocalProcessBackend backend;
  LocalProcessConfig conf = BashConfig();

  ExecutionOutcome Run(const std::string& program, long deadline_ms = 10000) {
    Payload payload;
    payload.program = program;
    payload.harness = RenderHarness(backend.GetHarnessSpec(conf), program);
    return backend.Execute(conf, payload, deadline_ms);
  }
};

} // namespace

TEST_F(LocalBackendTest, Success) {
  auto outcome = Run(
      "echo 'user logging on stdout'\n"
      "printf '%s' '{\"value\": 42}' >&\"$REMEX_IPC_FD\"\n");
  ASSERT_TRUE(outcome.ok) << outcome.message;
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_EQ(nlohmann::json::parse(outcome.data)["value"], 42);
}

TEST_F(LocalBackendTest, HarnessSpec) {
  conf.project_root = "/srv/project";
  HarnessSpec spec = backend.GetHarnessSpec(conf);
  EXPECT_EQ(spec.channel, ResultChannel::DESCRIPTOR);
  EXPECT_EQ(spec.shell, Shell::BASH4);
  EXPECT_EQ(spec.interpreter, "bash");
  EXPECT_EQ(spec.workdir, "/srv/project");
}

TEST_F(LocalBackendTest, ChannelSurvivesDescriptor3Close) {
  // the entrypoint only ever sees the duplicated descriptor
  auto outcome = Run(
      "exec 3>&- 2>/dev/null\n"
      "printf '%s' '\"fine\"' >&\"$REMEX_IPC_FD\"\n");
  ASSERT_TRUE(outcome.ok) << outcome.message;
  EXPECT_EQ(outcome.data, "\"fine\"");
}

TEST_F(LocalBackendTest, WorkingDirectory) {
  TempDirectory dir;
  conf.project_root = dir.Path().string();
  auto outcome = Run("printf '\"%s\"' \"$PWD\" >&\"$REMEX_IPC_FD\"\n");
  ASSERT_TRUE(outcome.ok) << outcome.message;
  EXPECT_EQ(nlohmann::json::parse(outcome.data), dir.Path().string());
}

TEST_F(LocalBackendTest, Timeout) {
  TempDirectory dir;
  std::string late = (dir.Path() / "late").string();
  auto start = Clock::now();
  auto outcome = Run("echo started\nsleep 1\ntouch '" + late + "'\nsleep 1\n", 100);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
  ASSERT_FALSE(outcome.ok);
  EXPECT_EQ(outcome.kind, FailureKind::TIMEOUT);
  EXPECT_NE(outcome.message.find("100ms"), std::string::npos);
  EXPECT_LT(elapsed, 200);
  // nothing of the invocation survives the deadline
  std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  EXPECT_FALSE(fs::exists(late));
}

TEST_F(LocalBackendTest, NonZeroExit) {
  auto outcome = Run("echo 'something broke' >&2\nexit 1\n");
  ASSERT_FALSE(outcome.ok);
  EXPECT_EQ(outcome.kind, FailureKind::NON_ZERO_EXIT);
  EXPECT_EQ(outcome.exit_code, 1);
  EXPECT_NE(outcome.message.find("something broke"), std::string::npos);
  EXPECT_TRUE(outcome.data.empty());
}

TEST_F(LocalBackendTest, FailureEnvelopeKept) {
  std::string envelope = EncodeFailureEnvelope({"KeyError", "missing"});
  auto outcome = Run("printf '%s' '" + envelope + "' >&\"$REMEX_IPC_FD\"\nexit 1\n");
  ASSERT_FALSE(outcome.ok);
  EXPECT_EQ(outcome.kind, FailureKind::NON_ZERO_EXIT);
  auto parsed = ParseFailureEnvelope(outcome.data);
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->error_type, "KeyError");
}

TEST_F(LocalBackendTest, CleanExitWithoutResult) {
  auto start = Clock::now();
  auto outcome = Run("exit 0\n", 5000);
  ASSERT_FALSE(outcome.ok);
  EXPECT_EQ(outcome.kind, FailureKind::CHANNEL_ERROR);
  EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count(), 2000);
}

TEST_F(LocalBackendTest, PreCheck) {
  EXPECT_NO_THROW(backend.PreCheck(conf));
  conf.interpreter = "remex-no-such-interpreter --flag";
  EXPECT_THROW(backend.PreCheck(conf), EnvironmentUnavailable);
  conf = BashConfig();
  conf.project_root = "/nonexistent/remex/project";
  EXPECT_THROW(backend.PreCheck(conf), ConfigurationError);
}

TEST(BashVersion, Parse) {
  auto v5 = ParseBashVersion("GNU bash, version 5.2.15(1)-release (x86_64-pc-linux-gnu)\n");
  ASSERT_TRUE(v5);
  EXPECT_EQ(v5->first, 5);
  EXPECT_EQ(v5->second, 2);
  auto v3 = ParseBashVersion("GNU bash, version 3.2.57(1)-release (arm64-apple-darwin23)");
  ASSERT_TRUE(v3);
  EXPECT_EQ(v3->first, 3);
  EXPECT_FALSE(ParseBashVersion("zsh 5.9 (x86_64-debian-linux-gnu)"));
  EXPECT_FALSE(ParseBashVersion("GNU bash, version 99999999999999999999.1"));
}
