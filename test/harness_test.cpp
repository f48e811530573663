#include <fstream>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <remex/harness.h>
#include <remex/envelope.h>
#include "process.h"
#include "test_utils.h"

namespace {

HarnessSpec Spec(ResultChannel channel, const std::string& result_file = "") {
  HarnessSpec ret;
  ret.shell = Shell::BASH4;
  ret.channel = channel;
  ret.interpreter = "bash";
  ret.result_file = result_file;
  return ret;
}

ProcessResult RunScript(const std::string& script) {
  ProcessOptions opt;
  opt.command = {"bash", "-c", script};
  opt.wall_time = 10000;
  return RunProcess(opt);
}

} // namespace

TEST(Harness, DescriptorChannel) {
  std::string program = "printf '%s' ok >&\"$REMEX_IPC_FD\"\n";
  Harness harness = RenderHarness(Spec(ResultChannel::DESCRIPTOR), program);
  const std::string& s = harness.script;
  EXPECT_NE(s.find("export REMEX_EXECUTION_MODE=1\n"), std::string::npos);
  EXPECT_NE(s.find("exec {__remex_ipc}>&3"), std::string::npos);
  EXPECT_NE(s.find("export REMEX_IPC_FD="), std::string::npos);
  EXPECT_EQ(s.find("REMEX_RESULT_FILE"), std::string::npos);
  EXPECT_NE(s.find(program), std::string::npos);
  EXPECT_TRUE(harness.result_marker.empty());
}

TEST(Harness, DelimiterAvoidsProgramText) {
  // a program quoting the delimiter prefix must survive the heredoc intact
  std::string program = "echo REMEX_PAYLOAD_\necho 'it''s $HOME `x`'\n";
  Harness harness = RenderHarness(Spec(ResultChannel::DESCRIPTOR), program);
  EXPECT_NE(harness.script.find(program), std::string::npos);
  size_t start = harness.script.find("<<'REMEX_PAYLOAD_");
  ASSERT_NE(start, std::string::npos);
  std::string delim = harness.script.substr(start + 3, harness.script.find('\'', start + 3) - start - 3);
  EXPECT_EQ(delim.size(), std::string("REMEX_PAYLOAD_").size() + 16);
  EXPECT_EQ(program.find(delim), std::string::npos);
}

TEST(Harness, Workdir) {
  HarnessSpec spec = Spec(ResultChannel::DESCRIPTOR);
  spec.workdir = "/tmp/it's here";
  Harness harness = RenderHarness(spec, "true\n");
  EXPECT_NE(harness.script.find("cd '/tmp/it'\\''s here' || exit 70\n"), std::string::npos);
}

TEST(Harness, SharedFileRoundTrip) {
  TempDirectory dir;
  std::string result_file = (dir.Path() / "result.json").string();
  std::string program =
      "echo diagnostics\n"
      "[ \"$REMEX_EXECUTION_MODE\" = 1 ] || exit 9\n"
      "printf '%s' '{\"value\": 7}' > \"$REMEX_RESULT_FILE\"\n";
  Harness harness = RenderHarness(Spec(ResultChannel::SHARED_FILE, result_file), program);
  EXPECT_TRUE(harness.result_marker.empty());
  ProcessResult res = RunScript(harness.script);
  ASSERT_EQ(res.exit_code, 0) << res.err;
  EXPECT_EQ(res.out, "diagnostics\n");
  std::ifstream fin(result_file);
  nlohmann::json doc = nlohmann::json::parse(fin);
  EXPECT_EQ(doc["value"], 7);
}

TEST(Harness, CapturedStdoutRoundTrip) {
  TempDirectory dir;
  std::string result_file = (dir.Path() / "result.json").string();
  std::string program =
      "echo noise\n"
      "echo more noise >&2\n"
      "printf '%s' '[1,2]' > \"$REMEX_RESULT_FILE\"\n"
      "exit 4\n";
  Harness harness = RenderHarness(Spec(ResultChannel::CAPTURED_STDOUT, result_file), program);
  ASSERT_EQ(harness.result_marker.rfind("__REMEX_RESULT_", 0), 0u);
  ProcessResult res = RunScript(harness.script);
  // the entrypoint status is propagated even though the harness prints afterwards
  EXPECT_EQ(res.exit_code, 4);
  std::string line = "\n" + harness.result_marker + "\n";
  size_t pos = res.out.rfind(line);
  ASSERT_NE(pos, std::string::npos) << res.out;
  EXPECT_EQ(res.out.substr(pos + line.size()), "[1,2]");
  EXPECT_NE(res.out.substr(0, pos).find("noise"), std::string::npos);
  EXPECT_NE(res.out.substr(0, pos).find("more noise"), std::string::npos);
}

TEST(Harness, TemporaryProgramRemoved) {
  TempDirectory dir;
  std::string program = "printf '%s' \"$0\" >&\"$REMEX_IPC_FD\"\n";
  ProcessOptions opt;
  opt.command = {"bash", "-c", RenderHarness(Spec(ResultChannel::DESCRIPTOR), program).script};
  opt.envs = {"TMPDIR=" + dir.Path().string()};
  opt.channel = true;
  opt.wall_time = 10000;
  ProcessResult res = RunProcess(opt);
  ASSERT_EQ(res.exit_code, 0) << res.err;
  EXPECT_EQ(res.channel.rfind(dir.Path().string(), 0), 0u);
  EXPECT_FALSE(fs::exists(res.channel));
}

TEST(Harness, TransportCommand) {
  std::string cmd = TransportCommand("#!/usr/bin/env bash\necho 'hi'\n");
  EXPECT_EQ(cmd.rfind("printf '%s' '", 0), 0u);
  EXPECT_NE(cmd.find("| base64 -d > /tmp/remex_harness.sh && bash /tmp/remex_harness.sh"), std::string::npos);
  // base64 never needs shell quoting
  EXPECT_EQ(cmd.find('\'', 13), cmd.find("' | base64"));
}

TEST(Harness, ShellQuote) {
  EXPECT_EQ(ShellQuote("abc"), "'abc'");
  EXPECT_EQ(ShellQuote(""), "''");
  EXPECT_EQ(ShellQuote("a'b"), "'a'\\''b'");
}

TEST(Harness, InRemoteExecution) {
  {
    ScopedEnv env(kExecutionModeEnv, "1");
    EXPECT_TRUE(InRemoteExecution());
  }
  {
    ScopedEnv env(kExecutionModeEnv, "0");
    EXPECT_FALSE(InRemoteExecution());
  }
  {
    ScopedEnv env(kExecutionModeEnv, std::nullopt);
    EXPECT_FALSE(InRemoteExecution());
  }
}

TEST(Envelope, RoundTrip) {
  FailureEnvelope env{"ValueError", "bad \"input\"\nline two"};
  std::string raw = EncodeFailureEnvelope(env);
  auto doc = nlohmann::json::parse(raw);
  EXPECT_EQ(doc[kEnvelopeMarkerKey], true);
  auto parsed = ParseFailureEnvelope(raw);
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->error_type, env.error_type);
  EXPECT_EQ(parsed->error_message, env.error_message);
}

TEST(Envelope, Rejected) {
  EXPECT_FALSE(ParseFailureEnvelope(std::string("not json")));
  EXPECT_FALSE(ParseFailureEnvelope(std::string("[1]")));
  EXPECT_FALSE(ParseFailureEnvelope(std::string(R"({"error_type": "E", "error_message": "m"})")));
  EXPECT_FALSE(ParseFailureEnvelope(std::string(
      R"({"__remote_execution_error__": false, "error_type": "E", "error_message": "m"})")));
  EXPECT_FALSE(ParseFailureEnvelope(std::string(
      R"({"__remote_execution_error__": true, "error_type": "E"})")));
  EXPECT_FALSE(ParseFailureEnvelope(std::string(
      R"({"__remote_execution_error__": true, "error_type": 1, "error_message": "m"})")));
}
