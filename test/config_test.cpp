#include <sstream>

#include <gtest/gtest.h>
#include <remex/config.h>
#include <remex/errors.h>

namespace {

ExecutionConfig Load(const std::string& ini) {
  std::istringstream in(ini);
  return LoadExecutionConfig(in);
}

} // namespace

TEST(Config, LocalProcess) {
  auto config = Load("[backend]\nkind = local-process\nshell = bash\ninterpreter = python3 -u\n");
  ASSERT_EQ(KindOf(config), BackendKind::LOCAL_PROCESS);
  auto& conf = std::get<LocalProcessConfig>(config);
  EXPECT_EQ(conf.shell, Shell::BASH4);
  EXPECT_EQ(conf.interpreter, "python3 -u");
  EXPECT_EQ(conf.project_root, "");
}

TEST(Config, TemplateDefaults) {
  auto config = Load("[backend]\nkind = template-sandbox\n");
  ASSERT_EQ(KindOf(config), BackendKind::TEMPLATE_SANDBOX);
  EXPECT_TRUE(std::get<TemplateSandboxConfig>(config) == TemplateSandboxConfig());
}

TEST(Config, SnapshotSizing) {
  auto config = Load(
      "[backend]\n"
      "kind = snapshot-sandbox\n"
      "snapshot_name = worker\n"
      "snapshot_version = 2.0\n"
      "cpu_count = 4\n"
      "memory_gb = 8\n"
      "disk_gb = 10\n"
      "dockerfile = docker/Dockerfile\n");
  ASSERT_EQ(KindOf(config), BackendKind::SNAPSHOT_SANDBOX);
  auto& conf = std::get<SnapshotSandboxConfig>(config);
  EXPECT_EQ(conf.snapshot_name, "worker");
  EXPECT_EQ(conf.snapshot_version, "2.0");
  EXPECT_EQ(conf.cpu_count, 4);
  EXPECT_EQ(conf.memory_gb, 8);
  EXPECT_EQ(conf.disk_gb, 10);
  EXPECT_EQ(conf.dockerfile_path, "docker/Dockerfile");
  EXPECT_EQ(conf.interpreter, "/app/.venv/bin/python");
}

TEST(Config, Rejected) {
  EXPECT_THROW(Load("[backend]\n"), ConfigurationError);
  EXPECT_THROW(Load("[backend]\nkind = kubernetes\n"), ConfigurationError);
  EXPECT_THROW(Load("[backend]\nkind = local-process\nshell = fish\n"), ConfigurationError);
  EXPECT_THROW(Load("[backend]\nkind = template-sandbox\ncpu_count = 0\n"), ConfigurationError);
  EXPECT_THROW(LoadExecutionConfig(fs::path("/nonexistent/remex.ini")), ConfigurationError);
}

TEST(Config, StructuralEquality) {
  TemplateSandboxConfig a, b;
  EXPECT_TRUE(a == b);
  b.cpu_count = 4;
  EXPECT_FALSE(a == b);
  b.cpu_count = a.cpu_count;
  b.api_key = "key";
  EXPECT_TRUE(a != b);

  ExecutionConfig x = LocalProcessConfig(), y = LocalProcessConfig(), z = SnapshotSandboxConfig();
  EXPECT_TRUE(x == y);
  EXPECT_FALSE(x == z);
}

TEST(Config, Names) {
  EXPECT_STREQ(BackendKindName(BackendKind::LOCAL_PROCESS), "local-process");
  EXPECT_STREQ(BackendKindName(BackendKind::SNAPSHOT_SANDBOX), "snapshot-sandbox");
  EXPECT_STREQ(ShellExecutable(Shell::BASH4), "bash");
  EXPECT_STREQ(ShellExecutable(Shell::ZSH), "zsh");
}
