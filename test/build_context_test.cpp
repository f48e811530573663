#include <cstdlib>
#include <fstream>

#include <gtest/gtest.h>
#include <remex/errors.h>
#include "build_context.h"
#include "utils.h"
#include "test_utils.h"

TEST(BuildContext, Sha256) {
  EXPECT_EQ(Sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(Sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(BuildContext, IgnoreRules) {
  IgnoreRules rules("# comment\n\n.git\n/logs/\n*.pyc\n!keep.pyc\n./secret.txt\n");
  EXPECT_TRUE(rules.Excluded(".git"));
  EXPECT_TRUE(rules.Excluded(".git/HEAD"));
  EXPECT_TRUE(rules.Excluded("logs/today.log"));
  EXPECT_TRUE(rules.Excluded("cache.pyc"));
  EXPECT_TRUE(rules.Excluded("secret.txt"));
  // patterns are anchored at the root and * does not cross directories
  EXPECT_FALSE(rules.Excluded("pkg/cache.pyc"));
  EXPECT_FALSE(rules.Excluded("keep.pyc"));
  EXPECT_FALSE(rules.Excluded("src/logs"));
  EXPECT_FALSE(rules.Excluded("main.py"));
  EXPECT_FALSE(IgnoreRules().Excluded("anything"));
}

TEST(BuildContext, Deterministic) {
  TempDirectory a, b;
  for (auto* dir : {&a, &b}) {
    dir->WriteFile("Dockerfile", "FROM alpine\nCOPY . .\n");
    dir->WriteFile("src/app/main.py", "print(1)\n");
  }
  // different creation order and mtimes
  b.WriteFile("src/app/__init__.py", "");
  a.WriteFile("src/app/__init__.py", "");
  BuildContext x = PackBuildContext(a.Path()), y = PackBuildContext(b.Path());
  EXPECT_EQ(x.sha256, y.sha256);
  EXPECT_EQ(x.entries, 5u); // Dockerfile, src/, src/app/, two files
  EXPECT_EQ(x.archive.size() % 512, 0u);

  b.WriteFile("src/app/main.py", "print(2)\n");
  EXPECT_NE(PackBuildContext(b.Path()).sha256, x.sha256);
}

TEST(BuildContext, DockerignoreApplied) {
  TempDirectory dir;
  dir.WriteFile("Dockerfile", "FROM alpine\n");
  dir.WriteFile(".dockerignore", "secrets\n");
  dir.WriteFile("secrets/token", "hunter2");
  dir.WriteFile("app.py", "pass\n");
  BuildContext ctx = PackBuildContext(dir.Path());
  EXPECT_EQ(ctx.archive.find("hunter2"), std::string::npos);
  EXPECT_EQ(ctx.archive.find("secrets/"), std::string::npos);
  EXPECT_NE(ctx.archive.find("app.py"), std::string::npos);
}

TEST(BuildContext, NotADirectory) {
  TempDirectory dir;
  EXPECT_THROW(PackBuildContext(dir.Path() / "missing"), ConfigurationError);
}

TEST(BuildContext, ExtractsWithTar) {
  if (system("command -v tar >/dev/null 2>&1") != 0) GTEST_SKIP() << "tar not available";
  TempDirectory src, out;
  std::string long_dir(120, 'd');
  src.WriteFile("Dockerfile", "FROM alpine\n");
  src.WriteFile(long_dir + "/nested/module.py", "VALUE = 42\n");
  src.WriteFile("bin/run.sh", "#!/bin/sh\necho run\n");
  fs::permissions(src.Path() / "bin" / "run.sh", fs::perms::owner_exec, fs::perm_options::add);
  fs::create_symlink("bin/run.sh", src.Path() / "run");

  BuildContext ctx = PackBuildContext(src.Path());
  fs::path archive = out.Path() / "context.tar";
  {
    std::ofstream fout(archive, std::ios::binary);
    fout << ctx.archive;
  }
  fs::create_directories(out.Path() / "x");
  std::string cmd = "tar -xf '" + archive.string() + "' -C '" + (out.Path() / "x").string() + "'";
  ASSERT_EQ(system(cmd.c_str()), 0);

  fs::path x = out.Path() / "x";
  EXPECT_EQ(ReadFileToString(x / "Dockerfile"), std::optional<std::string>("FROM alpine\n"));
  EXPECT_EQ(ReadFileToString(x / long_dir / "nested" / "module.py"),
            std::optional<std::string>("VALUE = 42\n"));
  EXPECT_TRUE((fs::status(x / "bin" / "run.sh").permissions() & fs::perms::owner_exec) != fs::perms::none);
  EXPECT_TRUE(fs::is_symlink(x / "run"));
  EXPECT_EQ(fs::read_symlink(x / "run").string(), "bin/run.sh");
}
