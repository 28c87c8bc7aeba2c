#include "ferry/transfer/command_connector.hpp"

#include "test_utils.hpp"

#include <filesystem>
#include <memory>

#include "gtest/gtest.h"

using namespace ferry;

namespace {

// Templates that act on a local directory, so the connector can be
// exercised without ssh.
auto local_config(const std::filesystem::path& remote) -> ConnectorConfig {
  auto root = remote.string();
  ConnectorConfig config;
  config.type = ConnectorType::Command;
  config.host = "files.example.com";
  config.port = 2222;
  config.username = "deploy";
  config.command_timeout_sec = 5;
  config.commands.connect = "test -d '" + root + "'";
  config.commands.mkdir = "mkdir -p '" + root + "'/{remote}";
  config.commands.upload = "cp {local} '" + root + "'/{remote}";
  config.commands.download = "cp '" + root + "'/{remote} {local}";
  config.commands.remove = "rm '" + root + "'/{remote}";
  config.commands.list = "cd '" + root + "'/{remote} && ls -p";
  return config;
}

}  // namespace

TEST(ShellQuoteTest, WrapsAndEscapes) {
  EXPECT_EQ(shell_quote("plain"), "'plain'");
  EXPECT_EQ(shell_quote(""), "''");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
  EXPECT_EQ(shell_quote("$(rm -rf /)"), "'$(rm -rf /)'");
}

TEST(CommandConnectorRenderTest, ExpandsPlaceholders) {
  ConnectorConfig config;
  config.host = "h";
  config.port = 2200;
  config.username = "u";
  config.private_key_path = "/keys/id";
  CommandConnector connector{config};

  EXPECT_EQ(connector.render("scp {identity} -P {port} {local} {user}@{host}:{remote}",
                             "/a b", "/r"),
            "scp -i '/keys/id' -P 2200 '/a b' 'u'@'h':'/r'");
  EXPECT_EQ(connector.render("echo {unknown} {", "", ""), "echo {unknown} {");
}

TEST(CommandConnectorRenderTest, RemoteShellIsQuotedTwice) {
  ConnectorConfig config;
  CommandConnector connector{config};
  EXPECT_EQ(connector.render("rm -- {remote_shell}", "", "/d/my file.txt"),
            "rm -- ''\\''/d/my file.txt'\\'''");
}

TEST(CommandConnectorRenderTest, IdentityOmittedWithoutKey) {
  ConnectorConfig config;
  CommandConnector connector{config};
  EXPECT_EQ(connector.render("ssh {identity}host", "", ""), "ssh host");
}

class CommandConnectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::filesystem::create_directories(remote_);
    ASSERT_TRUE(connector_.connect().has_value());
  }

  test::TempDir dir_;
  std::filesystem::path remote_{dir_.path() / "remote"};
  CommandConnector connector_{local_config(remote_)};
};

TEST_F(CommandConnectorTest, UploadRunsTemplate) {
  test::write_file(dir_.path() / "a.txt", "hello");
  std::vector<std::pair<std::int64_t, std::int64_t>> progress;

  auto r = connector_.upload(dir_.file("a.txt"), "a.txt",
                             [&](std::int64_t done, std::int64_t total) {
                               progress.emplace_back(done, total);
                             });
  ASSERT_TRUE(r.has_value()) << r.error();
  EXPECT_EQ(test::read_file(remote_ / "a.txt"), "hello");

  ASSERT_EQ(progress.size(), 2u);
  EXPECT_EQ(progress[0], std::make_pair(std::int64_t{0}, std::int64_t{5}));
  EXPECT_EQ(progress[1], std::make_pair(std::int64_t{5}, std::int64_t{5}));
}

TEST_F(CommandConnectorTest, UploadOfMissingFileFailsBeforeRunning) {
  auto r = connector_.upload(dir_.file("nope"), "nope", {});
  ASSERT_FALSE(r.has_value());
  EXPECT_FALSE(std::filesystem::exists(remote_ / "nope"));
}

TEST_F(CommandConnectorTest, DownloadCreatesLocalParent) {
  test::write_file(remote_ / "data.csv", "1,2,3");
  auto r = connector_.download("data.csv", dir_.file("in/deep/data.csv"), {});
  ASSERT_TRUE(r.has_value()) << r.error();
  EXPECT_EQ(test::read_file(dir_.path() / "in/deep/data.csv"), "1,2,3");
}

TEST_F(CommandConnectorTest, UploadCreatesRemoteParent) {
  test::write_file(dir_.path() / "a.txt", "nested");
  auto r = connector_.upload(dir_.file("a.txt"), "x/y/a.txt", {});
  ASSERT_TRUE(r.has_value()) << r.error();
  EXPECT_EQ(test::read_file(remote_ / "x/y/a.txt"), "nested");
}

TEST_F(CommandConnectorTest, FailedDownloadKeepsExistingLocalFile) {
  test::write_file(dir_.path() / "keep.txt", "previous");
  auto r = connector_.download("absent.txt", dir_.file("keep.txt"), {});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(test::read_file(dir_.path() / "keep.txt"), "previous");
  EXPECT_FALSE(std::filesystem::exists(dir_.path() / "keep.txt.part"));
}

TEST_F(CommandConnectorTest, FailureCarriesExitCodeAndLastLine) {
  auto r = connector_.remove("missing.txt");
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().starts_with("delete failed (exit 1): "))
      << r.error();
  EXPECT_NE(r.error().find("missing.txt"), std::string::npos);
}

TEST_F(CommandConnectorTest, RemoveDeletesRemoteFile) {
  test::write_file(remote_ / "old.log", "x");
  ASSERT_TRUE(connector_.remove("old.log").has_value());
  EXPECT_FALSE(std::filesystem::exists(remote_ / "old.log"));
}

TEST_F(CommandConnectorTest, ListParsesDirectorySuffix) {
  test::write_file(remote_ / "file.txt", "x");
  std::filesystem::create_directories(remote_ / "sub");

  auto entries = connector_.list(".");
  ASSERT_TRUE(entries.has_value()) << entries.error();
  ASSERT_EQ(entries->size(), 2u);
  EXPECT_EQ((*entries)[0].name, "file.txt");
  EXPECT_FALSE((*entries)[0].is_dir);
  EXPECT_EQ((*entries)[1].name, "sub");
  EXPECT_TRUE((*entries)[1].is_dir);
}

// Stands in for ssh: drops the options and destination, then hands the
// remaining words to a shell the way sshd does.
class DefaultTemplatesTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto script = dir_.path() / "fake-ssh";
    test::write_file(script,
                     "#!/bin/sh\n"
                     "while [ $# -gt 0 ]; do\n"
                     "  case \"$1\" in\n"
                     "    *@*) shift; break ;;\n"
                     "    -p|-i|-o) shift 2 ;;\n"
                     "    *) shift ;;\n"
                     "  esac\n"
                     "done\n"
                     "exec /bin/sh -c \"$*\"\n");
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    ConnectorConfig config;
    config.host = "files.example.com";
    config.username = "deploy";
    config.command_timeout_sec = 5;
    auto& t = config.commands;
    for (auto* tmpl : {&t.connect, &t.mkdir, &t.upload, &t.download,
                       &t.remove, &t.list}) {
      ASSERT_TRUE(tmpl->starts_with("ssh "));
      *tmpl = shell_quote(script.string()) + tmpl->substr(3);
    }
    connector_ = std::make_unique<CommandConnector>(config);
    std::filesystem::create_directories(remote_);
    auto r = connector_->connect();
    ASSERT_TRUE(r.has_value()) << r.error();
  }

  auto remote(const std::string& name) const -> std::string {
    return (remote_ / name).string();
  }

  test::TempDir dir_;
  std::filesystem::path remote_{dir_.path() / "remote side"};
  std::unique_ptr<CommandConnector> connector_;
};

TEST_F(DefaultTemplatesTest, DeleteTargetsPathWithSpaceOnly) {
  test::write_file(remote_ / "my file.txt", "target");
  test::write_file(remote_ / "my", "bystander");

  auto r = connector_->remove(remote("my file.txt"));
  ASSERT_TRUE(r.has_value()) << r.error();
  EXPECT_FALSE(std::filesystem::exists(remote_ / "my file.txt"));
  EXPECT_EQ(test::read_file(remote_ / "my"), "bystander");
}

TEST_F(DefaultTemplatesTest, TransfersPathsWithSpacesAndQuotes) {
  test::write_file(dir_.path() / "local copy.txt", "payload");

  auto up = connector_->upload(dir_.file("local copy.txt"),
                               remote("new dir/it's here.txt"), {});
  ASSERT_TRUE(up.has_value()) << up.error();
  EXPECT_EQ(test::read_file(remote_ / "new dir/it's here.txt"), "payload");

  auto down = connector_->download(remote("new dir/it's here.txt"),
                                   dir_.file("back/again.txt"), {});
  ASSERT_TRUE(down.has_value()) << down.error();
  EXPECT_EQ(test::read_file(dir_.path() / "back/again.txt"), "payload");

  auto entries = connector_->list(remote("new dir"));
  ASSERT_TRUE(entries.has_value()) << entries.error();
  ASSERT_EQ(entries->size(), 1u);
  EXPECT_EQ((*entries)[0].name, "it's here.txt");
}

TEST(CommandConnectorConnectTest, FailedProbeLeavesDisconnected) {
  ConnectorConfig config;
  config.commands.connect = "echo 'Permission denied (publickey)' >&2; exit 255";
  CommandConnector connector{config};

  auto r = connector.connect();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), "connect failed (exit 255): Permission denied (publickey)");
  EXPECT_FALSE(connector.is_connected());
}

TEST(CommandConnectorConnectTest, TimeoutKillsCommand) {
  ConnectorConfig config;
  config.command_timeout_sec = 1;
  config.commands.connect = "sleep 30";
  CommandConnector connector{config};

  auto started = std::chrono::steady_clock::now();
  auto r = connector.connect();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), "connect failed: timed out after 1s");
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(ProcessTest, CapturesOutputAndExitCode) {
  auto result = run_command("echo out; echo err >&2; exit 3",
                            std::chrono::seconds(5));
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_FALSE(result.timed_out);
  EXPECT_TRUE(result.error.empty());
  EXPECT_NE(result.output.find("out"), std::string::npos);
  EXPECT_NE(result.output.find("err"), std::string::npos);
}

TEST(ProcessTest, RunsInWorkingDirectory) {
  test::TempDir dir;
  auto result = run_command("pwd", std::chrono::seconds(5), dir.path().string());
  EXPECT_EQ(result.exit_code, 0);
  auto canonical = std::filesystem::canonical(dir.path()).string();
  EXPECT_EQ(result.output, canonical + "\n");
}
