#include "ferry/config/config.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace ferry;

TEST(ConfigTest, Defaults) {
  SystemConfig config;

  EXPECT_EQ(config.storage.tasks_file, "scheduled_tasks.json");
  EXPECT_EQ(config.storage.history_keep, 1000);
  EXPECT_EQ(config.scheduler.poll_interval_sec, 10);
  EXPECT_TRUE(config.scheduler.autostart);
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_EQ(config.connector.type, ConnectorType::Command);
  EXPECT_EQ(config.connector.port, 22);
  EXPECT_EQ(config.paths.remote_upload_dir, "/");
  EXPECT_EQ(config.paths.local_download_dir, "./downloads");
}

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
  auto config = ConfigLoader::load_from_string("");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->storage.tasks_file, SystemConfig{}.storage.tasks_file);

  auto comments = ConfigLoader::load_from_string("# nothing here\n");
  ASSERT_TRUE(comments.has_value());
}

TEST(ConfigTest, LoadsFullDocument) {
  auto config = ConfigLoader::load_from_string(R"(
storage:
  tasks_file: /var/lib/ferry/tasks.json
  history_db: /var/lib/ferry/history.db
  history_keep: 50
scheduler:
  poll_interval_sec: 30
  autostart: false
logging:
  level: debug
  file: /var/log/ferry.log
connector:
  type: command
  host: files.example.com
  port: 2222
  username: deploy
  private_key_path: ~/.ssh/id_ed25519
  command_timeout_sec: 120
  commands:
    delete: "ssh {user}@{host} rm {remote}"
paths:
  remote_upload_dir: /incoming
  local_download_dir: /srv/downloads
)");
  ASSERT_TRUE(config.has_value());

  EXPECT_EQ(config->storage.tasks_file, "/var/lib/ferry/tasks.json");
  EXPECT_EQ(config->storage.history_db, "/var/lib/ferry/history.db");
  EXPECT_EQ(config->storage.history_keep, 50);
  EXPECT_EQ(config->scheduler.poll_interval_sec, 30);
  EXPECT_FALSE(config->scheduler.autostart);
  EXPECT_EQ(config->logging.level, "debug");
  EXPECT_EQ(config->logging.file, "/var/log/ferry.log");
  EXPECT_EQ(config->connector.host, "files.example.com");
  EXPECT_EQ(config->connector.port, 2222);
  EXPECT_EQ(config->connector.username, "deploy");
  EXPECT_EQ(config->connector.private_key_path, "~/.ssh/id_ed25519");
  EXPECT_EQ(config->connector.command_timeout_sec, 120);
  EXPECT_EQ(config->connector.commands.remove, "ssh {user}@{host} rm {remote}");
  EXPECT_EQ(config->connector.commands.upload, CommandTemplates{}.upload);
  EXPECT_EQ(config->paths.remote_upload_dir, "/incoming");
  EXPECT_EQ(config->paths.local_download_dir, "/srv/downloads");

  EXPECT_TRUE(ConfigLoader::validate(*config).has_value());
}

TEST(ConfigTest, PartialSectionsKeepDefaults) {
  auto config = ConfigLoader::load_from_string("scheduler:\n  autostart: false\n");
  ASSERT_TRUE(config.has_value());
  EXPECT_FALSE(config->scheduler.autostart);
  EXPECT_EQ(config->scheduler.poll_interval_sec, 10);
  EXPECT_EQ(config->storage.tasks_file, "scheduled_tasks.json");
}

TEST(ConfigTest, LocalConnector) {
  auto config = ConfigLoader::load_from_string(
      "connector:\n  type: local\n  root: /srv/mirror\n");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->connector.type, ConnectorType::Local);
  EXPECT_EQ(config->connector.root, "/srv/mirror");
  EXPECT_TRUE(ConfigLoader::validate(*config).has_value());
}

TEST(ConfigTest, MalformedYamlIsParseError) {
  auto bad_syntax = ConfigLoader::load_from_string("storage: [unclosed");
  ASSERT_FALSE(bad_syntax.has_value());
  EXPECT_EQ(bad_syntax.error(), make_error_code(Error::ParseError));

  auto bad_type = ConfigLoader::load_from_string(
      "scheduler:\n  poll_interval_sec: often\n");
  ASSERT_FALSE(bad_type.has_value());
  EXPECT_EQ(bad_type.error(), make_error_code(Error::ParseError));

  auto unknown_connector =
      ConfigLoader::load_from_string("connector:\n  type: ftp\n");
  ASSERT_FALSE(unknown_connector.has_value());
  EXPECT_EQ(unknown_connector.error(), make_error_code(Error::ParseError));

  auto not_a_map = ConfigLoader::load_from_string("- a\n- b\n");
  EXPECT_FALSE(not_a_map.has_value());
}

TEST(ConfigTest, MissingFileIsFileNotFound) {
  auto config = ConfigLoader::load_from_file("/nonexistent/ferry.yaml");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, LoadFromFile) {
  test::TempDir dir;
  test::write_file(dir.path() / "ferry.yaml",
                   "storage:\n  tasks_file: t.json\n");
  auto config = ConfigLoader::load_from_file(dir.file("ferry.yaml"));
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->storage.tasks_file, "t.json");
}

TEST(ConfigTest, ValidateRejectsBadValues) {
  auto expect_invalid = [](const SystemConfig& config, bool check_connector) {
    auto r = ConfigLoader::validate(config, check_connector);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  };

  SystemConfig base;
  base.connector.host = "h";
  base.connector.username = "u";
  ASSERT_TRUE(ConfigLoader::validate(base).has_value());

  auto c = base;
  c.storage.tasks_file.clear();
  expect_invalid(c, false);

  c = base;
  c.storage.history_keep = -1;
  expect_invalid(c, false);

  c = base;
  c.scheduler.poll_interval_sec = 0;
  expect_invalid(c, false);

  c = base;
  c.scheduler.poll_interval_sec = kMaxPollIntervalSec + 1;
  expect_invalid(c, false);
  c.scheduler.poll_interval_sec = kMaxPollIntervalSec;
  EXPECT_TRUE(ConfigLoader::validate(c, false).has_value());

  c = base;
  c.logging.level = "verbose";
  expect_invalid(c, false);

  c = base;
  c.connector.port = 70000;
  expect_invalid(c, true);

  c = base;
  c.connector.command_timeout_sec = -1;
  expect_invalid(c, true);

  c = base;
  c.connector.type = ConnectorType::Local;
  c.connector.root.clear();
  expect_invalid(c, true);
}

TEST(ConfigTest, ConnectorCheckIsOptional) {
  SystemConfig config;
  EXPECT_FALSE(ConfigLoader::validate(config).has_value());
  EXPECT_TRUE(ConfigLoader::validate(config, false).has_value());
}

TEST(ConfigTest, ToStringRoundTrips) {
  SystemConfig config;
  config.storage.tasks_file = "/data/tasks.json";
  config.storage.history_keep = 10;
  config.scheduler.poll_interval_sec = 5;
  config.logging.file = "/tmp/ferry.log";
  config.connector.host = "example.org";
  config.connector.username = "me";
  config.connector.port = 2022;
  config.connector.commands.list = "ssh {user}@{host} ls {remote}";
  config.connector.commands.mkdir = "ssh {user}@{host} mkdir {remote_shell}";
  config.paths.remote_upload_dir = "/up";

  auto yaml = ConfigLoader::to_string(config);
  EXPECT_EQ(yaml.find("history_db"), std::string::npos);
  EXPECT_EQ(yaml.find("upload:"), std::string::npos);

  auto reloaded = ConfigLoader::load_from_string(yaml);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->storage.tasks_file, "/data/tasks.json");
  EXPECT_EQ(reloaded->storage.history_keep, 10);
  EXPECT_EQ(reloaded->scheduler.poll_interval_sec, 5);
  EXPECT_EQ(reloaded->logging.file, "/tmp/ferry.log");
  EXPECT_EQ(reloaded->connector.port, 2022);
  EXPECT_EQ(reloaded->connector.commands, config.connector.commands);
  EXPECT_EQ(reloaded->paths.remote_upload_dir, "/up");
}
