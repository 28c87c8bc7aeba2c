#include "ferry/cli/commands.hpp"

#include "test_utils.hpp"

#include <filesystem>
#include <limits>
#include <optional>

#include "gtest/gtest.h"

using namespace ferry;
using namespace std::chrono_literals;

namespace {

auto options(std::string type, std::string source) -> cli::AddOptions {
  cli::AddOptions opts;
  opts.type = std::move(type);
  opts.source = std::move(source);
  return opts;
}

auto task_with_id(std::string id) -> TaskRecord {
  TaskRecord task;
  task.id = TaskId{std::move(id)};
  return task;
}

}  // namespace

class BuildRequestTest : public ::testing::Test {
protected:
  PathsConfig paths_{.remote_upload_dir = "/incoming",
                     .local_download_dir = "/srv/downloads"};
  TimePoint now_ = truncate_ms(Clock::now());
};

TEST_F(BuildRequestTest, DefaultsToNow) {
  auto opts = options("upload", "/data/a.txt");
  opts.destination = "/remote/a.txt";

  auto request = cli::build_request(opts, paths_, now_);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->type, TaskType::Upload);
  EXPECT_EQ(request->source, "/data/a.txt");
  EXPECT_EQ(request->destination, "/remote/a.txt");
  EXPECT_EQ(request->scheduled_at, now_);
  EXPECT_FALSE(request->recurring);
  EXPECT_FALSE(request->interval_minutes.has_value());
}

TEST_F(BuildRequestTest, RelativeDestinationsUseConfiguredDirs) {
  auto up = options("upload", "a.txt");
  up.destination = "reports/a.txt";
  EXPECT_EQ(cli::build_request(up, paths_, now_)->destination,
            "/incoming/reports/a.txt");

  auto down = options("download", "/remote/b.csv");
  down.destination = "b.csv";
  EXPECT_EQ(cli::build_request(down, paths_, now_)->destination,
            "/srv/downloads/b.csv");

  down.destination = "/abs/b.csv";
  EXPECT_EQ(cli::build_request(down, paths_, now_)->destination, "/abs/b.csv");
}

TEST_F(BuildRequestTest, DeleteTakesNoDestination) {
  auto opts = options("delete", "/remote/old.log");
  auto request = cli::build_request(opts, paths_, now_);
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->type, TaskType::Delete);
  EXPECT_FALSE(request->destination.has_value());

  opts.destination = "x";
  EXPECT_EQ(cli::build_request(opts, paths_, now_).error(),
            make_error_code(Error::InvalidArgument));
}

TEST_F(BuildRequestTest, ScheduleOptions) {
  auto opts = options("delete", "/remote/old.log");
  opts.in_minutes = 90;
  EXPECT_EQ(cli::build_request(opts, paths_, now_)->scheduled_at, now_ + 90min);

  opts.in_minutes.reset();
  opts.at = "2030-01-02T03:04:05Z";
  auto at = cli::build_request(opts, paths_, now_);
  ASSERT_TRUE(at.has_value());
  EXPECT_EQ(to_iso8601(at->scheduled_at), "2030-01-02T03:04:05.000Z");

  opts.every_minutes = 15;
  auto recurring = cli::build_request(opts, paths_, now_);
  ASSERT_TRUE(recurring.has_value());
  EXPECT_TRUE(recurring->recurring);
  EXPECT_EQ(recurring->interval_minutes, 15);
}

TEST_F(BuildRequestTest, RejectsBadInput) {
  auto expect_invalid = [&](const cli::AddOptions& opts) {
    auto r = cli::build_request(opts, paths_, now_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  };

  expect_invalid(options("copy", "/a"));

  auto both = options("delete", "/a");
  both.at = "2030-01-01T00:00:00Z";
  both.in_minutes = 5;
  expect_invalid(both);

  auto negative = options("delete", "/a");
  negative.in_minutes = -1;
  expect_invalid(negative);

  auto garbage = options("delete", "/a");
  garbage.at = "next tuesday";
  expect_invalid(garbage);

  auto zero_every = options("delete", "/a");
  zero_every.every_minutes = 0;
  expect_invalid(zero_every);
}

TEST_F(BuildRequestTest, RejectsMinutesBeyondLimit) {
  auto expect_invalid = [&](const cli::AddOptions& opts) {
    auto r = cli::build_request(opts, paths_, now_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  };

  auto every = options("delete", "/a");
  every.every_minutes = kMaxIntervalMinutes + 1;
  expect_invalid(every);
  every.every_minutes = std::numeric_limits<int>::max();
  expect_invalid(every);

  auto in = options("delete", "/a");
  in.in_minutes = std::numeric_limits<int>::max();
  expect_invalid(in);

  every.every_minutes = kMaxIntervalMinutes;
  every.in_minutes = kMaxIntervalMinutes;
  auto r = cli::build_request(every, paths_, now_);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->interval_minutes, kMaxIntervalMinutes);
}

TEST(TransferNowTest, ConnectFailureIsNotConnected) {
  test::FakeConnector connector;
  connector.fail_connect_with("host unreachable");
  auto r = cli::transfer_now(connector, TaskType::Delete, "/r/a", "");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotConnected));
  EXPECT_TRUE(connector.calls().empty());
}

TEST(TransferNowTest, OperationFailureIsTransferFailure) {
  test::FakeConnector connector;
  connector.fail_with("permission denied");
  auto r = cli::transfer_now(connector, TaskType::Upload, "/l/a", "/r/a");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::TransferFailure));
}

TEST(TransferNowTest, DispatchesByType) {
  test::FakeConnector connector;
  ASSERT_TRUE(
      cli::transfer_now(connector, TaskType::Download, "/r/b", "/l/b").has_value());
  ASSERT_TRUE(cli::transfer_now(connector, TaskType::Delete, "/r/c", "").has_value());

  auto calls = connector.calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].op, "download");
  EXPECT_EQ(calls[0].first, "/r/b");
  EXPECT_EQ(calls[0].second, "/l/b");
  EXPECT_EQ(calls[1].op, "delete");
  EXPECT_EQ(connector.connect_calls(), 1);
}

// put/get/rm/check against a directory standing in for the remote host.
class ImmediateCommandTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::filesystem::create_directories(remote_);
    test::write_file(config_file_,
                     "storage:\n"
                     "  tasks_file: " + dir_.file("tasks.json") + "\n"
                     "  history_db: \"\"\n"
                     "connector:\n"
                     "  type: local\n"
                     "  root: " + remote_.string() + "\n"
                     "paths:\n"
                     "  remote_upload_dir: /incoming\n"
                     "  local_download_dir: " + dir_.file("downloads") + "\n");
  }

  auto options(TaskType type, std::string source,
               std::optional<std::string> destination) const
      -> cli::TransferOptions {
    return {.config_file = config_file_.string(),
            .type = type,
            .source = std::move(source),
            .destination = std::move(destination)};
  }

  test::TempDir dir_;
  std::filesystem::path remote_{dir_.path() / "remote"};
  std::filesystem::path config_file_{dir_.path() / "ferry.yaml"};
};

TEST_F(ImmediateCommandTest, PutGetRmRoundTrip) {
  test::write_file(dir_.path() / "a.txt", "now");

  EXPECT_EQ(cli::cmd_transfer(
                options(TaskType::Upload, dir_.file("a.txt"), "reports/a.txt")),
            0);
  EXPECT_EQ(test::read_file(remote_ / "incoming/reports/a.txt"), "now");

  EXPECT_EQ(cli::cmd_transfer(options(TaskType::Download,
                                      "/incoming/reports/a.txt", "b.txt")),
            0);
  EXPECT_EQ(test::read_file(dir_.path() / "downloads/b.txt"), "now");

  EXPECT_EQ(cli::cmd_transfer(
                options(TaskType::Delete, "/incoming/reports/a.txt", {})),
            0);
  EXPECT_FALSE(std::filesystem::exists(remote_ / "incoming/reports/a.txt"));
  EXPECT_FALSE(std::filesystem::exists(dir_.path() / "tasks.json"));
}

TEST_F(ImmediateCommandTest, FailedOperationExitsNonZero) {
  EXPECT_EQ(cli::cmd_transfer(options(TaskType::Delete, "/absent.txt", {})), 1);
  EXPECT_EQ(cli::cmd_transfer(
                options(TaskType::Upload, dir_.file("missing.txt"), "x.txt")),
            1);
}

TEST_F(ImmediateCommandTest, CheckReportsReachability) {
  EXPECT_EQ(cli::cmd_check({.config_file = config_file_.string()}), 0);

  std::filesystem::remove_all(remote_);
  EXPECT_EQ(cli::cmd_check({.config_file = config_file_.string()}), 1);
}

TEST(ResolveTaskIdTest, ExactAndPrefix) {
  std::vector<TaskRecord> tasks{task_with_id("3f0a1b2c"),
                                task_with_id("3f9d0000"),
                                task_with_id("a1b2c3d4")};

  EXPECT_EQ(*cli::resolve_task_id(tasks, "a1b2c3d4"), TaskId{"a1b2c3d4"});
  EXPECT_EQ(*cli::resolve_task_id(tasks, "a1"), TaskId{"a1b2c3d4"});
  EXPECT_EQ(*cli::resolve_task_id(tasks, "3f0"), TaskId{"3f0a1b2c"});

  EXPECT_EQ(cli::resolve_task_id(tasks, "3f").error(),
            make_error_code(Error::InvalidArgument));
  EXPECT_EQ(cli::resolve_task_id(tasks, "ff").error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(cli::resolve_task_id(tasks, "").error(),
            make_error_code(Error::NotFound));
}

TEST(ResolveTaskIdTest, ExactMatchWinsOverLongerIds) {
  std::vector<TaskRecord> tasks{task_with_id("abc1"), task_with_id("abc2"),
                                task_with_id("abc")};
  EXPECT_EQ(*cli::resolve_task_id(tasks, "abc"), TaskId{"abc"});
}
