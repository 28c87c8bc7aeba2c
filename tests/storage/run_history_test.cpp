#include "ferry/storage/run_history.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace ferry;
using namespace std::chrono_literals;

namespace {

auto make_run(std::string task_id, bool succeeded, TimePoint started)
    -> RunRecord {
  RunRecord run;
  run.task_id = TaskId{std::move(task_id)};
  run.type = TaskType::Upload;
  run.source = "/tmp/a.txt";
  run.destination = "/remote/a.txt";
  run.started_at = truncate_ms(started);
  run.finished_at = truncate_ms(started + 250ms);
  run.succeeded = succeeded;
  if (!succeeded) {
    run.error = "connection refused";
  }
  run.bytes_done = succeeded ? 4096 : 0;
  return run;
}

}  // namespace

class RunHistoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    history_ = std::make_unique<RunHistory>(dir_.file("history.db"));
    ASSERT_TRUE(history_->open().has_value());
  }

  test::TempDir dir_;
  std::unique_ptr<RunHistory> history_;
};

TEST_F(RunHistoryTest, RecordAndListNewestFirst) {
  auto now = Clock::now();
  ASSERT_TRUE(history_->record(make_run("a", true, now - 2min)).has_value());
  ASSERT_TRUE(history_->record(make_run("b", false, now - 1min)).has_value());

  auto runs = history_->list();
  ASSERT_TRUE(runs.has_value());
  ASSERT_EQ(runs->size(), 2u);

  const auto& newest = (*runs)[0];
  EXPECT_EQ(newest.task_id, TaskId{"b"});
  EXPECT_FALSE(newest.succeeded);
  EXPECT_EQ(newest.error, "connection refused");
  EXPECT_EQ(newest.started_at, truncate_ms(now - 1min));
  EXPECT_EQ(newest.finished_at, truncate_ms(now - 1min + 250ms));

  const auto& oldest = (*runs)[1];
  EXPECT_EQ(oldest.task_id, TaskId{"a"});
  EXPECT_TRUE(oldest.succeeded);
  EXPECT_TRUE(oldest.error.empty());
  EXPECT_EQ(oldest.bytes_done, 4096);
  EXPECT_EQ(oldest.destination, "/remote/a.txt");
}

TEST_F(RunHistoryTest, DeleteRunHasNoDestination) {
  auto run = make_run("d", true, Clock::now());
  run.type = TaskType::Delete;
  run.destination.reset();
  ASSERT_TRUE(history_->record(run).has_value());

  auto runs = history_->list();
  ASSERT_TRUE(runs.has_value());
  ASSERT_EQ(runs->size(), 1u);
  EXPECT_EQ((*runs)[0].type, TaskType::Delete);
  EXPECT_FALSE((*runs)[0].destination.has_value());
}

TEST_F(RunHistoryTest, FilterByTaskAndLimit) {
  auto now = Clock::now();
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(
        history_->record(make_run("a", true, now + std::chrono::seconds(i)))
            .has_value());
    ASSERT_TRUE(
        history_->record(make_run("b", true, now + std::chrono::seconds(i)))
            .has_value());
  }

  auto only_a = history_->list("a");
  ASSERT_TRUE(only_a.has_value());
  EXPECT_EQ(only_a->size(), 5u);
  for (const auto& run : *only_a) {
    EXPECT_EQ(run.task_id, TaskId{"a"});
  }

  auto limited = history_->list("", 3);
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(limited->size(), 3u);

  auto unknown = history_->list("nope");
  ASSERT_TRUE(unknown.has_value());
  EXPECT_TRUE(unknown->empty());
}

TEST_F(RunHistoryTest, PruneKeepsNewest) {
  auto now = Clock::now();
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(history_
                    ->record(make_run(std::to_string(i), true,
                                      now + std::chrono::seconds(i)))
                    .has_value());
  }

  auto deleted = history_->prune(4);
  ASSERT_TRUE(deleted.has_value());
  EXPECT_EQ(*deleted, 6u);

  auto runs = history_->list();
  ASSERT_TRUE(runs.has_value());
  ASSERT_EQ(runs->size(), 4u);
  EXPECT_EQ((*runs)[0].task_id, TaskId{"9"});
  EXPECT_EQ((*runs)[3].task_id, TaskId{"6"});

  EXPECT_EQ(*history_->prune(4), 0u);
}

TEST_F(RunHistoryTest, SurvivesReopen) {
  ASSERT_TRUE(history_->record(make_run("a", true, Clock::now())).has_value());
  history_->close();
  EXPECT_FALSE(history_->is_open());

  RunHistory reopened{dir_.file("history.db")};
  ASSERT_TRUE(reopened.open().has_value());
  auto runs = reopened.list();
  ASSERT_TRUE(runs.has_value());
  EXPECT_EQ(runs->size(), 1u);
}

TEST_F(RunHistoryTest, ClosedDatabaseReportsError) {
  history_->close();
  EXPECT_EQ(history_->record(make_run("a", true, Clock::now())).error(),
            make_error_code(Error::DatabaseError));
  EXPECT_EQ(history_->list().error(), make_error_code(Error::DatabaseError));
  EXPECT_EQ(history_->prune(1).error(), make_error_code(Error::DatabaseError));
}

TEST(RunHistoryOpenTest, UnopenablePathFails) {
  test::TempDir dir;
  RunHistory history{dir.file("missing/dir/history.db")};
  auto r = history.open();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::DatabaseOpenFailed));
  EXPECT_FALSE(history.is_open());
}
