/**
 * @file test_task_store.cpp
 * @brief Unit tests for TaskStore: state transitions, history and statistics
 */

#include <gtest/gtest.h>
#include "snipq/task_store.h"

#include <thread>

namespace snipq {
namespace testing {

class TaskStoreTest : public ::testing::Test {
protected:
    Task makeTask(const std::string& id, int64_t user) {
        Task task;
        task.id = id;
        task.submitter_id = user;
        task.source_code = "print(1)";
        task.created_at = std::chrono::system_clock::now();
        return task;
    }

    TaskResult result(TaskState state, double duration = 0.5) {
        TaskResult r;
        r.state = state;
        r.duration_seconds = duration;
        if (state == TaskState::COMPLETED) {
            r.exit_code = 0;
        } else if (state == TaskState::FAILED) {
            r.exit_code = 1;
        }
        return r;
    }

    // Insert, start and finish in one go
    void runTask(TaskStore& store, const std::string& id, int64_t user, TaskState state) {
        store.insert(makeTask(id, user));
        ASSERT_TRUE(store.markRunning(id).has_value());
        ASSERT_TRUE(store.finish(id, result(state)).has_value());
    }
};

TEST_F(TaskStoreTest, InsertAndGet) {
    TaskStore store;
    store.insert(makeTask("a", 1));

    auto task = store.getTask("a");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->state, TaskState::PENDING);
    EXPECT_EQ(task->submitter_id, 1);
    EXPECT_FALSE(store.getTask("missing").has_value());
}

TEST_F(TaskStoreTest, SubmissionCountsImmediately) {
    TaskStore store;
    store.insert(makeTask("a", 1));

    EXPECT_EQ(store.userStats(1).submitted, 1u);
    EXPECT_EQ(store.systemStats().total_submitted, 1u);
    EXPECT_EQ(store.userStats(2).submitted, 0u);
}

TEST_F(TaskStoreTest, MarkRunningOnlyFromPending) {
    TaskStore store;
    store.insert(makeTask("a", 1));

    auto running = store.markRunning("a");
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->state, TaskState::RUNNING);
    EXPECT_TRUE(running->started_at.has_value());

    EXPECT_FALSE(store.markRunning("a").has_value());
    EXPECT_FALSE(store.markRunning("missing").has_value());
}

TEST_F(TaskStoreTest, FinishRecordsResult) {
    TaskStore store;
    store.insert(makeTask("a", 1));
    store.markRunning("a");

    TaskResult r = result(TaskState::COMPLETED, 1.25);
    r.stdout_text = "2\n";
    auto finished = store.finish("a", r);

    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->state, TaskState::COMPLETED);
    EXPECT_EQ(finished->stdout_text, "2\n");
    EXPECT_EQ(finished->exit_code, std::optional<int>(0));
    EXPECT_DOUBLE_EQ(finished->duration_seconds, 1.25);
    ASSERT_TRUE(finished->finished_at.has_value());
    EXPECT_GE(*finished->finished_at, *finished->started_at);

    EXPECT_EQ(store.getTask("a")->state, TaskState::COMPLETED);
}

// A terminal task never changes again
TEST_F(TaskStoreTest, FinishIsOnlyOnce) {
    TaskStore store;
    runTask(store, "a", 1, TaskState::COMPLETED);

    EXPECT_FALSE(store.finish("a", result(TaskState::FAILED)).has_value());
    EXPECT_EQ(store.getTask("a")->state, TaskState::COMPLETED);
    EXPECT_EQ(store.userStats(1).succeeded, 1u);
    EXPECT_EQ(store.userStats(1).failed, 0u);
    EXPECT_EQ(store.historySize(), 1u);
}

TEST_F(TaskStoreTest, StatisticsByOutcome) {
    TaskStore store;
    runTask(store, "a", 1, TaskState::COMPLETED);
    runTask(store, "b", 1, TaskState::FAILED);
    runTask(store, "c", 1, TaskState::TIMED_OUT);
    runTask(store, "d", 2, TaskState::COMPLETED);

    UserStats user1 = store.userStats(1);
    EXPECT_EQ(user1.submitted, 3u);
    EXPECT_EQ(user1.succeeded, 1u);
    EXPECT_EQ(user1.failed, 2u);  // A timeout counts as a failure

    SystemStats sys = store.systemStats();
    EXPECT_EQ(sys.total_submitted, 4u);
    EXPECT_EQ(sys.total_succeeded, 2u);
    EXPECT_EQ(sys.total_failed, 2u);
    EXPECT_EQ(sys.total_timed_out, 1u);
    EXPECT_DOUBLE_EQ(sys.cumulative_execution_seconds, 2.0);
}

TEST_F(TaskStoreTest, HistoryIsMostRecentFirstAndBounded) {
    TaskStore store(3);
    for (int i = 0; i < 5; ++i) {
        runTask(store, "t" + std::to_string(i), 1, TaskState::COMPLETED);
    }

    auto history = store.history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].id, "t4");
    EXPECT_EQ(history[1].id, "t3");
    EXPECT_EQ(history[2].id, "t2");
    EXPECT_EQ(store.historyCapacity(), 3u);

    auto limited = store.history(2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[0].id, "t4");

    // Evicted from history, still queryable by id
    EXPECT_TRUE(store.getTask("t0").has_value());
}

TEST_F(TaskStoreTest, UserHistoryFiltersBySubmitter) {
    TaskStore store;
    runTask(store, "a", 1, TaskState::COMPLETED);
    runTask(store, "b", 2, TaskState::COMPLETED);
    runTask(store, "c", 1, TaskState::FAILED);
    runTask(store, "d", 1, TaskState::COMPLETED);

    auto mine = store.userHistory(1);
    ASSERT_EQ(mine.size(), 3u);
    EXPECT_EQ(mine[0].id, "d");
    EXPECT_EQ(mine[1].id, "c");
    EXPECT_EQ(mine[2].id, "a");

    auto limited = store.userHistory(1, 1);
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].id, "d");

    EXPECT_TRUE(store.userHistory(3).empty());
}

TEST_F(TaskStoreTest, PendingTasksAreNotInHistory) {
    TaskStore store;
    store.insert(makeTask("a", 1));
    EXPECT_TRUE(store.history().empty());
}

// Over the bound, the oldest finished tasks go first; pending ones stay
TEST_F(TaskStoreTest, EvictsOldestFinishedTasks) {
    TaskStore store(100, 3);
    store.insert(makeTask("pending", 1));
    runTask(store, "f1", 1, TaskState::COMPLETED);
    runTask(store, "f2", 1, TaskState::COMPLETED);
    runTask(store, "f3", 1, TaskState::COMPLETED);

    EXPECT_EQ(store.size(), 3u);
    EXPECT_TRUE(store.getTask("pending").has_value());
    EXPECT_FALSE(store.getTask("f1").has_value());
    EXPECT_TRUE(store.getTask("f3").has_value());
}

TEST_F(TaskStoreTest, CleanupRemovesOldFinishedTasks) {
    TaskStore store;
    runTask(store, "old", 1, TaskState::COMPLETED);
    store.insert(makeTask("pending", 1));

    // Everything finished before "now + 1s" is old
    size_t removed = store.cleanup(std::chrono::system_clock::now() + std::chrono::seconds(1));

    EXPECT_EQ(removed, 1u);
    EXPECT_FALSE(store.getTask("old").has_value());
    EXPECT_TRUE(store.getTask("pending").has_value());

    EXPECT_EQ(store.cleanup(std::chrono::system_clock::now() - std::chrono::hours(1)), 0u);
}

TEST_F(TaskStoreTest, ResetStatsZeroesCounters) {
    TaskStore store;
    runTask(store, "a", 1, TaskState::COMPLETED);

    store.resetStats();

    EXPECT_EQ(store.userStats(1), UserStats());
    EXPECT_EQ(store.systemStats().total_submitted, 0u);
    // Tasks themselves are untouched
    EXPECT_TRUE(store.getTask("a").has_value());
    EXPECT_EQ(store.historySize(), 1u);
}

TEST_F(TaskStoreTest, ReadsReturnCopies) {
    TaskStore store;
    store.insert(makeTask("a", 1));

    auto copy = store.getTask("a");
    copy->stdout_text = "changed";

    EXPECT_EQ(store.getTask("a")->stdout_text, "");
}

TEST_F(TaskStoreTest, StatsJsonRoundTrip) {
    UserStats user;
    user.submitted = 5;
    user.succeeded = 3;
    user.failed = 2;
    EXPECT_EQ(UserStats::fromJson(user.toJson()), user);

    SystemStats sys;
    sys.total_timed_out = 4;
    sys.cumulative_execution_seconds = 12.5;
    SystemStats restored = SystemStats::fromJson(sys.toJson());
    EXPECT_EQ(restored.total_timed_out, 4u);
    EXPECT_DOUBLE_EQ(restored.cumulative_execution_seconds, 12.5);
}

TEST_F(TaskStoreTest, ConcurrentFinishCountsEveryTask) {
    TaskStore store;
    const int count = 200;
    for (int i = 0; i < count; ++i) {
        store.insert(makeTask("t" + std::to_string(i), i % 4));
        store.markRunning("t" + std::to_string(i));
    }

    std::vector<std::thread> threads;
    for (int w = 0; w < 4; ++w) {
        threads.emplace_back([&store, w, this]() {
            for (int i = w; i < count; i += 4) {
                store.finish("t" + std::to_string(i), result(TaskState::COMPLETED));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(store.systemStats().total_succeeded, static_cast<uint64_t>(count));
    EXPECT_EQ(store.historySize(), 100u);
}

} // namespace testing
} // namespace snipq
