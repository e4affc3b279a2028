/**
 * @file test_dispatcher.cpp
 * @brief Unit tests for Dispatcher: outcome mapping, ordering, concurrency and shutdown
 */

#include <gtest/gtest.h>
#include "snipq/dispatcher.h"

#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace snipq {
namespace testing {

using namespace std::chrono_literals;

namespace {

// Poll until the predicate holds or the timeout passes
bool waitFor(const std::function<bool()>& predicate,
             std::chrono::milliseconds timeout = 10000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

RunnerOptions shellOptions(const std::string& dir) {
    RunnerOptions options;
    options.interpreter = "/bin/sh";
    options.interpreter_args = {};
    options.source_extension = ".sh";
    options.temp_dir = dir;
    return options;
}

} // anonymous namespace

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = "/tmp/snipq_dispatcher_test_" + std::to_string(getpid());
        mkdir(test_dir_.c_str(), 0755);
        runner_ = std::make_unique<ProcessRunner>(shellOptions(test_dir_));
    }

    void TearDown() override {
        std::string cmd = "rm -rf " + test_dir_;
        int ret = system(cmd.c_str());
        (void)ret;
    }

    std::string addTask(const std::string& id, const std::string& script, int64_t user = 1) {
        Task task;
        task.id = id;
        task.submitter_id = user;
        task.source_code = script;
        task.created_at = std::chrono::system_clock::now();
        store_.insert(task);
        EXPECT_TRUE(queue_.push(id));
        return id;
    }

    bool isTerminal(const std::string& id) {
        auto task = store_.getTask(id);
        return task.has_value() && task->isTerminal();
    }

    std::string test_dir_;
    TaskStore store_;
    PendingQueue queue_;
    std::unique_ptr<ProcessRunner> runner_;
};

// ========== Outcome Mapping ==========

TEST(DispatcherMappingTest, SuccessfulExitCompletes) {
    RunOutcome outcome;
    outcome.kind = RunResultKind::EXITED;
    outcome.exit_code = 0;
    outcome.stdout_text = "2\n";
    outcome.elapsed_seconds = 0.25;

    TaskResult result = Dispatcher::mapOutcome(outcome, 45.0);

    EXPECT_EQ(result.state, TaskState::COMPLETED);
    EXPECT_EQ(result.stdout_text, "2\n");
    EXPECT_EQ(result.exit_code, std::optional<int>(0));
    EXPECT_DOUBLE_EQ(result.duration_seconds, 0.25);
    EXPECT_FALSE(result.no_output);
}

TEST(DispatcherMappingTest, SilentSuccessGetsMarker) {
    RunOutcome outcome;
    outcome.kind = RunResultKind::EXITED;
    outcome.exit_code = 0;
    outcome.no_output = true;

    TaskResult result = Dispatcher::mapOutcome(outcome, 45.0);

    EXPECT_EQ(result.state, TaskState::COMPLETED);
    EXPECT_TRUE(result.no_output);
    EXPECT_EQ(result.stdout_text, NO_OUTPUT_MARKER);
}

TEST(DispatcherMappingTest, NonZeroExitFails) {
    RunOutcome outcome;
    outcome.kind = RunResultKind::EXITED;
    outcome.exit_code = 1;
    outcome.stdout_text = "before\n";
    outcome.stderr_text = "Traceback\n";

    TaskResult result = Dispatcher::mapOutcome(outcome, 45.0);

    EXPECT_EQ(result.state, TaskState::FAILED);
    EXPECT_EQ(result.exit_code, std::optional<int>(1));
    EXPECT_EQ(result.stdout_text, "before\n");
    EXPECT_EQ(result.stderr_text, "Traceback\n");
}

TEST(DispatcherMappingTest, TimeoutKeepsPartialStdout) {
    RunOutcome outcome;
    outcome.kind = RunResultKind::TIMED_OUT;
    outcome.stdout_text = "partial\n";
    outcome.stderr_text = "ignored\n";

    TaskResult result = Dispatcher::mapOutcome(outcome, 45.0);

    EXPECT_EQ(result.state, TaskState::TIMED_OUT);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_EQ(result.stdout_text, "partial\n");
    EXPECT_EQ(result.stderr_text, "Execution timed out after 45 seconds");
}

TEST(DispatcherMappingTest, SpawnErrorIsSystemError) {
    RunOutcome outcome;
    outcome.kind = RunResultKind::SPAWN_ERROR;
    outcome.error_message = "Failed to fork";

    TaskResult result = Dispatcher::mapOutcome(outcome, 45.0);

    EXPECT_EQ(result.state, TaskState::FAILED);
    EXPECT_EQ(result.stderr_text, "System error: Failed to fork");
    EXPECT_FALSE(result.exit_code.has_value());
}

TEST(DispatcherMappingTest, AbortedRunFails) {
    RunOutcome outcome;
    outcome.kind = RunResultKind::ABORTED;

    TaskResult result = Dispatcher::mapOutcome(outcome, 45.0);

    EXPECT_EQ(result.state, TaskState::FAILED);
    EXPECT_EQ(result.stderr_text, ABORTED_MESSAGE);
}

TEST(DispatcherMappingTest, TimeoutMessageFormat) {
    EXPECT_EQ(Dispatcher::timeoutMessage(45.0), "Execution timed out after 45 seconds");
    EXPECT_EQ(Dispatcher::timeoutMessage(0.5), "Execution timed out after 0.5 seconds");
}

// ========== Single Dispatch ==========

TEST_F(DispatcherTest, DispatchOnceRunsTask) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0);
    addTask("a", "echo hi");

    EXPECT_TRUE(dispatcher.dispatchOnce());

    auto task = store_.getTask("a");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->state, TaskState::COMPLETED);
    EXPECT_EQ(task->stdout_text, "hi\n");
    EXPECT_EQ(task->exit_code, std::optional<int>(0));
    EXPECT_TRUE(task->started_at.has_value());
    EXPECT_TRUE(task->finished_at.has_value());
    EXPECT_GT(task->duration_seconds, 0.0);
}

TEST_F(DispatcherTest, DispatchOnceOnEmptyQueue) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0);
    EXPECT_FALSE(dispatcher.dispatchOnce());
}

TEST_F(DispatcherTest, UnknownIdIsSkipped) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0);
    queue_.push("ghost");

    EXPECT_TRUE(dispatcher.dispatchOnce());
    EXPECT_FALSE(store_.getTask("ghost").has_value());
}

TEST_F(DispatcherTest, StateCallbackSeesTransitions) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0);

    std::vector<std::pair<TaskState, TaskState>> transitions;
    dispatcher.setStateCallback([&transitions](const std::string&, TaskState from, TaskState to) {
        transitions.emplace_back(from, to);
    });

    addTask("a", "exit 4");
    dispatcher.dispatchOnce();

    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[0].first, TaskState::PENDING);
    EXPECT_EQ(transitions[0].second, TaskState::RUNNING);
    EXPECT_EQ(transitions[1].first, TaskState::RUNNING);
    EXPECT_EQ(transitions[1].second, TaskState::FAILED);
}

// A callback that replaces itself must not block the worker
TEST_F(DispatcherTest, StateCallbackMayReplaceItself) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0);

    std::atomic<int> first_calls{0};
    std::atomic<int> second_calls{0};
    dispatcher.setStateCallback([&](const std::string&, TaskState, TaskState) {
        ++first_calls;
        dispatcher.setStateCallback([&second_calls](const std::string&, TaskState, TaskState) {
            ++second_calls;
        });
    });

    addTask("a", "echo a");
    std::thread worker([&dispatcher]() { dispatcher.dispatchOnce(); });
    ASSERT_TRUE(waitFor([this]() { return isTerminal("a"); }));
    worker.join();

    EXPECT_EQ(first_calls.load(), 1);
    EXPECT_EQ(second_calls.load(), 1);
}

// A slow callback on one worker does not hold up another worker's transitions
TEST_F(DispatcherTest, SlowCallbackDoesNotSerializeWorkers) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0, 2, 20);

    std::atomic<bool> release{false};
    std::atomic<int> calls{0};
    dispatcher.setStateCallback([&](const std::string& id, TaskState, TaskState to) {
        ++calls;
        if (id == "slow" && to == TaskState::RUNNING) {
            while (!release.load()) {
                std::this_thread::sleep_for(5ms);
            }
        }
    });

    addTask("slow", "echo slow");
    dispatcher.start();
    ASSERT_TRUE(waitFor([this]() { return store_.getTask("slow")->state == TaskState::RUNNING; }));

    addTask("fast", "echo fast");
    EXPECT_TRUE(waitFor([this]() { return isTerminal("fast"); }, 5000ms));

    release.store(true);
    ASSERT_TRUE(waitFor([this]() { return isTerminal("slow"); }));
    dispatcher.stop();

    EXPECT_EQ(store_.getTask("fast")->state, TaskState::COMPLETED);
    EXPECT_EQ(calls.load(), 4);
}

TEST_F(DispatcherTest, TimedOutTask) {
    Dispatcher dispatcher(store_, queue_, *runner_, 0.5);
    addTask("slow", "echo begin\nsleep 30");

    auto start = std::chrono::steady_clock::now();
    dispatcher.dispatchOnce();
    auto elapsed = std::chrono::steady_clock::now() - start;

    auto task = store_.getTask("slow");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->state, TaskState::TIMED_OUT);
    EXPECT_EQ(task->stderr_text, "Execution timed out after 0.5 seconds");
    EXPECT_EQ(task->stdout_text, "begin\n");
    EXPECT_LT(elapsed, 5s);
    EXPECT_EQ(store_.systemStats().total_timed_out, 1u);
}

TEST_F(DispatcherTest, SpawnFailureIsRecordedOnTask) {
    RunnerOptions options = shellOptions(test_dir_);
    options.interpreter = "/nonexistent/snipq-interpreter";
    ProcessRunner broken(options);
    Dispatcher dispatcher(store_, queue_, broken, 10.0);

    addTask("a", "echo never");
    dispatcher.dispatchOnce();

    auto task = store_.getTask("a");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->state, TaskState::FAILED);
    EXPECT_EQ(task->stderr_text.rfind("System error: ", 0), 0u);
}

// ========== Worker Pool ==========

TEST_F(DispatcherTest, SingleWorkerRunsInSubmissionOrder) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0, 1, 50);

    std::mutex order_mutex;
    std::vector<std::string> started;
    dispatcher.setStateCallback([&](const std::string& id, TaskState, TaskState to) {
        if (to == TaskState::RUNNING) {
            std::lock_guard<std::mutex> lock(order_mutex);
            started.push_back(id);
        }
    });

    for (int i = 0; i < 5; ++i) {
        addTask("t" + std::to_string(i), "echo " + std::to_string(i));
    }
    dispatcher.start();

    ASSERT_TRUE(waitFor([this]() { return isTerminal("t4"); }));
    dispatcher.stop();

    std::lock_guard<std::mutex> lock(order_mutex);
    EXPECT_EQ(started, (std::vector<std::string>{"t0", "t1", "t2", "t3", "t4"}));

    // Sequential: each task starts after the previous one finished
    for (int i = 1; i < 5; ++i) {
        auto prev = store_.getTask("t" + std::to_string(i - 1));
        auto cur = store_.getTask("t" + std::to_string(i));
        EXPECT_LE(*prev->finished_at, *cur->started_at);
    }
}

TEST_F(DispatcherTest, TwoWorkersRunConcurrently) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0, 2, 50);

    std::atomic<int> current{0};
    std::atomic<int> peak{0};
    dispatcher.setStateCallback([&](const std::string&, TaskState from, TaskState to) {
        if (to == TaskState::RUNNING) {
            int now = ++current;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
        } else if (from == TaskState::RUNNING) {
            --current;
        }
    });

    addTask("a", "sleep 1");
    addTask("b", "sleep 1");
    auto start = std::chrono::steady_clock::now();
    dispatcher.start();

    ASSERT_TRUE(waitFor([this]() { return isTerminal("a") && isTerminal("b"); }));
    auto elapsed = std::chrono::steady_clock::now() - start;
    dispatcher.stop();

    EXPECT_EQ(peak.load(), 2);
    EXPECT_LT(elapsed, 1900ms);
    EXPECT_EQ(store_.getTask("a")->state, TaskState::COMPLETED);
    EXPECT_EQ(store_.getTask("b")->state, TaskState::COMPLETED);
}

// ========== Shutdown ==========

TEST_F(DispatcherTest, StopFailsQueuedTasks) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0);
    addTask("a", "echo a");
    addTask("b", "echo b");

    dispatcher.stop();

    for (const char* id : {"a", "b"}) {
        auto task = store_.getTask(id);
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task->state, TaskState::FAILED);
        EXPECT_EQ(task->stderr_text, ABORTED_MESSAGE);
    }
    EXPECT_FALSE(queue_.push("late"));
}

TEST_F(DispatcherTest, StopKillsRunningTask) {
    Dispatcher dispatcher(store_, queue_, *runner_, 60.0, 1, 50);
    addTask("long", "sleep 30");
    dispatcher.start();

    ASSERT_TRUE(waitFor([this]() { return store_.getTask("long")->state == TaskState::RUNNING; }));
    ASSERT_TRUE(waitFor([&dispatcher]() { return dispatcher.runningCount() == 1; }));

    auto start = std::chrono::steady_clock::now();
    dispatcher.stop();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(dispatcher.isRunning());
    EXPECT_LT(elapsed, 5s);
    auto task = store_.getTask("long");
    EXPECT_EQ(task->state, TaskState::FAILED);
    EXPECT_EQ(task->stderr_text, ABORTED_MESSAGE);
}

TEST_F(DispatcherTest, RestartAfterStopRunsTasks) {
    Dispatcher dispatcher(store_, queue_, *runner_, 10.0, 1, 20);
    dispatcher.start();
    dispatcher.stop();
    ASSERT_FALSE(dispatcher.isRunning());

    dispatcher.start();
    EXPECT_TRUE(dispatcher.isRunning());
    addTask("again", "echo again");

    ASSERT_TRUE(waitFor([this]() { return isTerminal("again"); }));
    dispatcher.stop();

    auto task = store_.getTask("again");
    EXPECT_EQ(task->state, TaskState::COMPLETED);
    EXPECT_EQ(task->stdout_text, "again\n");
}

} // namespace testing
} // namespace snipq
