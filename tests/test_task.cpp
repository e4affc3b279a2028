/**
 * @file test_task.cpp
 * @brief Unit tests for Task data structure, JSON serialization and text helpers
 */

#include <gtest/gtest.h>
#include "snipq/task.h"
#include "snipq/errors.h"

#include <cctype>
#include <set>

namespace snipq {
namespace testing {

class TaskTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a sample finished task for testing
        sample_task_.id = "t_1700000000000_42_1_beef";
        sample_task_.submitter_id = 42;
        sample_task_.submitter_label = "alice";
        sample_task_.source_code = "print(1+1)";
        sample_task_.state = TaskState::COMPLETED;
        sample_task_.stdout_text = "2\n";
        sample_task_.exit_code = 0;
        sample_task_.created_at = std::chrono::system_clock::now();
        sample_task_.started_at = sample_task_.created_at + std::chrono::milliseconds(5);
        sample_task_.finished_at = sample_task_.created_at + std::chrono::milliseconds(80);
        sample_task_.duration_seconds = 0.075;
    }

    Task sample_task_;
};

// Test TaskState to string conversion
TEST_F(TaskTest, TaskStateToString) {
    EXPECT_EQ(taskStateToString(TaskState::PENDING), "pending");
    EXPECT_EQ(taskStateToString(TaskState::RUNNING), "running");
    EXPECT_EQ(taskStateToString(TaskState::COMPLETED), "completed");
    EXPECT_EQ(taskStateToString(TaskState::FAILED), "failed");
    EXPECT_EQ(taskStateToString(TaskState::TIMED_OUT), "timed_out");
}

// Test TaskState from string conversion
TEST_F(TaskTest, TaskStateFromString) {
    EXPECT_EQ(taskStateFromString("pending"), TaskState::PENDING);
    EXPECT_EQ(taskStateFromString("running"), TaskState::RUNNING);
    EXPECT_EQ(taskStateFromString("completed"), TaskState::COMPLETED);
    EXPECT_EQ(taskStateFromString("failed"), TaskState::FAILED);
    EXPECT_EQ(taskStateFromString("timed_out"), TaskState::TIMED_OUT);
}

TEST_F(TaskTest, TaskStateFromStringInvalid) {
    EXPECT_THROW(taskStateFromString("cancelled"), std::invalid_argument);
    EXPECT_THROW(taskStateFromString(""), std::invalid_argument);
}

TEST_F(TaskTest, IsTerminal) {
    Task task;
    task.state = TaskState::PENDING;
    EXPECT_FALSE(task.isTerminal());
    task.state = TaskState::RUNNING;
    EXPECT_FALSE(task.isTerminal());
    task.state = TaskState::COMPLETED;
    EXPECT_TRUE(task.isTerminal());
    task.state = TaskState::FAILED;
    EXPECT_TRUE(task.isTerminal());
    task.state = TaskState::TIMED_OUT;
    EXPECT_TRUE(task.isTerminal());
}

// Test Task JSON serialization round-trip
TEST_F(TaskTest, JsonRoundTrip) {
    Task restored = Task::fromJson(sample_task_.toJson());
    EXPECT_EQ(restored, sample_task_);
}

// Pending tasks carry no exit code and no start/finish times
TEST_F(TaskTest, JsonRoundTripPendingTask) {
    Task pending;
    pending.id = "t_1_1_1_0000";
    pending.submitter_id = -5;
    pending.source_code = "x = 1";
    pending.created_at = std::chrono::system_clock::now();

    Task restored = Task::fromJson(pending.toJson());

    EXPECT_EQ(restored, pending);
    EXPECT_FALSE(restored.exit_code.has_value());
    EXPECT_FALSE(restored.started_at.has_value());
    EXPECT_FALSE(restored.finished_at.has_value());
}

TEST_F(TaskTest, FromJsonInvalidThrows) {
    EXPECT_THROW(Task::fromJson("{invalid"), SnipqException);
    EXPECT_THROW(Task::fromJson(R"({"id": "x"})"), SnipqException);
    EXPECT_THROW(Task::fromJson(
        R"({"id": "x", "submitter_id": 1, "state": "bogus", "created_at": "2024-01-01T00:00:00.000Z"})"),
        SnipqException);
}

// ========== Timestamps ==========

TEST_F(TaskTest, FormatTimestampIsUtcWithMillis) {
    auto tp = std::chrono::system_clock::from_time_t(0) + std::chrono::milliseconds(1500);
    EXPECT_EQ(formatTimestamp(tp), "1970-01-01T00:00:01.500Z");
}

TEST_F(TaskTest, ParseTimestamp) {
    auto tp = parseTimestamp("1970-01-01T00:00:01.500Z");
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    EXPECT_EQ(ms.count(), 1500);

    EXPECT_THROW(parseTimestamp("yesterday"), std::runtime_error);
}

// ========== Task Ids ==========

TEST_F(TaskTest, GenerateTaskIdIsUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(generateTaskId(42));
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST_F(TaskTest, GenerateTaskIdFormat) {
    std::string id = generateTaskId(123456);

    EXPECT_EQ(id.rfind("t_", 0), 0u);
    // Only the low digits of the user id appear
    EXPECT_NE(id.find("_3456_"), std::string::npos);
    for (char c : id) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)) || c == '_') << id;
    }
}

// ========== Code Fences ==========

TEST_F(TaskTest, StripCodeFenceWithLanguageTag) {
    EXPECT_EQ(stripCodeFence("```python\nprint(1)\n```"), "print(1)");
    EXPECT_EQ(stripCodeFence("  ```py\nx = 1\ny = 2\n```  \n"), "x = 1\ny = 2");
}

TEST_F(TaskTest, StripCodeFenceSingleLine) {
    EXPECT_EQ(stripCodeFence("```print(2)```"), "print(2)");
}

TEST_F(TaskTest, StripCodeFenceLeavesPlainCode) {
    EXPECT_EQ(stripCodeFence("  print(3)\n"), "print(3)");
    // An opening fence alone is not stripped
    EXPECT_EQ(stripCodeFence("```python\nprint(4)"), "```python\nprint(4)");
    EXPECT_EQ(stripCodeFence("````"), "````");
}

// ========== Display Truncation ==========

TEST_F(TaskTest, TruncateForDisplayShortTextUnchanged) {
    EXPECT_EQ(truncateForDisplay("hello", 10), "hello");
    EXPECT_EQ(truncateForDisplay("hello", 5), "hello");
}

TEST_F(TaskTest, TruncateForDisplayAddsMarker) {
    std::string out = truncateForDisplay(std::string(600, 'a'), 500);

    EXPECT_EQ(out.substr(0, 500), std::string(500, 'a'));
    EXPECT_EQ(out.substr(500), "\n... [truncated 100 bytes]");
}

TEST_F(TaskTest, TruncateForDisplayKeepsUtf8Whole) {
    // "é" is two bytes; a budget of 2 would split the second one
    std::string text = "a\xC3\xA9" "bcd";
    std::string out = truncateForDisplay(text, 2);

    EXPECT_EQ(out.substr(0, 1), "a");
    EXPECT_NE(out.find("[truncated 5 bytes]"), std::string::npos);
}

} // namespace testing
} // namespace snipq
