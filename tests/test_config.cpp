/**
 * @file test_config.cpp
 * @brief Unit tests for Config class
 *
 * Tests command-line and environment parsing, JSON serialization,
 * validation and path initialization.
 */

#include "snipq/config.h"
#include "snipq/errors.h"
#include "snipq/protocol.h"

#include <gtest/gtest.h>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <map>
#include <unistd.h>

namespace snipq {
namespace {

const char* const ENV_VARS[] = {
    "SNIPQ_TIMEOUT", "SNIPQ_MAX_CODE", "SNIPQ_HISTORY", "SNIPQ_WORKERS",
    "SNIPQ_INTERPRETER", "SNIPQ_SOCKET", "SNIPQ_LOG_DIR", "ADMIN_IDS", "USER",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Save and clear the variables Config reads
        for (const char* name : ENV_VARS) {
            const char* value = std::getenv(name);
            if (value != nullptr) {
                saved_env_[name] = value;
            }
            unsetenv(name);
        }
        setenv("USER", "tester", 1);
    }

    void TearDown() override {
        for (const char* name : ENV_VARS) {
            unsetenv(name);
        }
        for (const auto& entry : saved_env_) {
            setenv(entry.first.c_str(), entry.second.c_str(), 1);
        }
        if (!config_file_.empty()) {
            unlink(config_file_.c_str());
        }
    }

    std::string writeConfigFile(const std::string& content) {
        config_file_ = "/tmp/snipq_config_test_" + std::to_string(getpid()) + ".json";
        std::ofstream out(config_file_);
        out << content;
        return config_file_;
    }

    std::map<std::string, std::string> saved_env_;
    std::string config_file_;
};

// ========== Default Values Tests ==========

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    // Execution
    EXPECT_DOUBLE_EQ(config.execution_timeout_seconds, 45.0);
    EXPECT_EQ(config.interpreter, "python3");
    ASSERT_EQ(config.interpreter_args.size(), 1u);
    EXPECT_EQ(config.interpreter_args[0], "-u");
    EXPECT_EQ(config.source_extension, ".py");
    EXPECT_FALSE(config.merge_output);

    // Submission
    EXPECT_EQ(config.min_code_length, 3u);
    EXPECT_EQ(config.max_code_length, 5000u);

    // Queue and store
    EXPECT_EQ(config.history_capacity, 100u);
    EXPECT_EQ(config.max_stored_tasks, 10000u);
    EXPECT_EQ(config.worker_count, 1);

    // Access
    EXPECT_TRUE(config.admin_ids.empty());
    EXPECT_FALSE(config.enable_logging);
}

TEST_F(ConfigTest, DefaultPathsFromUsername) {
    Config config = Config::fromEnv();

    EXPECT_EQ(config.socket_path, "/tmp/snipq_tester.sock");
    EXPECT_FALSE(config.temp_dir.empty());
}

// ========== Environment Tests ==========

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    setenv("SNIPQ_TIMEOUT", "5", 1);
    setenv("SNIPQ_MAX_CODE", "200", 1);
    setenv("SNIPQ_HISTORY", "7", 1);
    setenv("SNIPQ_WORKERS", "3", 1);
    setenv("SNIPQ_INTERPRETER", "/usr/bin/python3", 1);
    setenv("SNIPQ_SOCKET", "/tmp/custom.sock", 1);
    setenv("ADMIN_IDS", "11, 22,33", 1);

    Config config = Config::fromEnv();

    EXPECT_DOUBLE_EQ(config.execution_timeout_seconds, 5.0);
    EXPECT_EQ(config.max_code_length, 200u);
    EXPECT_EQ(config.history_capacity, 7u);
    EXPECT_EQ(config.worker_count, 3);
    EXPECT_EQ(config.interpreter, "/usr/bin/python3");
    EXPECT_EQ(config.socket_path, "/tmp/custom.sock");
    EXPECT_EQ(config.admin_ids, (std::vector<int64_t>{11, 22, 33}));
}

TEST_F(ConfigTest, LogDirFromEnvironmentEnablesLogging) {
    setenv("SNIPQ_LOG_DIR", "/tmp/snipq_logs", 1);

    Config config = Config::fromEnv();

    EXPECT_TRUE(config.enable_logging);
    EXPECT_EQ(config.log_dir, "/tmp/snipq_logs");
}

TEST_F(ConfigTest, MalformedEnvironmentValueThrows) {
    setenv("SNIPQ_TIMEOUT", "soon", 1);

    try {
        Config::fromEnv();
        FAIL() << "Expected SnipqException";
    } catch (const SnipqException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
    }
}

// ========== Command Line Tests ==========

TEST_F(ConfigTest, FromArgsParsesFlags) {
    const char* argv[] = {
        "snipq", "server",
        "--timeout", "2.5",
        "--workers", "2",
        "--history", "50",
        "--max-code", "100",
        "--admins", "1,2",
        "--socket", "/tmp/flag.sock",
        "--merge-output",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    Config config = Config::fromArgs(argc, const_cast<char**>(argv));

    EXPECT_DOUBLE_EQ(config.execution_timeout_seconds, 2.5);
    EXPECT_EQ(config.worker_count, 2);
    EXPECT_EQ(config.history_capacity, 50u);
    EXPECT_EQ(config.max_code_length, 100u);
    EXPECT_EQ(config.admin_ids, (std::vector<int64_t>{1, 2}));
    EXPECT_EQ(config.socket_path, "/tmp/flag.sock");
    EXPECT_TRUE(config.merge_output);
}

TEST_F(ConfigTest, FlagsOverrideEnvironment) {
    setenv("SNIPQ_WORKERS", "4", 1);

    const char* argv[] = {"snipq", "server", "--workers", "2"};
    Config config = Config::fromArgs(4, const_cast<char**>(argv));

    EXPECT_EQ(config.worker_count, 2);
}

TEST_F(ConfigTest, ConfigFileIsLowestLayer) {
    std::string path = writeConfigFile(
        R"({"execution_timeout_seconds": 10, "history_capacity": 3, "worker_count": 6})");
    setenv("SNIPQ_HISTORY", "9", 1);

    const char* argv[] = {"snipq", "server", "--config", path.c_str(), "--workers", "2"};
    Config config = Config::fromArgs(6, const_cast<char**>(argv));

    EXPECT_DOUBLE_EQ(config.execution_timeout_seconds, 10.0);  // file
    EXPECT_EQ(config.history_capacity, 9u);                     // environment
    EXPECT_EQ(config.worker_count, 2);                          // flag
}

TEST_F(ConfigTest, MissingConfigFileThrows) {
    const char* argv[] = {"snipq", "server", "--config", "/nonexistent/snipq.json"};

    try {
        Config::fromArgs(4, const_cast<char**>(argv));
        FAIL() << "Expected SnipqException";
    } catch (const SnipqException& e) {
        EXPECT_EQ(e.code(), ErrorCode::FILE_NOT_FOUND);
    }
}

TEST_F(ConfigTest, NegativeCountFlagThrows) {
    const char* argv[] = {"snipq", "server", "--history", "-1"};
    EXPECT_THROW(Config::fromArgs(4, const_cast<char**>(argv)), SnipqException);
}

// ========== JSON Tests ==========

TEST_F(ConfigTest, JsonRoundTrip) {
    Config original;
    original.execution_timeout_seconds = 12.5;
    original.interpreter = "/usr/bin/python3";
    original.interpreter_args = {"-u", "-I"};
    original.temp_dir = "/var/tmp";
    original.max_output_bytes = 4096;
    original.worker_count = 3;
    original.admin_ids = {5, 6};
    original.socket_path = "/tmp/x.sock";
    original.run_as_uid = 1000;
    original.run_as_gid = 1000;

    Config restored = Config::fromJson(original.toJson());
    EXPECT_EQ(restored, original);
}

TEST_F(ConfigTest, FromJsonKeepsDefaultsForMissingKeys) {
    Config config = Config::fromJson(R"({"worker_count": 2})");

    EXPECT_EQ(config.worker_count, 2);
    EXPECT_DOUBLE_EQ(config.execution_timeout_seconds, 45.0);
    EXPECT_EQ(config.interpreter, "python3");
}

TEST_F(ConfigTest, FromJsonInvalidThrows) {
    try {
        Config::fromJson("{not json");
        FAIL() << "Expected SnipqException";
    } catch (const SnipqException& e) {
        EXPECT_EQ(e.code(), ErrorCode::FILE_PARSE_ERROR);
    }
}

// ========== Validation Tests ==========

TEST_F(ConfigTest, DefaultsValidate) {
    Config config;
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    Config zero_timeout;
    zero_timeout.execution_timeout_seconds = 0;
    EXPECT_THROW(zero_timeout.validate(), SnipqException);

    Config no_workers;
    no_workers.worker_count = 0;
    EXPECT_THROW(no_workers.validate(), SnipqException);

    Config no_history;
    no_history.history_capacity = 0;
    EXPECT_THROW(no_history.validate(), SnipqException);

    Config inverted;
    inverted.min_code_length = 10;
    inverted.max_code_length = 5;
    EXPECT_THROW(inverted.validate(), SnipqException);

    Config unlimited;
    unlimited.max_code_length = 0;
    EXPECT_NO_THROW(unlimited.validate());
}

// Every task must fit one IPC frame, even with output that needs escaping
TEST_F(ConfigTest, ValidateKeepsTaskWithinFrame) {
    Config config;
    EXPECT_EQ(config.max_output_bytes, 1024u * 1024u);
    EXPECT_LE(Config::worstCaseTaskBytes(config.max_output_bytes, config.max_code_length),
              MAX_PAYLOAD_SIZE);

    Config uncapped;
    uncapped.max_output_bytes = 0;
    try {
        uncapped.validate();
        FAIL() << "Expected SnipqException";
    } catch (const SnipqException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
    }

    Config too_large;
    too_large.max_output_bytes = 4 * 1024 * 1024;
    EXPECT_THROW(too_large.validate(), SnipqException);

    Config huge;
    huge.max_output_bytes = SIZE_MAX / 2;
    EXPECT_THROW(huge.validate(), SnipqException);

    Config long_code;
    long_code.max_code_length = 2 * 1024 * 1024;
    EXPECT_THROW(long_code.validate(), SnipqException);
}

// ========== Helpers ==========

TEST_F(ConfigTest, ParseIdListSkipsMalformedEntries) {
    EXPECT_EQ(Config::parseIdList("1,2,3"), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(Config::parseIdList(" 4 , x, 5,, 6a,-7"), (std::vector<int64_t>{4, 5, -7}));
    EXPECT_TRUE(Config::parseIdList("").empty());
}

TEST_F(ConfigTest, IsAdmin) {
    Config config;
    config.admin_ids = {100, 200};

    EXPECT_TRUE(config.isAdmin(100));
    EXPECT_TRUE(config.isAdmin(200));
    EXPECT_FALSE(config.isAdmin(300));
}

} // anonymous namespace
} // namespace snipq
