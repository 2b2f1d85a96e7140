#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include "configs/config_loader.hpp"
#include "test_support.hpp"

using namespace DirectoryHasher;
using namespace DirectoryHasher::Config;

class ConfigLoaderTest : public ::testing::Test {
protected:
    Testing::TemporaryDirectory scratch{"config"};

    std::string write_config(const std::string& content) {
        return scratch.write_file("hash_config.csv", content).string();
    }
};

TEST_F(ConfigLoaderTest, DefaultsAreValid) {
    SystemConfig config;
    std::string error_message;
    EXPECT_TRUE(validate_config(config, error_message)) << error_message;
    EXPECT_FALSE(config.logging.has_sink());
    EXPECT_EQ(config.hashing.algorithm, "md5");
    EXPECT_FALSE(config.operations.reject_live_id_collision);
}

TEST_F(ConfigLoaderTest, LoadsEveryKnownKey) {
    std::string config_path = write_config(
        "# comment line\n"
        "logging.log_file, /tmp/hash.log\n"
        "logging.console_output,true\n"
        "logging.poll_interval_ms,50\n"
        "\n"
        "workers.thread_count,6\n"
        "hashing.algorithm,md5\n"
        "hashing.read_buffer_size,8192\n"
        "operations.reject_live_id_collision,yes\n"
        "unknown.key,ignored\n");

    SystemConfig config;
    ASSERT_TRUE(load_config_from_csv(config, config_path));
    EXPECT_EQ(config.logging.log_file, "/tmp/hash.log");
    EXPECT_TRUE(config.logging.console_output);
    EXPECT_EQ(config.logging.poll_interval_ms, 50);
    EXPECT_EQ(config.workers.thread_count, 6);
    EXPECT_EQ(config.hashing.read_buffer_size, 8192u);
    EXPECT_TRUE(config.operations.reject_live_id_collision);
}

TEST_F(ConfigLoaderTest, MissingFileReportsFailure) {
    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, (scratch.path() / "absent.csv").string()));
}

TEST_F(ConfigLoaderTest, MalformedIntegerThrows) {
    std::string config_path = write_config("workers.thread_count,four\n");
    SystemConfig config;
    EXPECT_THROW(load_config_from_csv(config, config_path), std::invalid_argument);

    config_path = write_config("hashing.read_buffer_size,-1\n");
    EXPECT_THROW(load_config_from_csv(config, config_path), std::invalid_argument);
}

TEST_F(ConfigLoaderTest, ValidationRejectsOutOfRangeValues) {
    std::string error_message;

    SystemConfig bad_poll;
    bad_poll.logging.poll_interval_ms = 0;
    EXPECT_FALSE(validate_config(bad_poll, error_message));
    EXPECT_NE(error_message.find("poll_interval_ms"), std::string::npos);

    SystemConfig bad_threads;
    bad_threads.workers.thread_count = MAX_WORKER_THREADS + 1;
    EXPECT_FALSE(validate_config(bad_threads, error_message));

    SystemConfig bad_algorithm;
    bad_algorithm.hashing.algorithm = "crc32";
    EXPECT_FALSE(validate_config(bad_algorithm, error_message));

    SystemConfig bad_buffer;
    bad_buffer.hashing.read_buffer_size = MIN_READ_BUFFER_SIZE - 1;
    EXPECT_FALSE(validate_config(bad_buffer, error_message));
}

TEST_F(ConfigLoaderTest, EnvironmentVariableSelectsFile) {
    std::string config_path = write_config("workers.thread_count,3\n");
    Testing::ScopedEnvironment environment(CONFIG_PATH_ENVIRONMENT_VARIABLE, config_path);

    SystemConfig config;
    EXPECT_EQ(load_system_config(config), 0);
    EXPECT_EQ(config.workers.thread_count, 3);
}

TEST_F(ConfigLoaderTest, UnsetEnvironmentKeepsDefaults) {
    Testing::ScopedEnvironment environment(CONFIG_PATH_ENVIRONMENT_VARIABLE, "");
    SystemConfig config;
    EXPECT_EQ(load_system_config(config), 0);
    EXPECT_EQ(config.workers.thread_count, 0);
}

TEST_F(ConfigLoaderTest, UnreadableOrMalformedFileFails) {
    SystemConfig config;
    {
        Testing::ScopedEnvironment environment(CONFIG_PATH_ENVIRONMENT_VARIABLE, (scratch.path() / "absent.csv").string());
        EXPECT_EQ(load_system_config(config), 1);
    }
    {
        std::string config_path = write_config("logging.poll_interval_ms,soon\n");
        Testing::ScopedEnvironment environment(CONFIG_PATH_ENVIRONMENT_VARIABLE, config_path);
        EXPECT_EQ(load_system_config(config), 1);
    }
}

TEST(WorkerThreadCountTest, ExplicitCountWins) {
    WorkerConfig worker_config;
    worker_config.thread_count = 5;
    EXPECT_EQ(resolve_worker_thread_count(worker_config), 5);
}

TEST(WorkerThreadCountTest, AutomaticCountIsClamped) {
    WorkerConfig worker_config;
    int resolved_count = resolve_worker_thread_count(worker_config);
    EXPECT_GE(resolved_count, MIN_DEFAULT_WORKER_THREADS);
    EXPECT_LE(resolved_count, MAX_DEFAULT_WORKER_THREADS);
}
