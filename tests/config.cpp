#include "config.hpp"
#include <cstdlib>
#include <gtest/gtest.h>
#include <stdexcept>

namespace jobqueue {

namespace {

const char *const kAllVariables[] = {
    "JOBQUEUE_WORKERS",         "JOBQUEUE_HIGH_CAPACITY",      "JOBQUEUE_MEDIUM_CAPACITY",
    "JOBQUEUE_LOW_CAPACITY",    "JOBQUEUE_RETRY_STRATEGY",     "JOBQUEUE_RETRY_BASE_MS",
    "JOBQUEUE_RETRY_MAX_MS",    "JOBQUEUE_RETRY_JITTER",       "JOBQUEUE_DEFAULT_MAX_RETRIES",
    "JOBQUEUE_HANDLER_TIMEOUT_MS", "JOBQUEUE_IDLE_WAIT_MS",    "JOBQUEUE_SHUTDOWN_TIMEOUT_MS",
    "JOBQUEUE_FINISHED_RETENTION_MS",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ClearEnv(); }
    void TearDown() override { ClearEnv(); }

    static void ClearEnv() {
        for (const char *name : kAllVariables) {
            unsetenv(name);
        }
    }
};

}  // namespace

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    auto config = JobQueueConfig::from_env();

    EXPECT_EQ(config.worker_count, 4u);
    EXPECT_EQ(config.retry.strategy, retry::RetryStrategy::Exponential);
    EXPECT_EQ(config.retry.base_delay, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.retry.max_delay, std::chrono::milliseconds(300000));
    EXPECT_FALSE(config.retry.jitter);
    EXPECT_EQ(config.default_max_retries, 3);
    EXPECT_EQ(config.handler_timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(config.shutdown_timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(config.finished_retention, std::chrono::milliseconds(300000));
    ASSERT_EQ(config.lanes.size(), 3u);
    for (const auto &[priority, options] : config.lanes) {
        EXPECT_FALSE(options.bounded) << ToString(priority);
    }
}

TEST_F(ConfigTest, ReadsEnvironment) {
    setenv("JOBQUEUE_WORKERS", "8", 1);
    setenv("JOBQUEUE_LOW_CAPACITY", "50", 1);
    setenv("JOBQUEUE_RETRY_STRATEGY", "linear", 1);
    setenv("JOBQUEUE_RETRY_BASE_MS", "200", 1);
    setenv("JOBQUEUE_RETRY_JITTER", "1", 1);
    setenv("JOBQUEUE_DEFAULT_MAX_RETRIES", "5", 1);
    setenv("JOBQUEUE_IDLE_WAIT_MS", "25", 1);
    setenv("JOBQUEUE_FINISHED_RETENTION_MS", "60000", 1);

    auto config = JobQueueConfig::from_env();

    EXPECT_EQ(config.worker_count, 8u);
    EXPECT_TRUE(config.lanes[TaskPriority::Low].bounded);
    EXPECT_EQ(config.lanes[TaskPriority::Low].capacity, 50);
    EXPECT_FALSE(config.lanes[TaskPriority::High].bounded);
    EXPECT_EQ(config.retry.strategy, retry::RetryStrategy::Linear);
    EXPECT_EQ(config.retry.base_delay, std::chrono::milliseconds(200));
    EXPECT_TRUE(config.retry.jitter);
    EXPECT_EQ(config.default_max_retries, 5);
    EXPECT_EQ(config.idle_wait, std::chrono::milliseconds(25));
    EXPECT_EQ(config.finished_retention, std::chrono::milliseconds(60000));
}

TEST_F(ConfigTest, UnknownStrategyThrows) {
    setenv("JOBQUEUE_RETRY_STRATEGY", "sometimes", 1);
    EXPECT_THROW(JobQueueConfig::from_env(), std::invalid_argument);
}

TEST_F(ConfigTest, EnvBoolAcceptsTrueAndOne) {
    setenv("JOBQUEUE_RETRY_JITTER", "true", 1);
    EXPECT_TRUE(get_env_bool("JOBQUEUE_RETRY_JITTER", false));
    setenv("JOBQUEUE_RETRY_JITTER", "yes", 1);
    EXPECT_FALSE(get_env_bool("JOBQUEUE_RETRY_JITTER", true));
    unsetenv("JOBQUEUE_RETRY_JITTER");
    EXPECT_TRUE(get_env_bool("JOBQUEUE_RETRY_JITTER", true));
}

// Ёмкость 0 или меньше означает неограниченную полосу
TEST(LaneOptionsTest, NonPositiveCapacityIsUnbounded) {
    EXPECT_FALSE(LaneOptions(0).bounded);
    EXPECT_FALSE(LaneOptions(-1).bounded);
    EXPECT_TRUE(LaneOptions(3).bounded);
    EXPECT_EQ(LaneOptions(3).capacity, 3);
}

}  // namespace jobqueue
