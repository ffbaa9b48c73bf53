/**
 * @file test_logger.cpp
 * @brief Layer 2 tests for the Logger and LoggerHandle.
 *
 * Anything that needs the Logger running is delegated to a worker process so
 * each scenario gets its own Logger lifecycle.
 */
#include "lkh_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "test_process_utils.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace lockhub::tests::helper;
using lockhub::utils::Logger;
using ::testing::HasSubstr;

class LoggerTest : public ::testing::Test
{
  protected:
    TempDir dir_{"logger"};

    std::string LogPath(const std::string &test_name) const
    {
        return (dir_.path() / (test_name + ".log")).string();
    }
};

TEST(LoggerLevelTest, LevelFromStringAcceptsKnownNames)
{
    EXPECT_EQ(Logger::level_from_string("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::level_from_string("DEBUG"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::level_from_string("Info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::level_from_string("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::level_from_string("system"), Logger::Level::L_SYSTEM);
    EXPECT_THROW(Logger::level_from_string("verbose"), std::invalid_argument);
}

TEST(LoggerLevelTest, LevelToStringRoundTripsThroughParser)
{
    for (auto lvl : {Logger::Level::L_TRACE, Logger::Level::L_DEBUG, Logger::Level::L_INFO,
                     Logger::Level::L_WARNING, Logger::Level::L_ERROR, Logger::Level::L_SYSTEM})
    {
        EXPECT_EQ(Logger::level_from_string(Logger::level_to_string(lvl)), lvl);
    }
}

TEST_F(LoggerTest, BasicLogging)
{
    WorkerProcess proc(g_self_exe_path, "logger.test_basic_logging", {LogPath("basic")});
    ASSERT_TRUE(proc.valid());
    proc.wait_for_exit();
    expect_worker_ok(proc);
}

TEST_F(LoggerTest, LogLevelFiltering)
{
    WorkerProcess proc(g_self_exe_path, "logger.test_log_level_filtering", {LogPath("filtering")});
    ASSERT_TRUE(proc.valid());
    proc.wait_for_exit();
    expect_worker_ok(proc);
}

TEST_F(LoggerTest, LoggerHandlePrefixesChannel)
{
    WorkerProcess proc(g_self_exe_path, "logger.test_logger_handle_prefix", {LogPath("handle")});
    ASSERT_TRUE(proc.valid());
    proc.wait_for_exit();
    expect_worker_ok(proc);
}

TEST_F(LoggerTest, MultithreadStress)
{
    WorkerProcess proc(g_self_exe_path, "logger.test_multithread_stress", {LogPath("stress")});
    ASSERT_TRUE(proc.valid());
    proc.wait_for_exit();
    expect_worker_ok(proc);
}

TEST_F(LoggerTest, LogBeforeInitIsDropped)
{
    WorkerProcess proc(g_self_exe_path, "logger.test_log_before_init_is_dropped",
                       {LogPath("before_init")});
    ASSERT_TRUE(proc.valid());
    proc.wait_for_exit();
    expect_worker_ok(proc);
}

TEST_F(LoggerTest, ConfigurationBeforeInitPanics)
{
    WorkerProcess proc(g_self_exe_path, "logger.test_config_before_init_panics", {});
    ASSERT_TRUE(proc.valid());
    ASSERT_NE(proc.wait_for_exit(), 0);
    EXPECT_THAT(proc.get_stderr(), HasSubstr("Logger::set_level"));
    EXPECT_THAT(proc.get_stderr(), HasSubstr("[PANIC]"));
}

TEST_F(LoggerTest, UnwritableLogfileReportsFailure)
{
    WorkerProcess proc(g_self_exe_path, "logger.test_unwritable_logfile_reports_failure", {});
    ASSERT_TRUE(proc.valid());
    ASSERT_EQ(proc.wait_for_exit(), 0) << proc.get_stderr();
}
