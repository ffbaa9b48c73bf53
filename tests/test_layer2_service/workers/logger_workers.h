#pragma once

#include <string>

namespace lockhub::tests::worker::logger
{

int test_basic_logging(const std::string &log_path);
int test_log_level_filtering(const std::string &log_path);
int test_logger_handle_prefix(const std::string &log_path);
int test_multithread_stress(const std::string &log_path);
int test_log_before_init_is_dropped(const std::string &log_path);
int test_config_before_init_panics();
int test_unwritable_logfile_reports_failure();

} // namespace lockhub::tests::worker::logger
