#pragma once

namespace bluos
{

enum class LogLevel
{
  Debug = 0,
  Warning = 1,
  Error = 2,
  Off = 3
};

// Debug output is printed only while logging is enabled. Warnings and errors
// are printed whenever they reach the threshold.
void enable_logging();
void disable_logging();
bool is_logging_enabled();

void set_log_threshold(LogLevel level);
LogLevel log_threshold();

} // namespace bluos
