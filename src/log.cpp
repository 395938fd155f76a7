#include "log.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace bluos
{

static std::atomic<bool> g_logging_enabled{false};
static std::atomic<int> g_log_threshold{static_cast<int>(LogLevel::Warning)};
static std::mutex g_log_mutex;

static const char *level_name(LogLevel level)
{
  switch (level)
  {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Off:
    break;
  }
  return "";
}

void enable_logging()
{
  g_logging_enabled.store(true);
  LOG("Logging enabled");
}

void disable_logging()
{
  LOG("Logging disabled");
  g_logging_enabled.store(false);
}

bool is_logging_enabled()
{
  return g_logging_enabled.load();
}

void set_log_threshold(LogLevel level)
{
  g_log_threshold.store(static_cast<int>(level));
}

LogLevel log_threshold()
{
  return static_cast<LogLevel>(g_log_threshold.load());
}

namespace detail
{

bool log_enabled_for(LogLevel level)
{
  if (level == LogLevel::Off)
    return false;
  if (level == LogLevel::Debug)
    return g_logging_enabled.load();
  // Verbose mode shows everything; otherwise honour the threshold.
  return g_logging_enabled.load() || static_cast<int>(level) >= g_log_threshold.load();
}

void log_write(LogLevel level, const std::string &line)
{
  std::lock_guard<std::mutex> log_lock(g_log_mutex);
  auto log_now = std::chrono::system_clock::now();
  std::time_t time_t_val = std::chrono::system_clock::to_time_t(log_now);
  std::tm tm_buf;
  std::cerr << "[BLUOS] ";
  if (localtime_r(&time_t_val, &tm_buf))
  {
    std::cerr << std::put_time(&tm_buf, "%H:%M:%S");
  }
  else
  {
    std::cerr << "??:??:??";
  }
  std::cerr << " " << level_name(level) << " " << line << std::endl;
}

} // namespace detail
} // namespace bluos
