#pragma once

#include "bluos/logging.h"

#include <sstream>
#include <string>

namespace bluos
{
namespace detail
{

bool log_enabled_for(LogLevel level);
void log_write(LogLevel level, const std::string &line);

} // namespace detail
} // namespace bluos

#define BLUOS_LOG_AT(level, msg)                                   \
  do                                                               \
  {                                                                \
    if (::bluos::detail::log_enabled_for(level))                   \
    {                                                              \
      std::ostringstream log_stream;                               \
      log_stream << msg;                                           \
      ::bluos::detail::log_write(level, log_stream.str());         \
    }                                                              \
  } while (0)

#define LOG(msg) BLUOS_LOG_AT(::bluos::LogLevel::Debug, msg)
#define LOG_WARN(msg) BLUOS_LOG_AT(::bluos::LogLevel::Warning, msg)
#define LOG_ERROR(msg) BLUOS_LOG_AT(::bluos::LogLevel::Error, msg)
