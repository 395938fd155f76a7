#pragma once

#include <stdexcept>
#include <string>

namespace bluos
{

enum class ErrorKind
{
  Validation,
  Timeout,
  ConnectionFailed,
  ConnectionReset,
  ServerError,
  ResolverFailed,
  CircuitOpen,
  Protocol,
  Device,
  Cache
};

const char *error_kind_name(ErrorKind kind);

// Base of every error raised by the library. The address is the device the
// failure belongs to, empty when the failure is not device scoped.
struct Error : std::runtime_error
{
  ErrorKind kind;
  std::string address;
  int attempts = 0; // filled in by the request executor

  Error(ErrorKind k, const std::string &msg, const std::string &addr = "")
      : std::runtime_error(msg), kind(k), address(addr) {}
};

struct ValidationError : Error
{
  explicit ValidationError(const std::string &msg, const std::string &addr = "")
      : Error(ErrorKind::Validation, msg, addr) {}
};

struct TransportError : Error
{
  int http_status;

  TransportError(ErrorKind k, const std::string &msg, const std::string &addr = "", int status = 0)
      : Error(k, msg, addr), http_status(status) {}
};

struct ProtocolError : Error
{
  explicit ProtocolError(const std::string &msg, const std::string &addr = "")
      : Error(ErrorKind::Protocol, msg, addr) {}
};

struct DeviceError : Error
{
  int http_status;

  DeviceError(const std::string &msg, const std::string &addr = "", int status = 0)
      : Error(ErrorKind::Device, msg, addr), http_status(status) {}
};

struct CacheError : Error
{
  std::string path;

  CacheError(const std::string &msg, const std::string &file)
      : Error(ErrorKind::Cache, msg), path(file) {}
};

// Plain copy of an error for storage inside an outcome.
struct ErrorInfo
{
  ErrorKind kind = ErrorKind::Device;
  std::string message;
};

inline ErrorInfo to_error_info(const Error &e)
{
  return ErrorInfo{e.kind, e.what()};
}

} // namespace bluos
