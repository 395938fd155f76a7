#pragma once

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>

typedef int socket_t;
#define INVALID_SOCKET_VALUE -1
#define close_socket close

namespace bluos
{

// Owns one descriptor and closes it on scope exit.
class ScopedSocket
{
public:
  explicit ScopedSocket(socket_t fd = INVALID_SOCKET_VALUE) : fd_(fd) {}
  ~ScopedSocket() { reset(); }

  ScopedSocket(const ScopedSocket &) = delete;
  ScopedSocket &operator=(const ScopedSocket &) = delete;

  socket_t get() const { return fd_; }
  bool valid() const { return fd_ != INVALID_SOCKET_VALUE; }

  socket_t release()
  {
    socket_t fd = fd_;
    fd_ = INVALID_SOCKET_VALUE;
    return fd;
  }

  void reset(socket_t fd = INVALID_SOCKET_VALUE)
  {
    if (fd_ != INVALID_SOCKET_VALUE)
      close_socket(fd_);
    fd_ = fd;
  }

private:
  socket_t fd_;
};

} // namespace bluos
