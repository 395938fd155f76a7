#include "bluos/process_runner.h"

#include "bluos/errors.h"
#include "log.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace bluos
{

namespace
{

class PipePair
{
public:
  PipePair() : fds_{-1, -1} {}
  ~PipePair()
  {
    close_read();
    close_write();
  }

  bool open() { return pipe(fds_) == 0; }
  int read_end() const { return fds_[0]; }
  int write_end() const { return fds_[1]; }

  void close_read()
  {
    if (fds_[0] >= 0)
      close(fds_[0]);
    fds_[0] = -1;
  }
  void close_write()
  {
    if (fds_[1] >= 0)
      close(fds_[1]);
    fds_[1] = -1;
  }

private:
  int fds_[2];
};

int reap(pid_t pid, bool kill_first)
{
  if (kill_first)
    kill(pid, SIGKILL);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0)
  {
    if (errno != EINTR)
      return -1;
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  return -1;
}

} // namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout)
{
  if (argv.empty())
    throw ValidationError("empty command line");

  PipePair out;
  if (!out.open())
  {
    throw TransportError(ErrorKind::ConnectionFailed, std::string("pipe failed: ") + std::strerror(errno));
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, out.write_end(), STDOUT_FILENO);
  posix_spawn_file_actions_addclose(&actions, out.read_end());
  posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  if (rc != 0)
  {
    throw TransportError(ErrorKind::ConnectionFailed,
                         "cannot start " + argv[0] + ": " + std::strerror(rc));
  }
  out.close_write();

  LOG("Started " << argv[0] << " (pid " << pid << ")");

  ProcessResult result;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  char buffer[4096];
  bool eof = false;

  while (!eof)
  {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0)
    {
      result.timed_out = true;
      break;
    }

    struct pollfd pfd = {};
    pfd.fd = out.read_end();
    pfd.events = POLLIN;
    int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0)
    {
      if (errno == EINTR)
        continue;
      LOG("poll on " << argv[0] << " output failed: " << std::strerror(errno));
      break;
    }
    if (ready == 0)
      continue;

    ssize_t n = read(out.read_end(), buffer, sizeof(buffer));
    if (n < 0)
    {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      break;
    }
    if (n == 0)
    {
      eof = true;
      break;
    }

    size_t room = max_output_ - result.output.size();
    if (static_cast<size_t>(n) > room)
    {
      result.output.append(buffer, room);
      result.truncated = true;
      LOG("Output of " << argv[0] << " exceeds " << max_output_ << " bytes, stopping");
      break;
    }
    result.output.append(buffer, static_cast<size_t>(n));
  }

  out.close_read();
  result.exit_status = reap(pid, !eof);
  if (result.timed_out)
  {
    LOG(argv[0] << " still running after " << timeout.count() << "ms, killed");
  }
  return result;
}

} // namespace bluos
