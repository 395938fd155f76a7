#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace bluos
{

static const size_t MAX_PROCESS_OUTPUT = 1024 * 1024;

struct ProcessResult
{
  std::string output;   // stdout as captured, possibly partial
  int exit_status = -1; // -1 when the process was killed
  bool timed_out = false;
  bool truncated = false;
};

// Runs an external program without a shell. Output is untrusted.
class ProcessRunner
{
public:
  virtual ~ProcessRunner() = default;

  // Throws TransportError when the program cannot be started.
  virtual ProcessResult run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) = 0;
};

// posix_spawnp with a pipe on stdout. A process still running at the
// deadline is killed and what it printed so far is returned.
class PosixProcessRunner : public ProcessRunner
{
public:
  explicit PosixProcessRunner(size_t max_output = MAX_PROCESS_OUTPUT) : max_output_(max_output) {}

  ProcessResult run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) override;

private:
  size_t max_output_;
};

} // namespace bluos
