#pragma once

#include "bluos/device.h"
#include "bluos/errors.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bluos
{

enum class OperationClass
{
  Discovery,
  Command // status and control calls
};

static const size_t DISCOVERY_WORKERS = 10;
static const size_t COMMAND_WORKERS = 20;

template <typename T>
struct Outcome
{
  Device device;
  bool ok = false;
  std::optional<T> value;
  ErrorInfo error;
  int attempts = 0;
  std::chrono::milliseconds elapsed{0};
};

typedef Outcome<std::string> CommandOutcome;

// Fans one operation out to a set of devices on a bounded pool. Every
// device gets exactly one outcome; a failing device never affects the
// others. The call returns once every task has settled.
class Dispatcher
{
public:
  explicit Dispatcher(size_t discovery_workers = DISCOVERY_WORKERS, size_t command_workers = COMMAND_WORKERS);

  size_t ceiling(OperationClass op_class) const;
  size_t pool_size(OperationClass op_class, size_t devices) const;

  // The operation reports how many attempts it made through the second
  // argument. Throws ValidationError for an empty device set.
  template <typename T>
  std::map<std::string, Outcome<T>> dispatch(const std::vector<Device> &devices, OperationClass op_class,
                                             const std::function<T(const Device &, int &)> &operation) const;

  template <typename T>
  std::map<std::string, Outcome<T>> dispatch(const std::vector<Device> &devices, OperationClass op_class,
                                             const std::function<T(const Device &)> &operation) const
  {
    std::function<T(const Device &, int &)> counted = [&operation](const Device &d, int &attempts) {
      attempts = 1;
      return operation(d);
    };
    return dispatch<T>(devices, op_class, counted);
  }

private:
  void run_tasks(std::vector<std::function<void()>> &tasks, size_t workers) const;

  size_t discovery_workers_;
  size_t command_workers_;
};

template <typename T>
std::map<std::string, Outcome<T>> Dispatcher::dispatch(const std::vector<Device> &devices, OperationClass op_class,
                                                       const std::function<T(const Device &, int &)> &operation) const
{
  if (devices.empty())
    throw ValidationError("no devices to dispatch to");

  // Outcomes are created up front; each task writes only its own entry, so
  // the map itself is never modified concurrently.
  std::map<std::string, Outcome<T>> outcomes;
  for (const auto &device : devices)
  {
    if (outcomes.find(device.address) == outcomes.end())
      outcomes[device.address].device = device;
  }

  std::vector<std::function<void()>> tasks;
  tasks.reserve(outcomes.size());
  for (auto &pair : outcomes)
  {
    Outcome<T> *outcome = &pair.second;
    tasks.push_back([outcome, &operation]() {
      auto start = std::chrono::steady_clock::now();
      try
      {
        int attempts = 0;
        outcome->value = operation(outcome->device, attempts);
        outcome->attempts = attempts;
        outcome->ok = true;
      }
      catch (const Error &e)
      {
        outcome->error = to_error_info(e);
        outcome->attempts = e.attempts;
      }
      catch (const std::exception &e)
      {
        outcome->error = ErrorInfo{ErrorKind::Device, e.what()};
      }
      outcome->elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);
    });
  }

  run_tasks(tasks, pool_size(op_class, tasks.size()));
  return outcomes;
}

} // namespace bluos
