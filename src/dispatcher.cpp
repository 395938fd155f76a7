#include "bluos/dispatcher.h"

#include "log.h"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

namespace bluos
{

Dispatcher::Dispatcher(size_t discovery_workers, size_t command_workers)
    : discovery_workers_(std::max<size_t>(1, discovery_workers)),
      command_workers_(std::max<size_t>(1, command_workers))
{
}

size_t Dispatcher::ceiling(OperationClass op_class) const
{
  return op_class == OperationClass::Discovery ? discovery_workers_ : command_workers_;
}

size_t Dispatcher::pool_size(OperationClass op_class, size_t devices) const
{
  return std::max<size_t>(1, std::min(ceiling(op_class), devices));
}

void Dispatcher::run_tasks(std::vector<std::function<void()>> &tasks, size_t workers) const
{
  LOG("Dispatching " << tasks.size() << " tasks on " << workers << " workers");
  asio::thread_pool pool(workers);
  for (auto &task : tasks)
  {
    asio::post(pool, task);
  }
  pool.join();
}

} // namespace bluos
