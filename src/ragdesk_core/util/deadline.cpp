#include "ragdesk_core/util/deadline.hpp"

#include <exception>
#include <future>
#include <memory>
#include <thread>

#include "ragdesk_core/errors.hpp"

namespace ragdesk_core {

std::string run_with_deadline(std::function<std::string()> task,
                              std::chrono::milliseconds deadline,
                              const std::string& what) {
  if (deadline.count() <= 0) {
    return task();
  }

  // The promise is shared so an abandoned worker can still complete it safely
  auto promise = std::make_shared<std::promise<std::string>>();
  std::future<std::string> future = promise->get_future();

  std::thread worker([promise, task = std::move(task)]() {
    try {
      promise->set_value(task());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  });
  worker.detach();

  if (future.wait_for(deadline) == std::future_status::timeout) {
    throw TimeoutError(what + " exceeded deadline of " + std::to_string(deadline.count()) + " ms");
  }
  return future.get();
}

}  // namespace ragdesk_core
