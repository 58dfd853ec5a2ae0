#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace ragdesk_core {

// Runs task on a detached worker thread and waits at most `deadline` for it.
// Throws TimeoutError when the deadline expires; exceptions thrown by the task
// are rethrown on the calling thread. A non-positive deadline runs the task inline.
std::string run_with_deadline(std::function<std::string()> task,
                              std::chrono::milliseconds deadline,
                              const std::string& what);

}  // namespace ragdesk_core
