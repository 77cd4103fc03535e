#include "TrellisScheduler/TrellisScheduler.h"

#include "shared/TrellisFeatureFlags.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace trellis {

namespace {

class PerformingWorkScope {
public:
  explicit PerformingWorkScope(bool& flag) : flag_(flag), previous_(flag) {
    flag_ = true;
  }

  ~PerformingWorkScope() {
    flag_ = previous_;
  }

private:
  bool& flag_;
  bool previous_;
};

} // namespace

TaskHandle TrellisScheduler::scheduleTask(Task task) {
  if (!task) {
    return TaskHandle{};
  }
  const std::uint64_t id = nextTaskId_++;
  taskQueue_.push_back(SchedulerTask{id, std::move(task)});
  return TaskHandle{id};
}

void TrellisScheduler::cancelTask(TaskHandle handle) {
  if (!handle) {
    return;
  }
  // Cancelled tasks keep their queue position until they reach the front.
  for (auto& task : taskQueue_) {
    if (task.id == handle.id) {
      task.callback = nullptr;
      break;
    }
  }
}

bool TrellisScheduler::hasPendingWork() const {
  return getPendingTaskCount() != 0;
}

std::size_t TrellisScheduler::getPendingTaskCount() const {
  std::size_t count = 0;
  for (const auto& task : taskQueue_) {
    if (task.callback) {
      ++count;
    }
  }
  return count;
}

void TrellisScheduler::dropCancelledTasks() {
  while (!taskQueue_.empty() && !taskQueue_.front().callback) {
    taskQueue_.pop_front();
  }
}

bool TrellisScheduler::runNextTask() {
  dropCancelledTasks();
  if (taskQueue_.empty()) {
    return false;
  }

  SchedulerTask current = std::move(taskQueue_.front());
  taskQueue_.pop_front();

  PerformingWorkScope scope(isPerformingWork_);
  current.callback();
  return true;
}

std::size_t TrellisScheduler::flushWork(std::size_t maxTasks) {
  std::size_t executed = 0;
  while (hasPendingWork()) {
    if (executed >= maxTasks) {
      throw std::runtime_error(
          "Scheduler flush exceeded " + std::to_string(maxTasks) + " tasks; a render loop is likely");
    }
    if (runNextTask()) {
      ++executed;
    }
  }
  return executed;
}

std::size_t TrellisScheduler::flushWork() {
  return flushWork(maxTasksPerFlush);
}

} // namespace trellis
