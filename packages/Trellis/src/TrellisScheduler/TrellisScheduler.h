#pragma once

#include "TrellisScheduler/Scheduler.h"

#include <cstddef>
#include <cstdint>
#include <deque>

namespace trellis {

struct SchedulerTask {
  std::uint64_t id{0};
  Task callback{};
};

/**
 * Cooperative single-threaded FIFO scheduler. Each runNextTask call is one
 * tick; flushWork drains the queue, including tasks scheduled while flushing.
 */
class TrellisScheduler : public Scheduler {
public:
  TrellisScheduler() = default;
  ~TrellisScheduler() override = default;

  TaskHandle scheduleTask(Task task) override;
  void cancelTask(TaskHandle handle) override;
  [[nodiscard]] bool hasPendingWork() const override;

  // Runs the oldest live task. Returns false when the queue was empty.
  bool runNextTask();

  // Runs tasks until the queue is empty. Throws std::runtime_error after
  // maxTasks tasks. An exception thrown by a task propagates after that task
  // is dequeued; the remaining tasks stay queued.
  std::size_t flushWork(std::size_t maxTasks);
  std::size_t flushWork();

  [[nodiscard]] std::size_t getPendingTaskCount() const;
  [[nodiscard]] bool isPerformingWork() const noexcept {
    return isPerformingWork_;
  }

private:
  void dropCancelledTasks();

  std::deque<SchedulerTask> taskQueue_{};
  std::uint64_t nextTaskId_{1};
  bool isPerformingWork_{false};
};

} // namespace trellis
