#pragma once

#include <cstdint>
#include <functional>

namespace trellis {

using Task = std::function<void()>;

struct TaskHandle {
  std::uint64_t id{0};

  explicit operator bool() const noexcept {
    return id != 0;
  }
};

/**
 * Abstract task scheduler. A root posts its render passes and effect flushes
 * here; every task runs to completion before the next one starts.
 */
class Scheduler {
public:
  virtual ~Scheduler() = default;

  virtual TaskHandle scheduleTask(Task task) = 0;

  // Cancelling a task that already ran or was never scheduled does nothing.
  virtual void cancelTask(TaskHandle handle) = 0;

  [[nodiscard]] virtual bool hasPendingWork() const = 0;
};

} // namespace trellis
