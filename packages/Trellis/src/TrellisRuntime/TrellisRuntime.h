#pragma once

#include "TrellisReconciler/TrellisRootScheduler.h"
#include "TrellisRuntime/TrellisHostInterface.h"
#include "TrellisRuntime/TrellisJSXRuntime.h"
#include "TrellisScheduler/TrellisScheduler.h"

#include <cstddef>
#include <memory>
#include <unordered_map>

namespace trellis {

/**
 * Entry point for embedders. Owns the render target, the task scheduler and
 * one TrellisRoot per container node.
 */
class TrellisRuntime {
public:
  TrellisRuntime();
  explicit TrellisRuntime(std::shared_ptr<HostInterface> hostInterface);
  ~TrellisRuntime();

  TrellisRuntime(const TrellisRuntime&) = delete;
  TrellisRuntime& operator=(const TrellisRuntime&) = delete;

  // Only allowed before the first mount.
  void setHostInterface(std::shared_ptr<HostInterface> hostInterface);
  [[nodiscard]] HostInterface& getHostInterface();

  // Creates the root of container on first use, then schedules a render of element into it.
  std::shared_ptr<TrellisRoot> mount(ElementPtr element, const HostInstancePtr& container);

  // Unmounts and forgets the root of container. Returns false when container has no root.
  bool unmount(const HostInstancePtr& container);

  [[nodiscard]] std::shared_ptr<TrellisRoot> getRoot(const HostInstancePtr& container) const;
  [[nodiscard]] std::size_t getRegisteredRootCount() const;

  TaskHandle scheduleTask(Task task);
  void cancelTask(TaskHandle handle);
  [[nodiscard]] TrellisScheduler& getScheduler() noexcept {
    return scheduler_;
  }

  // Runs scheduled renders and effect flushes until no work remains.
  void flushAllTasksForTest();

private:
  std::shared_ptr<HostInterface> ensureHostInterface();

  std::shared_ptr<HostInterface> hostInterface_{};
  TrellisScheduler scheduler_{};
  std::unordered_map<const HostInstance*, std::shared_ptr<TrellisRoot>> registeredRoots_{};
};

} // namespace trellis
