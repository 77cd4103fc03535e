#pragma once

#include "TrellisReconciler/TrellisHooks.h"
#include "TrellisReconciler/TrellisIdentityPath.h"
#include "TrellisReconciler/TrellisInstance.h"
#include "TrellisRuntime/TrellisHostInterface.h"
#include "TrellisRuntime/TrellisJSXRuntime.h"
#include "TrellisScheduler/Scheduler.h"

#include <cstddef>
#include <memory>

namespace trellis {

/**
 * One mounted tree: its container, element, instance tree, identity paths and
 * hook store. Render passes and effect flushes run as scheduler tasks; update
 * requests made while a pass is pending coalesce into that pass.
 */
class TrellisRoot : public std::enable_shared_from_this<TrellisRoot> {
public:
  static std::shared_ptr<TrellisRoot> create(HostInterface& host, Scheduler& scheduler, HostInstancePtr container);

  TrellisRoot(HostInterface& host, Scheduler& scheduler, HostInstancePtr container);
  ~TrellisRoot();

  TrellisRoot(const TrellisRoot&) = delete;
  TrellisRoot& operator=(const TrellisRoot&) = delete;

  // Replaces the root element and requests a pass.
  void render(ElementPtr element);

  void scheduleUpdate();

  // Runs a render pass if one is pending. Called from the scheduled render task.
  void performRender();

  // Runs the effects queued by the last pass if they have not run yet.
  void flushEffects();

  // Unmounts the tree synchronously and drops pending work. Later calls do nothing.
  void unmount();

  [[nodiscard]] const HostInstancePtr& getContainer() const noexcept {
    return container_;
  }
  [[nodiscard]] const InstancePtr& getRootInstance() const noexcept {
    return rootInstance_;
  }
  [[nodiscard]] const ElementPtr& getElement() const noexcept {
    return element_;
  }
  [[nodiscard]] HookStore& getHookStore() noexcept {
    return *hooks_;
  }
  [[nodiscard]] const IdentityPathTable& getPathTable() const noexcept {
    return *paths_;
  }
  [[nodiscard]] bool isRenderPending() const noexcept {
    return renderPending_;
  }
  [[nodiscard]] bool hasPendingEffects() const noexcept {
    return effectsPending_;
  }
  [[nodiscard]] bool isUnmounted() const noexcept {
    return unmounted_;
  }
  [[nodiscard]] std::size_t getRenderCount() const noexcept {
    return renderCount_;
  }

private:
  void scheduleEffectFlush();
  void cancelScheduledWork();

  HostInterface& host_;
  Scheduler& scheduler_;
  HostInstancePtr container_;
  std::unique_ptr<IdentityPathTable> paths_;
  std::shared_ptr<HookStore> hooks_;
  ElementPtr element_{};
  InstancePtr rootInstance_{};
  TaskHandle renderTask_{};
  TaskHandle effectTask_{};
  bool renderPending_{false};
  bool effectsPending_{false};
  bool isFlushingEffects_{false};
  bool updateRequestedDuringEffects_{false};
  bool unmounted_{false};
  std::size_t nestedUpdateCount_{0};
  std::size_t renderCount_{0};
};

} // namespace trellis
