#include "TrellisReconciler/TrellisRootScheduler.h"

#include "TrellisReconciler/TrellisCommitEffects.h"
#include "TrellisReconciler/TrellisReconciler.h"
#include "shared/TrellisFeatureFlags.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace trellis {

namespace {

class FlagScope {
public:
  explicit FlagScope(bool& flag) : flag_(flag), previous_(flag) {
    flag_ = true;
  }

  ~FlagScope() {
    flag_ = previous_;
  }

private:
  bool& flag_;
  bool previous_;
};

} // namespace

std::shared_ptr<TrellisRoot> TrellisRoot::create(
    HostInterface& host,
    Scheduler& scheduler,
    HostInstancePtr container) {
  auto root = std::make_shared<TrellisRoot>(host, scheduler, std::move(container));
  std::weak_ptr<TrellisRoot> weakRoot = root;
  root->hooks_->setUpdateRequestHandler([weakRoot]() {
    if (auto strongRoot = weakRoot.lock()) {
      strongRoot->scheduleUpdate();
    }
  });
  return root;
}

TrellisRoot::TrellisRoot(HostInterface& host, Scheduler& scheduler, HostInstancePtr container)
    : host_(host),
      scheduler_(scheduler),
      container_(std::move(container)),
      paths_(std::make_unique<IdentityPathTable>()),
      hooks_(std::make_shared<HookStore>(*paths_)) {
  if (!container_) {
    throw std::invalid_argument("TrellisRoot requires a container node");
  }
}

TrellisRoot::~TrellisRoot() = default;

void TrellisRoot::render(ElementPtr element) {
  if (unmounted_) {
    throw std::logic_error("Cannot render into a root that was unmounted");
  }
  element_ = std::move(element);
  scheduleUpdate();
}

void TrellisRoot::scheduleUpdate() {
  if (unmounted_ || renderPending_) {
    return;
  }
  renderPending_ = true;
  updateRequestedDuringEffects_ = isFlushingEffects_;

  std::weak_ptr<TrellisRoot> weakRoot = weak_from_this();
  renderTask_ = scheduler_.scheduleTask([weakRoot]() {
    if (auto root = weakRoot.lock()) {
      root->performRender();
    }
  });
}

void TrellisRoot::performRender() {
  renderTask_ = TaskHandle{};
  if (unmounted_ || !renderPending_) {
    return;
  }

  // Effects of the previous pass always run before the next pass starts.
  flushEffects();

  const bool isNestedUpdate = updateRequestedDuringEffects_;
  updateRequestedDuringEffects_ = false;
  renderPending_ = false;

  nestedUpdateCount_ = isNestedUpdate ? nestedUpdateCount_ + 1 : 0;
  if (nestedUpdateCount_ > maxNestedUpdateCount) {
    nestedUpdateCount_ = 0;
    throw std::runtime_error(
        "Maximum update depth exceeded. An effect keeps updating state after every render (" +
        std::to_string(maxNestedUpdateCount) + " nested renders).");
  }

  paths_->beginPass();
  hooks_->beginPass();

  ReconcilerContext context{host_, *hooks_, *paths_};
  try {
    rootInstance_ = reconcile(context, container_, rootInstance_, element_, paths_->getRoot(), nullptr);
  } catch (...) {
    // The tree keeps whatever the pass committed before it threw. Garbage
    // collection waits for a pass that visits every component.
    if (rootInstance_ && rootInstance_->released) {
      rootInstance_ = nullptr;
    }
    if (hooks_->hasPendingEffects()) {
      scheduleEffectFlush();
    }
    throw;
  }

  hooks_->collectGarbage();
  paths_->sweep();
  ++renderCount_;

  if (hooks_->hasPendingEffects()) {
    scheduleEffectFlush();
  }
}

void TrellisRoot::scheduleEffectFlush() {
  effectsPending_ = true;
  std::weak_ptr<TrellisRoot> weakRoot = weak_from_this();
  effectTask_ = scheduler_.scheduleTask([weakRoot]() {
    if (auto root = weakRoot.lock()) {
      root->flushEffects();
    }
  });
}

void TrellisRoot::flushEffects() {
  if (effectTask_) {
    scheduler_.cancelTask(effectTask_);
    effectTask_ = TaskHandle{};
  }
  if (!effectsPending_) {
    return;
  }
  effectsPending_ = false;

  auto effects = hooks_->takePendingEffects();
  FlagScope scope(isFlushingEffects_);
  commitPassiveEffects(*paths_, effects);
}

void TrellisRoot::cancelScheduledWork() {
  if (renderTask_) {
    scheduler_.cancelTask(renderTask_);
    renderTask_ = TaskHandle{};
  }
  if (effectTask_) {
    scheduler_.cancelTask(effectTask_);
    effectTask_ = TaskHandle{};
  }
  renderPending_ = false;
  effectsPending_ = false;
  updateRequestedDuringEffects_ = false;
}

void TrellisRoot::unmount() {
  if (unmounted_) {
    return;
  }
  cancelScheduledWork();
  unmounted_ = true;

  hooks_->takePendingEffects();
  if (rootInstance_) {
    ReconcilerContext context{host_, *hooks_, *paths_};
    unmountInstance(context, container_, rootInstance_);
    rootInstance_ = nullptr;
  }
  hooks_->releaseAll();
  element_ = nullptr;
}

} // namespace trellis
