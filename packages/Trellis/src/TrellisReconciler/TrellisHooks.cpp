#include "TrellisReconciler/TrellisHooks.h"

#include "TrellisReconciler/TrellisErrorLogger.h"
#include "shared/TrellisErrors.h"
#include "shared/TrellisFeatureFlags.h"

#include <exception>
#include <utility>

namespace trellis {

namespace {

thread_local HookStore* currentHookStore = nullptr;

} // namespace

HookStore::HookStore(const IdentityPathTable& paths) : paths_(paths) {}

void HookStore::setUpdateRequestHandler(UpdateRequestHandler handler) {
  onUpdateRequest_ = std::move(handler);
}

void HookStore::requestUpdate() {
  if (onUpdateRequest_) {
    onUpdateRequest_();
  }
}

void HookStore::beginPass() {
  for (auto& [path, record] : records_) {
    (void)path;
    record.cursor = 0;
  }
  reachable_.clear();
  componentStack_.clear();
  pendingEffects_.clear();
}

void HookStore::enterComponent(PathToken path, const std::string& componentName) {
  auto& record = records_[path];
  record.cursor = 0;
  record.componentName = componentName;
  reachable_.insert(path);
  componentStack_.push_back(path);
}

void HookStore::exitComponent(bool validate) {
  if (componentStack_.empty()) {
    throw std::logic_error("exitComponent called without a matching enterComponent");
  }
  const PathToken path = componentStack_.back();
  componentStack_.pop_back();
  if (!validate) {
    return;
  }

  auto it = records_.find(path);
  if (it == records_.end()) {
    return;
  }
  auto& record = it->second;
  if (enableHookCountValidation && record.didRender && record.cursor < record.hooks.size()) {
    throw HookOrderError(
        "Rendered fewer hooks than expected at " + paths_.describe(path) + " (" + std::to_string(record.cursor) +
        " of " + std::to_string(record.hooks.size()) + "). This may be caused by an accidental early return.");
  }
  record.didRender = true;
}

PathToken HookStore::getCurrentPath() const {
  if (componentStack_.empty()) {
    return InvalidPathToken;
  }
  return componentStack_.back();
}

HookStore::Slot HookStore::useHookSlot(HookKind kind) {
  if (componentStack_.empty()) {
    throw InvalidHookCallError();
  }
  const PathToken path = componentStack_.back();
  auto& record = records_[path];

  if (record.cursor < record.hooks.size()) {
    HookPtr hook = record.hooks[record.cursor];
    if (enableHookKindValidation && hook->kind != kind) {
      throw HookOrderError(
          "Hook " + std::to_string(record.cursor) + " at " + paths_.describe(path) + " was created by " +
          getHookKindName(hook->kind) + " but is now called as " + getHookKindName(kind) + ".");
    }
    ++record.cursor;
    return Slot{std::move(hook), false};
  }

  if (enableHookCountValidation && record.didRender) {
    throw HookOrderError("Rendered more hooks than during the previous render.");
  }

  auto hook = std::make_shared<Hook>();
  hook->kind = kind;
  record.hooks.push_back(hook);
  ++record.cursor;
  return Slot{std::move(hook), true};
}

void HookStore::enqueueEffect(const HookPtr& hook) {
  const PathToken path = getCurrentPath();
  std::string componentName;
  auto it = records_.find(path);
  if (it != records_.end()) {
    componentName = it->second.componentName;
  }
  pendingEffects_.push_back(PendingEffect{hook, path, std::move(componentName)});
}

void HookStore::migrate(PathToken from, PathToken to) {
  if (from == to) {
    return;
  }
  auto it = records_.find(from);
  if (it == records_.end()) {
    return;
  }
  if (records_.find(to) != records_.end()) {
    throw std::logic_error(
        "Cannot migrate hook state from " + paths_.describe(from) + " to occupied path " + paths_.describe(to));
  }
  PathRecord record = std::move(it->second);
  records_.erase(it);
  records_.emplace(to, std::move(record));

  if (reachable_.erase(from) != 0) {
    reachable_.insert(to);
  }
}

void HookStore::runCleanups(PathRecord& record, PathToken path) {
  for (const auto& hook : record.hooks) {
    if (hook->kind != HookKind::Effect || !hook->effect.destroy) {
      continue;
    }
    EffectCleanup destroy = std::move(hook->effect.destroy);
    hook->effect.destroy = nullptr;
    try {
      destroy();
    } catch (const std::exception& error) {
      logCaughtEffectError(record.componentName, paths_.describe(path), error);
    } catch (...) {
      logCaughtEffectError(record.componentName, paths_.describe(path));
    }
  }
}

void HookStore::releasePath(PathToken path) {
  auto it = records_.find(path);
  if (it == records_.end()) {
    return;
  }
  PathRecord record = std::move(it->second);
  records_.erase(it);
  reachable_.erase(path);
  runCleanups(record, path);
}

void HookStore::releaseAll() {
  std::vector<PathToken> paths;
  paths.reserve(records_.size());
  for (const auto& [path, record] : records_) {
    (void)record;
    paths.push_back(path);
  }
  for (PathToken path : paths) {
    releasePath(path);
  }
  pendingEffects_.clear();
}

std::size_t HookStore::collectGarbage() {
  std::vector<PathToken> unreachable;
  for (const auto& [path, record] : records_) {
    (void)record;
    if (reachable_.count(path) == 0) {
      unreachable.push_back(path);
    }
  }
  for (PathToken path : unreachable) {
    releasePath(path);
  }
  return unreachable.size();
}

std::vector<PendingEffect> HookStore::takePendingEffects() {
  std::vector<PendingEffect> effects = std::move(pendingEffects_);
  pendingEffects_.clear();
  return effects;
}

bool HookStore::hasPath(PathToken path) const {
  return records_.find(path) != records_.end();
}

bool HookStore::isReachable(PathToken path) const {
  return reachable_.count(path) != 0;
}

std::size_t HookStore::getSlotCount(PathToken path) const {
  auto it = records_.find(path);
  return it == records_.end() ? 0 : it->second.hooks.size();
}

HookInvocationScope::HookInvocationScope(HookStore& store, PathToken path, const std::string& componentName)
    : store_(store), previous_(currentHookStore) {
  store_.enterComponent(path, componentName);
  currentHookStore = &store_;
}

HookInvocationScope::~HookInvocationScope() {
  if (!active_) {
    return;
  }
  currentHookStore = previous_;
  store_.exitComponent(false);
}

void HookInvocationScope::complete() {
  if (!active_) {
    return;
  }
  active_ = false;
  currentHookStore = previous_;
  store_.exitComponent(true);
}

HookStore& getCurrentHookStore() {
  if (currentHookStore == nullptr) {
    throw InvalidHookCallError();
  }
  return *currentHookStore;
}

bool areHookInputsEqual(const DependencyList& nextDeps, const DependencyList& prevDeps) {
  if (nextDeps.size() != prevDeps.size()) {
    return false;
  }
  for (std::size_t index = 0; index < nextDeps.size(); ++index) {
    if (!Value::sameValue(nextDeps[index], prevDeps[index])) {
      return false;
    }
  }
  return true;
}

namespace detail {

void commitState(const std::weak_ptr<HookStore>& store, const std::weak_ptr<Hook>& hook, Value next) {
  auto lockedStore = store.lock();
  auto lockedHook = hook.lock();
  if (!lockedStore || !lockedHook) {
    return;
  }
  if (Value::sameValue(lockedHook->state, next)) {
    return;
  }
  lockedHook->state = std::move(next);
  lockedStore->requestUpdate();
}

void useEffectImpl(EffectCallback create, std::optional<DependencyList> deps) {
  HookStore& store = getCurrentHookStore();
  auto slot = store.useHookSlot(HookKind::Effect);
  auto& effect = slot.hook->effect;

  const bool shouldRun = slot.isNew || !deps || !effect.deps || !areHookInputsEqual(*deps, *effect.deps);
  if (!shouldRun) {
    return;
  }

  effect.create = std::move(create);
  effect.deps = std::move(deps);
  store.enqueueEffect(slot.hook);
}

} // namespace detail

Value useCallback(Value callback, DependencyList deps) {
  return useMemo([&callback]() { return callback; }, std::move(deps));
}

Value useAutoCallback(Value callback) {
  auto latest = useRef<Value>(Value::undefined());
  latest->current = std::move(callback);
  return useCallback(
      Value::function([latest](const std::vector<Value>& arguments) { return latest->current.call(arguments); }),
      {});
}

} // namespace trellis
