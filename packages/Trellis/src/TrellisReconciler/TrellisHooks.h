#pragma once

#include "TrellisReconciler/TrellisHookTypes.h"
#include "TrellisReconciler/TrellisIdentityPath.h"
#include "TrellisRuntime/TrellisValue.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace trellis {

/**
 * Persistent hook state of one root: identity path -> ordered hook slots, the
 * per-path call cursor, and the set of paths reached by the current pass.
 *
 * Components see the store only through the hook functions below, which are
 * valid while a HookInvocationScope is active on the calling thread.
 */
class HookStore : public std::enable_shared_from_this<HookStore> {
public:
  using UpdateRequestHandler = std::function<void()>;

  struct Slot {
    HookPtr hook;
    bool isNew{false};
  };

  explicit HookStore(const IdentityPathTable& paths);

  HookStore(const HookStore&) = delete;
  HookStore& operator=(const HookStore&) = delete;

  void setUpdateRequestHandler(UpdateRequestHandler handler);
  void requestUpdate();

  // Resets cursors, the reachability set, the component stack and the effect queue.
  void beginPass();

  void enterComponent(PathToken path, const std::string& componentName);
  // Pops the component entered last; with validate set, checks the number of
  // hooks it called against its previous render.
  void exitComponent(bool validate);

  [[nodiscard]] bool isRendering() const noexcept {
    return !componentStack_.empty();
  }
  [[nodiscard]] PathToken getCurrentPath() const;

  Slot useHookSlot(HookKind kind);
  void enqueueEffect(const HookPtr& hook);

  // Moves the slots, cursor and reachability of `from` to `to`.
  void migrate(PathToken from, PathToken to);

  // Runs the effect cleanups recorded at path and forgets it.
  void releasePath(PathToken path);
  void releaseAll();

  // Releases every path the current pass did not reach. Returns how many were released.
  std::size_t collectGarbage();

  std::vector<PendingEffect> takePendingEffects();

  [[nodiscard]] bool hasPendingEffects() const noexcept {
    return !pendingEffects_.empty();
  }
  [[nodiscard]] bool hasPath(PathToken path) const;
  [[nodiscard]] bool isReachable(PathToken path) const;
  [[nodiscard]] std::size_t getSlotCount(PathToken path) const;
  [[nodiscard]] std::size_t getPathCount() const noexcept {
    return records_.size();
  }

private:
  struct PathRecord {
    std::vector<HookPtr> hooks{};
    std::size_t cursor{0};
    bool didRender{false};
    std::string componentName{};
  };

  void runCleanups(PathRecord& record, PathToken path);

  const IdentityPathTable& paths_;
  std::unordered_map<PathToken, PathRecord> records_{};
  std::unordered_set<PathToken> reachable_{};
  std::vector<PathToken> componentStack_{};
  std::vector<PendingEffect> pendingEffects_{};
  UpdateRequestHandler onUpdateRequest_{};
};

/**
 * Opens the hook invocation window for one component call on this thread.
 * complete() closes it and validates the hook count; a scope destroyed
 * without complete() (the component threw) closes it without validation.
 */
class HookInvocationScope {
public:
  HookInvocationScope(HookStore& store, PathToken path, const std::string& componentName);
  ~HookInvocationScope();

  HookInvocationScope(const HookInvocationScope&) = delete;
  HookInvocationScope& operator=(const HookInvocationScope&) = delete;

  void complete();

private:
  HookStore& store_;
  HookStore* previous_{nullptr};
  bool active_{true};
};

// Store of the component being invoked on this thread. Throws InvalidHookCallError outside a component.
HookStore& getCurrentHookStore();

bool areHookInputsEqual(const DependencyList& nextDeps, const DependencyList& prevDeps);

using DependencyEquals = std::function<bool(const DependencyList& nextDeps, const DependencyList& prevDeps)>;

namespace detail {

void commitState(const std::weak_ptr<HookStore>& store, const std::weak_ptr<Hook>& hook, Value next);

void useEffectImpl(EffectCallback create, std::optional<DependencyList> deps);

template <typename F>
EffectCallback toEffectCallback(F&& fn) {
  using Result = std::invoke_result_t<std::decay_t<F>&>;
  if constexpr (std::is_void_v<Result>) {
    return [fn = std::forward<F>(fn)]() mutable -> EffectCleanup {
      fn();
      return EffectCleanup{};
    };
  } else {
    return [fn = std::forward<F>(fn)]() mutable -> EffectCleanup {
      return EffectCleanup(fn());
    };
  }
}

} // namespace detail

/**
 * Setter returned by useState. Calls are ignored once the slot it belongs to
 * has been released. Copies compare equal when they address the same slot.
 */
template <typename T>
class StateSetter {
public:
  StateSetter() = default;
  StateSetter(std::weak_ptr<HookStore> store, std::weak_ptr<Hook> hook)
      : store_(std::move(store)), hook_(std::move(hook)) {}

  void operator()(T next) const {
    detail::commitState(store_, hook_, Value::from(std::move(next)));
  }

  // Computes the next value from the current one.
  template <typename Updater>
  void update(Updater&& updater) const {
    auto hook = hook_.lock();
    if (!hook) {
      return;
    }
    T current = hook->state.template as<T>();
    (*this)(std::forward<Updater>(updater)(std::move(current)));
  }

  [[nodiscard]] bool isActive() const {
    return !hook_.expired() && !store_.expired();
  }

  friend bool operator==(const StateSetter& a, const StateSetter& b) {
    return !a.hook_.owner_before(b.hook_) && !b.hook_.owner_before(a.hook_);
  }
  friend bool operator!=(const StateSetter& a, const StateSetter& b) {
    return !(a == b);
  }

private:
  std::weak_ptr<HookStore> store_{};
  std::weak_ptr<Hook> hook_{};
};

template <typename T>
std::pair<T, StateSetter<T>> useState(T initialValue) {
  HookStore& store = getCurrentHookStore();
  auto slot = store.useHookSlot(HookKind::State);
  if (slot.isNew) {
    slot.hook->state = Value::from(std::move(initialValue));
  }
  return {slot.hook->state.template as<T>(), StateSetter<T>(store.weak_from_this(), slot.hook)};
}

// Lazy form: the initializer runs on the first render only.
template <
    typename T,
    typename Initializer,
    std::enable_if_t<std::is_invocable_r_v<T, Initializer&>, int> = 0>
std::pair<T, StateSetter<T>> useState(Initializer&& initializer) {
  HookStore& store = getCurrentHookStore();
  auto slot = store.useHookSlot(HookKind::State);
  if (slot.isNew) {
    slot.hook->state = Value::from(static_cast<T>(initializer()));
  }
  return {slot.hook->state.template as<T>(), StateSetter<T>(store.weak_from_this(), slot.hook)};
}

// Runs after every render. The callable may return nothing or a cleanup.
template <typename F>
void useEffect(F&& effect) {
  detail::useEffectImpl(detail::toEffectCallback(std::forward<F>(effect)), std::nullopt);
}

// Runs after the first render and after renders whose dependencies changed.
template <typename F>
void useEffect(F&& effect, DependencyList deps) {
  detail::useEffectImpl(detail::toEffectCallback(std::forward<F>(effect)), std::move(deps));
}

template <typename T>
struct Ref {
  T current;
};

template <typename T>
std::shared_ptr<Ref<T>> useRef(T initialValue) {
  return useState<std::shared_ptr<Ref<T>>>([&initialValue]() {
           return std::make_shared<Ref<T>>(Ref<T>{std::move(initialValue)});
         })
      .first;
}

template <typename T>
struct MemoizedValue {
  T value;
  DependencyList deps;
};

template <typename Factory>
std::invoke_result_t<Factory&> useMemo(
    Factory&& factory,
    DependencyList deps,
    const DependencyEquals& equals = areHookInputsEqual) {
  using T = std::invoke_result_t<Factory&>;
  auto memo = useRef<std::optional<MemoizedValue<T>>>(std::nullopt);
  if (!memo->current || !equals(deps, memo->current->deps)) {
    memo->current = MemoizedValue<T>{factory(), std::move(deps)};
  }
  return memo->current->value;
}

// Keeps the identity of a function value while deps are unchanged.
Value useCallback(Value callback, DependencyList deps);

// Function value with a stable identity that always calls the latest callback.
Value useAutoCallback(Value callback);

} // namespace trellis
