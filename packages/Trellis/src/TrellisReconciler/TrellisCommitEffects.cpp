#include "TrellisReconciler/TrellisCommitEffects.h"

#include "TrellisReconciler/TrellisErrorLogger.h"

#include <exception>
#include <utility>

namespace trellis {

namespace {

void commitHookEffectUnmount(Hook& hook) {
  if (!hook.effect.destroy) {
    return;
  }
  EffectCleanup destroy = std::move(hook.effect.destroy);
  hook.effect.destroy = nullptr;
  destroy();
}

void commitHookEffectMount(Hook& hook) {
  if (!hook.effect.create) {
    return;
  }
  hook.effect.destroy = hook.effect.create();
}

} // namespace

void commitHookEffect(Hook& hook) {
  commitHookEffectUnmount(hook);
  commitHookEffectMount(hook);
}

std::size_t commitPassiveEffects(const IdentityPathTable& paths, const std::vector<PendingEffect>& effects) {
  std::size_t failed = 0;
  for (const auto& pending : effects) {
    auto hook = pending.hook.lock();
    if (!hook || hook->kind != HookKind::Effect) {
      continue;
    }
    try {
      commitHookEffect(*hook);
    } catch (const std::exception& error) {
      ++failed;
      logCaughtEffectError(pending.componentName, paths.describe(pending.path), error);
    } catch (...) {
      ++failed;
      logCaughtEffectError(pending.componentName, paths.describe(pending.path));
    }
  }
  return failed;
}

} // namespace trellis
