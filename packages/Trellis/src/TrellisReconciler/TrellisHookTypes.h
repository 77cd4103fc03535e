#pragma once

#include "TrellisReconciler/TrellisIdentityPath.h"
#include "TrellisRuntime/TrellisValue.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

enum class HookKind : std::uint8_t {
  State = 0,
  Effect = 1,
};

inline const char* getHookKindName(HookKind kind) {
  switch (kind) {
    case HookKind::State:
      return "useState";
    case HookKind::Effect:
      return "useEffect";
  }
  return "unknown";
}

using EffectCleanup = std::function<void()>;
using EffectCallback = std::function<EffectCleanup()>;

struct EffectHook {
  EffectCallback create{};
  // Absent means the effect runs after every render.
  std::optional<DependencyList> deps{};
  EffectCleanup destroy{};
};

struct Hook {
  HookKind kind{HookKind::State};
  Value state{};
  EffectHook effect{};
};

using HookPtr = std::shared_ptr<Hook>;

// Effect queued by a render pass, run by the next effect flush.
struct PendingEffect {
  std::weak_ptr<Hook> hook{};
  PathToken path{InvalidPathToken};
  std::string componentName{};
};

} // namespace trellis
