#pragma once

#include "TrellisReconciler/TrellisHookTypes.h"
#include "TrellisReconciler/TrellisIdentityPath.h"

#include <cstddef>
#include <vector>

namespace trellis {

// Runs the previous cleanup of a queued effect, then its body, keeping the
// cleanup the body returns.
void commitHookEffect(Hook& hook);

/**
 * Drains queued effects in enqueue order. Entries whose slot was released
 * since the pass are skipped. A cleanup or body that throws is reported with
 * the component path and does not stop later entries. Returns the number of
 * entries that threw.
 */
std::size_t commitPassiveEffects(const IdentityPathTable& paths, const std::vector<PendingEffect>& effects);

} // namespace trellis
