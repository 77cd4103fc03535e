#pragma once

#include "TrellisReconciler/TrellisHooks.h"
#include "TrellisReconciler/TrellisIdentityPath.h"
#include "TrellisReconciler/TrellisInstance.h"
#include "TrellisRuntime/TrellisHostInterface.h"
#include "TrellisRuntime/TrellisJSXRuntime.h"

namespace trellis {

struct ReconcilerContext {
  HostInterface& host;
  HookStore& hooks;
  IdentityPathTable& paths;
};

/**
 * Brings the subtree rooted at prevInstance in line with nextElement.
 *
 *  - nextElement null: unmounts prevInstance and returns null.
 *  - prevInstance null: mounts nextElement before anchor (null appends).
 *  - type or key changed: unmounts, then mounts a fresh identity.
 *  - otherwise updates prevInstance in place and returns it.
 *
 * Render-target mutations are applied to container as the walk proceeds.
 */
InstancePtr reconcile(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    const InstancePtr& prevInstance,
    const ElementPtr& nextElement,
    PathToken path,
    const HostInstancePtr& anchor);

InstancePtr mountInstance(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    const ElementPtr& element,
    PathToken path,
    const HostInstancePtr& anchor);

// Updates instance to element in place. Moving the instance's host nodes is the caller's job.
void updateInstance(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    const InstancePtr& instance,
    const ElementPtr& element,
    PathToken path,
    const HostInstancePtr& anchor);

// Detaches the instance's top-level host nodes from container and releases the
// hook state of every component below it, parents first.
void unmountInstance(ReconcilerContext& context, const HostInstancePtr& container, const InstancePtr& instance);

[[nodiscard]] bool canUpdateInPlace(const Instance& instance, const Element& element);

void traceReconcilerStep(const ReconcilerContext& context, const char* step, PathToken path);

} // namespace trellis
