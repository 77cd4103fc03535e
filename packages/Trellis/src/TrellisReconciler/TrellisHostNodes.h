#pragma once

#include "TrellisReconciler/TrellisInstance.h"
#include "TrellisRuntime/TrellisHostInterface.h"

#include <cstddef>
#include <vector>

namespace trellis {

// Top-level render-target nodes owned by an instance, in document order. A
// Host or Text instance owns exactly its own node; Fragment and Component
// instances own the nodes of their children.
void collectHostNodes(const InstancePtr& instance, std::vector<HostInstancePtr>& out);
std::vector<HostInstancePtr> getHostNodes(const InstancePtr& instance);
HostInstancePtr getFirstHostNode(const InstancePtr& instance);

// True when nodes are children of parent, adjacent, in order, and directly followed by anchor.
bool areHostNodesPlacedBefore(
    const HostInterface& host,
    const HostInstancePtr& parent,
    const std::vector<HostInstancePtr>& nodes,
    const HostInstancePtr& anchor);

void insertHostNodesBefore(
    HostInterface& host,
    const HostInstancePtr& parent,
    const std::vector<HostInstancePtr>& nodes,
    const HostInstancePtr& anchor);

// Detaches the nodes that are still children of parent; returns how many were removed.
std::size_t removeHostNodes(
    HostInterface& host,
    const HostInstancePtr& parent,
    const std::vector<HostInstancePtr>& nodes);

} // namespace trellis
