#include "TrellisReconciler/TrellisHostNodes.h"

namespace trellis {

void collectHostNodes(const InstancePtr& instance, std::vector<HostInstancePtr>& out) {
  if (!instance) {
    return;
  }
  switch (instance->kind) {
    case InstanceKind::Host:
    case InstanceKind::Text:
      if (instance->hostNode) {
        out.push_back(instance->hostNode);
      }
      return;
    case InstanceKind::Fragment:
    case InstanceKind::Component:
      for (const auto& child : instance->children) {
        collectHostNodes(child, out);
      }
      return;
  }
}

std::vector<HostInstancePtr> getHostNodes(const InstancePtr& instance) {
  std::vector<HostInstancePtr> nodes;
  collectHostNodes(instance, nodes);
  return nodes;
}

HostInstancePtr getFirstHostNode(const InstancePtr& instance) {
  if (!instance) {
    return nullptr;
  }
  switch (instance->kind) {
    case InstanceKind::Host:
    case InstanceKind::Text:
      return instance->hostNode;
    case InstanceKind::Fragment:
    case InstanceKind::Component:
      for (const auto& child : instance->children) {
        if (auto node = getFirstHostNode(child)) {
          return node;
        }
      }
      return nullptr;
  }
  return nullptr;
}

bool areHostNodesPlacedBefore(
    const HostInterface& host,
    const HostInstancePtr& parent,
    const std::vector<HostInstancePtr>& nodes,
    const HostInstancePtr& anchor) {
  for (std::size_t index = 0; index < nodes.size(); ++index) {
    const auto& node = nodes[index];
    if (host.getParentNode(node) != parent) {
      return false;
    }
    const HostInstancePtr expectedNext = index + 1 < nodes.size() ? nodes[index + 1] : anchor;
    if (host.getNextSibling(node) != expectedNext) {
      return false;
    }
  }
  return true;
}

void insertHostNodesBefore(
    HostInterface& host,
    const HostInstancePtr& parent,
    const std::vector<HostInstancePtr>& nodes,
    const HostInstancePtr& anchor) {
  for (const auto& node : nodes) {
    host.insertBefore(parent, node, anchor);
  }
}

std::size_t removeHostNodes(
    HostInterface& host,
    const HostInstancePtr& parent,
    const std::vector<HostInstancePtr>& nodes) {
  std::size_t removed = 0;
  for (const auto& node : nodes) {
    if (host.getParentNode(node) != parent) {
      continue;
    }
    host.removeChild(parent, node);
    ++removed;
  }
  return removed;
}

} // namespace trellis
