#include "TrellisReconciler/TrellisChildReconciler.h"

#include "TrellisReconciler/TrellisHostNodes.h"
#include "shared/TrellisErrors.h"
#include "shared/TrellisFeatureFlags.h"

#include <algorithm>
#include <limits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace trellis {

namespace {

constexpr std::size_t kNoMatch = std::numeric_limits<std::size_t>::max();

std::size_t findUnkeyedMatch(
    const ReconcilerContext& context,
    const std::vector<InstancePtr>& prevChildren,
    const std::vector<bool>& consumed,
    const Element& child,
    std::size_t index,
    std::size_t lastIndex,
    PathToken previousParentPath) {
  const PathToken expectedPath = context.paths.findPositional(previousParentPath, child.type, index);
  for (std::size_t j = 0; expectedPath != InvalidPathToken && j < prevChildren.size(); ++j) {
    if (!consumed[j] && prevChildren[j]->path == expectedPath) {
      return j;
    }
  }

  auto isCandidate = [&](std::size_t j) {
    const auto& prevChild = prevChildren[j];
    return !consumed[j] && !prevChild->key && prevChild->element &&
        isSameElementType(*prevChild->element, child);
  };

  if (index == lastIndex) {
    for (std::size_t j = prevChildren.size(); j > 0; --j) {
      if (isCandidate(j - 1)) {
        return j - 1;
      }
    }
    return kNoMatch;
  }

  std::size_t best = kNoMatch;
  std::size_t bestDistance = kNoMatch;
  for (std::size_t j = 0; j < prevChildren.size(); ++j) {
    if (!isCandidate(j)) {
      continue;
    }
    const std::size_t distance = j > index ? j - index : index - j;
    if (distance < bestDistance) {
      best = j;
      bestDistance = distance;
    }
  }
  return best;
}

// Anchor for slot i: the first host node of the nearest later stable slot that
// currently owns one, or the list's tail anchor.
HostInstancePtr findAnchor(
    const std::vector<InstancePtr>& prevChildren,
    const std::vector<std::size_t>& matches,
    const std::vector<bool>& stable,
    std::size_t index,
    const HostInstancePtr& tailAnchor) {
  for (std::size_t k = index + 1; k < matches.size(); ++k) {
    if (!stable[k]) {
      continue;
    }
    if (auto node = getFirstHostNode(prevChildren[matches[k]])) {
      return node;
    }
  }
  return tailAnchor;
}

void reconcileChildList(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    const std::vector<InstancePtr>& prevChildren,
    const Children& nextChildren,
    std::vector<InstancePtr>& nextInstances,
    PathToken parentPath,
    PathToken previousParentPath,
    const HostInstancePtr& tailAnchor) {
  std::unordered_map<std::string, std::size_t> keyedPrevChildren;
  for (std::size_t j = 0; j < prevChildren.size(); ++j) {
    if (prevChildren[j]->key) {
      keyedPrevChildren.emplace(*prevChildren[j]->key, j);
    }
  }

  // Match every next child to at most one previous child.
  std::vector<bool> consumed(prevChildren.size(), false);
  std::vector<std::size_t> matches(nextChildren.size(), kNoMatch);
  const std::size_t lastIndex = nextChildren.empty() ? 0 : nextChildren.size() - 1;
  for (std::size_t i = 0; i < nextChildren.size(); ++i) {
    const Element& child = *nextChildren[i];
    std::size_t match = kNoMatch;
    if (child.key) {
      auto it = keyedPrevChildren.find(*child.key);
      if (it != keyedPrevChildren.end() && !consumed[it->second]) {
        match = it->second;
      }
    } else {
      match = findUnkeyedMatch(context, prevChildren, consumed, child, i, lastIndex, previousParentPath);
    }
    if (match != kNoMatch) {
      consumed[match] = true;
      matches[i] = match;
    }
  }

  for (std::size_t j = 0; j < prevChildren.size(); ++j) {
    if (!consumed[j]) {
      unmountInstance(context, container, prevChildren[j]);
    }
  }

  // Survivors updated in place whose relative order is unchanged stay put.
  std::vector<std::size_t> inPlaceSlots;
  std::vector<std::size_t> inPlacePrevIndices;
  for (std::size_t i = 0; i < nextChildren.size(); ++i) {
    if (matches[i] != kNoMatch && canUpdateInPlace(*prevChildren[matches[i]], *nextChildren[i])) {
      inPlaceSlots.push_back(i);
      inPlacePrevIndices.push_back(matches[i]);
    }
  }
  std::vector<bool> stable(nextChildren.size(), false);
  for (std::size_t position : longestIncreasingSubsequence(inPlacePrevIndices)) {
    stable[inPlaceSlots[position]] = true;
  }

  for (std::size_t i = 0; i < nextChildren.size(); ++i) {
    const ElementPtr& child = nextChildren[i];
    const PathToken childPath = context.paths.childPath(parentPath, *child, i);
    const HostInstancePtr anchor = findAnchor(prevChildren, matches, stable, i, tailAnchor);

    if (matches[i] == kNoMatch) {
      nextInstances.push_back(mountInstance(context, container, child, childPath, anchor));
      continue;
    }

    const InstancePtr& prevChild = prevChildren[matches[i]];
    if (!canUpdateInPlace(*prevChild, *child)) {
      nextInstances.push_back(reconcile(context, container, prevChild, child, childPath, anchor));
      continue;
    }

    updateInstance(context, container, prevChild, child, childPath, anchor);
    if (!stable[i]) {
      auto nodes = getHostNodes(prevChild);
      if (!areHostNodesPlacedBefore(context.host, container, nodes, anchor)) {
        traceReconcilerStep(context, "move", childPath);
        insertHostNodesBefore(context.host, container, nodes, anchor);
      }
    }
    nextInstances.push_back(prevChild);
  }
}

// Rebuilds a child list whose reconciliation threw: children already reconciled
// this pass, then the previous children that are still mounted. Host nodes are
// put back in that order so the next pass starts from a consistent list.
void restoreChildren(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    Instance& owner,
    const std::vector<InstancePtr>& prevChildren,
    std::vector<InstancePtr> restored,
    const HostInstancePtr& tailAnchor) {
  for (const auto& prevChild : prevChildren) {
    if (!prevChild->released && std::find(restored.begin(), restored.end(), prevChild) == restored.end()) {
      restored.push_back(prevChild);
    }
  }

  HostInstancePtr anchor = tailAnchor;
  for (std::size_t i = restored.size(); i > 0; --i) {
    auto nodes = getHostNodes(restored[i - 1]);
    if (nodes.empty()) {
      continue;
    }
    if (!areHostNodesPlacedBefore(context.host, container, nodes, anchor)) {
      insertHostNodesBefore(context.host, container, nodes, anchor);
    }
    anchor = nodes.front();
  }
  owner.children = std::move(restored);
}

} // namespace

void validateUniqueKeys(const ReconcilerContext& context, const Children& children, PathToken parentPath) {
  if (!enableDuplicateKeyDetection) {
    return;
  }
  std::unordered_set<std::string> seen;
  for (const auto& child : children) {
    if (!child->key) {
      continue;
    }
    if (!seen.insert(*child->key).second) {
      throw DuplicateKeyError(*child->key, context.paths.describe(parentPath));
    }
  }
}

void mountChildren(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    Instance& owner,
    const Children& children,
    PathToken parentPath,
    const HostInstancePtr& anchor) {
  validateUniqueKeys(context, children, parentPath);
  owner.children.clear();
  owner.children.reserve(children.size());
  for (std::size_t index = 0; index < children.size(); ++index) {
    const PathToken childPath = context.paths.childPath(parentPath, *children[index], index);
    owner.children.push_back(mountInstance(context, container, children[index], childPath, anchor));
  }
}

void reconcileChildren(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    Instance& owner,
    const Children& nextChildren,
    PathToken parentPath,
    const HostInstancePtr& tailAnchor) {
  validateUniqueKeys(context, nextChildren, parentPath);

  const PathToken previousParentPath = owner.path;
  std::vector<InstancePtr> prevChildren = std::move(owner.children);
  owner.children.clear();
  std::vector<InstancePtr> nextInstances;
  nextInstances.reserve(nextChildren.size());

  try {
    reconcileChildList(
        context, container, prevChildren, nextChildren, nextInstances, parentPath, previousParentPath, tailAnchor);
  } catch (...) {
    restoreChildren(context, container, owner, prevChildren, std::move(nextInstances), tailAnchor);
    throw;
  }
  owner.children = std::move(nextInstances);
}

std::vector<std::size_t> longestIncreasingSubsequence(const std::vector<std::size_t>& sequence) {
  // tails[k]: index of the smallest tail of an increasing run of length k + 1.
  std::vector<std::size_t> tails;
  std::vector<std::size_t> predecessors(sequence.size(), kNoMatch);
  for (std::size_t i = 0; i < sequence.size(); ++i) {
    auto it = std::lower_bound(
        tails.begin(),
        tails.end(),
        sequence[i],
        [&sequence](std::size_t tailIndex, std::size_t value) { return sequence[tailIndex] < value; });
    if (it != tails.begin()) {
      predecessors[i] = *(it - 1);
    }
    if (it == tails.end()) {
      tails.push_back(i);
    } else {
      *it = i;
    }
  }

  std::vector<std::size_t> result(tails.size());
  std::size_t current = tails.empty() ? kNoMatch : tails.back();
  for (std::size_t k = tails.size(); k > 0; --k) {
    result[k - 1] = current;
    current = predecessors[current];
  }
  return result;
}

} // namespace trellis
