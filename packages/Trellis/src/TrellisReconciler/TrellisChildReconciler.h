#pragma once

#include "TrellisReconciler/TrellisReconciler.h"

#include <cstddef>
#include <vector>

namespace trellis {

// Throws DuplicateKeyError when two elements of one child list share a key.
void validateUniqueKeys(const ReconcilerContext& context, const Children& children, PathToken parentPath);

// Mounts children into owner in order, each before anchor.
void mountChildren(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    Instance& owner,
    const Children& children,
    PathToken parentPath,
    const HostInstancePtr& anchor);

/**
 * Reconciles owner.children against nextChildren. Keyed children match by key;
 * unkeyed ones first by identity path, then by the nearest unmatched unkeyed
 * sibling of the same type (the last slot prefers the last such sibling).
 * Unmatched previous children are unmounted before anything is placed.
 *
 * Children updated in place whose previous order forms the longest increasing
 * run stay where they are; other survivors move only when they are not already
 * directly before their anchor.
 */
void reconcileChildren(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    Instance& owner,
    const Children& nextChildren,
    PathToken parentPath,
    const HostInstancePtr& tailAnchor);

// Indices into sequence of one longest strictly increasing subsequence.
std::vector<std::size_t> longestIncreasingSubsequence(const std::vector<std::size_t>& sequence);

} // namespace trellis
