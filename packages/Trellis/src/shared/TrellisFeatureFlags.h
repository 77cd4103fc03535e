#pragma once

#include <cstddef>

namespace trellis {

// Feature flags for reconciler and scheduler behavior

// Reject sibling lists that repeat a key instead of silently dropping siblings
inline constexpr bool enableDuplicateKeyDetection = true;

// Tag every hook slot with the hook kind that created it and reject mismatches
inline constexpr bool enableHookKindValidation = true;

// Reject renders that call more or fewer hooks than the previous render of the same path
inline constexpr bool enableHookCountValidation = true;

// Write mount/update/unmount/move lines to std::clog
inline constexpr bool enableReconcilerTracing = false;

// Consecutive renders requested from effect flushes before the root gives up
inline constexpr std::size_t maxNestedUpdateCount = 50;

// Upper bound on tasks executed by a single TrellisScheduler::flushWork call
inline constexpr std::size_t maxTasksPerFlush = 10000;

// Name of the root slot when identity paths are printed
inline constexpr const char* rootPathName = "0";

} // namespace trellis
