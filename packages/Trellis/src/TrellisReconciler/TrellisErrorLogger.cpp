#include "TrellisReconciler/TrellisErrorLogger.h"

#include "shared/TrellisFeatureFlags.h"
#include "shared/TrellisGlobalError.h"

#include <iostream>

namespace trellis {

namespace {

std::string describeEffectOwner(const std::string& componentName, const std::string& path) {
  const std::string name = componentName.empty() ? std::string("Component") : componentName;
  return "Error in effect of <" + name + "> at " + path;
}

} // namespace

void logCaughtEffectError(const std::string& componentName, const std::string& path, const std::exception& error) {
  reportGlobalError(describeEffectOwner(componentName, path) + ": " + error.what());
}

void logCaughtEffectError(const std::string& componentName, const std::string& path) {
  reportGlobalError(describeEffectOwner(componentName, path) + ": unknown exception");
}

void logReconcilerStep(const char* step, const std::string& path, const std::string& detail) {
  if (!enableReconcilerTracing) {
    return;
  }
  std::clog << "[trellis] " << step << " " << path;
  if (!detail.empty()) {
    std::clog << " " << detail;
  }
  std::clog << '\n';
}

} // namespace trellis
