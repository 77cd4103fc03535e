#pragma once

#include <exception>
#include <string>

namespace trellis {

// Reports an exception thrown by an effect body or cleanup without stopping the flush.
void logCaughtEffectError(const std::string& componentName, const std::string& path, const std::exception& error);
// Same, for a thrown value that is not a std::exception.
void logCaughtEffectError(const std::string& componentName, const std::string& path);

// Traces a reconciler step to std::clog when enableReconcilerTracing is set.
void logReconcilerStep(const char* step, const std::string& path, const std::string& detail = {});

} // namespace trellis
