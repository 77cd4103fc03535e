#include "shared/TrellisGlobalError.h"

#include <atomic>
#include <iostream>
#include <string>

namespace trellis {

namespace {

std::atomic<std::size_t> reportedErrorCount{0};

void writeErrorMessage(const std::string& message) {
  reportedErrorCount.fetch_add(1);
  std::cerr << "Trellis global error: " << message << std::endl;
}

} // namespace

void reportGlobalError(const std::string& message) {
  writeErrorMessage(message);
}

std::size_t getReportedGlobalErrorCount() {
  return reportedErrorCount.load();
}

} // namespace trellis
