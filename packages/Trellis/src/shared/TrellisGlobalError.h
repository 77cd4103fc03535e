#pragma once

#include <cstddef>
#include <string>

namespace trellis {

void reportGlobalError(const std::string& message);

// Number of errors reported since the process started. Tests use it to check
// that isolated failures were reported rather than dropped.
[[nodiscard]] std::size_t getReportedGlobalErrorCount();

} // namespace trellis
