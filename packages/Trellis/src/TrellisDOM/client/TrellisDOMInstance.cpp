#include "TrellisDOM/client/TrellisDOMInstance.h"

namespace trellis {

std::shared_ptr<TrellisDOMInstance> TrellisDOMInstance::getParent() const {
  return parent_.lock();
}

void TrellisDOMInstance::setParent(const std::shared_ptr<TrellisDOMInstance>& parent) {
  parent_ = parent;
}

void TrellisDOMInstance::clearParent() {
  parent_.reset();
}

} // namespace trellis
