#include "shared/TrellisErrors.h"

namespace trellis {

DuplicateKeyError::DuplicateKeyError(const std::string& key, const std::string& parentPath)
    : std::logic_error(
          "Encountered two children with the same key '" + key + "' under " + parentPath +
          ". Keys must be unique among siblings."),
      key_(key),
      parentPath_(parentPath) {}

const std::string& DuplicateKeyError::getKey() const noexcept {
  return key_;
}

const std::string& DuplicateKeyError::getParentPath() const noexcept {
  return parentPath_;
}

HookOrderError::HookOrderError(const std::string& message) : std::logic_error(message) {}

InvalidHookCallError::InvalidHookCallError()
    : std::logic_error("Invalid hook call. Hooks can only be called inside the body of a component.") {}

} // namespace trellis
