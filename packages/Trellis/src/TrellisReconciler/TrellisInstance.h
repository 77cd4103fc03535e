#pragma once

#include "TrellisReconciler/TrellisIdentityPath.h"
#include "TrellisRuntime/TrellisHostInterface.h"
#include "TrellisRuntime/TrellisJSXRuntime.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

enum class InstanceKind : std::uint8_t {
  Host = 0,
  Text = 1,
  Fragment = 2,
  Component = 3,
};

struct Instance;

using InstancePtr = std::shared_ptr<Instance>;

// Durable record of a mounted subtree. Mutated in place while its element keeps
// the same type and key.
struct Instance {
  InstanceKind kind{InstanceKind::Host};
  // Last element applied to this instance.
  ElementPtr element{};
  // Owned render-target node of Host and Text instances.
  HostInstancePtr hostNode{};
  // Host and Fragment: one per element child. Component: its rendered child, if any.
  std::vector<InstancePtr> children{};
  std::optional<std::string> key{};
  PathToken path{InvalidPathToken};
  // Set once unmounted; a released instance is never reused.
  bool released{false};
};

inline InstanceKind getInstanceKind(const ElementType& type) {
  switch (type.getKind()) {
    case ElementType::Kind::Host:
      return InstanceKind::Host;
    case ElementType::Kind::Text:
      return InstanceKind::Text;
    case ElementType::Kind::Fragment:
      return InstanceKind::Fragment;
    case ElementType::Kind::Component:
      return InstanceKind::Component;
  }
  return InstanceKind::Host;
}

} // namespace trellis
