#pragma once

#include "TrellisRuntime/TrellisHostInterface.h"
#include "TrellisRuntime/TrellisJSXRuntime.h"

#include <cstdint>
#include <string>
#include <vector>

namespace trellis {

enum class PropertyOperationKind : std::uint8_t {
  SetProperty = 0,
  RemoveProperty = 1,
  AddListener = 2,
  RemoveListener = 3,
};

struct PropertyOperation {
  PropertyOperationKind kind{PropertyOperationKind::SetProperty};
  // Property name, or the event name for listener operations.
  std::string name{};
  Value value{};
};

using PropertyUpdatePayload = std::vector<PropertyOperation>;

// "onClick" -> true. Only meaningful when the prop holds a function.
bool isEventProp(const std::string& name);
// "onClick" -> "click"
std::string getEventName(const std::string& propName);

// Operations turning a node configured with prevProps into one configured with
// nextProps. Pass nullptr for prevProps on mount. Listener removals precede
// additions for the same event.
PropertyUpdatePayload diffHostProperties(const Props* prevProps, const Props& nextProps);

void applyHostPropertyUpdates(
    HostInterface& host,
    const HostInstancePtr& node,
    const PropertyUpdatePayload& payload);

} // namespace trellis
