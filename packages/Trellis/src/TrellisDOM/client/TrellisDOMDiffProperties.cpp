#include "TrellisDOM/client/TrellisDOMDiffProperties.h"

#include <algorithm>
#include <cctype>

namespace trellis {

namespace {

bool isReservedProp(const std::string& name) {
  return name == "children" || name == "key" || name == "ref";
}

bool isListener(const std::string& name, const Value& value) {
  return isEventProp(name) && value.isFunction();
}

// false, null and undefined leave the attribute unset.
bool isAbsentAttribute(const Value& value) {
  return value.isNullish() || (value.isBool() && !value.getBool());
}

void diffProperty(
    const std::string& name,
    const Value* prevValue,
    const Value& nextValue,
    PropertyUpdatePayload& payload) {
  if (prevValue != nullptr && Value::sameValue(*prevValue, nextValue)) {
    return;
  }

  if (isEventProp(name)) {
    const std::string eventName = getEventName(name);
    if (prevValue != nullptr && prevValue->isFunction()) {
      payload.push_back(PropertyOperation{PropertyOperationKind::RemoveListener, eventName, *prevValue});
    }
    if (nextValue.isFunction()) {
      if (prevValue != nullptr && !prevValue->isFunction() && !isAbsentAttribute(*prevValue)) {
        payload.push_back(PropertyOperation{PropertyOperationKind::RemoveProperty, name, Value::undefined()});
      }
      payload.push_back(PropertyOperation{PropertyOperationKind::AddListener, eventName, nextValue});
      return;
    }
  }

  if (isAbsentAttribute(nextValue)) {
    if (prevValue != nullptr && !isAbsentAttribute(*prevValue) && !isListener(name, *prevValue)) {
      payload.push_back(PropertyOperation{PropertyOperationKind::RemoveProperty, name, Value::undefined()});
    }
    return;
  }
  payload.push_back(PropertyOperation{PropertyOperationKind::SetProperty, name, nextValue});
}

} // namespace

bool isEventProp(const std::string& name) {
  return name.size() > 2 && name[0] == 'o' && name[1] == 'n';
}

std::string getEventName(const std::string& propName) {
  std::string eventName = propName.substr(2);
  std::transform(eventName.begin(), eventName.end(), eventName.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return eventName;
}

PropertyUpdatePayload diffHostProperties(const Props* prevProps, const Props& nextProps) {
  PropertyUpdatePayload payload;

  if (prevProps != nullptr) {
    for (const auto& [name, prevValue] : *prevProps) {
      if (isReservedProp(name) || nextProps.find(name) != nextProps.end()) {
        continue;
      }
      if (isListener(name, prevValue)) {
        payload.push_back(PropertyOperation{PropertyOperationKind::RemoveListener, getEventName(name), prevValue});
      } else if (!isAbsentAttribute(prevValue)) {
        payload.push_back(PropertyOperation{PropertyOperationKind::RemoveProperty, name, Value::undefined()});
      }
    }
  }

  for (const auto& [name, nextValue] : nextProps) {
    if (isReservedProp(name)) {
      continue;
    }
    const Value* prevValue = nullptr;
    if (prevProps != nullptr) {
      auto it = prevProps->find(name);
      if (it != prevProps->end()) {
        prevValue = &it->second;
      }
    }
    diffProperty(name, prevValue, nextValue, payload);
  }

  return payload;
}

void applyHostPropertyUpdates(
    HostInterface& host,
    const HostInstancePtr& node,
    const PropertyUpdatePayload& payload) {
  for (const auto& operation : payload) {
    switch (operation.kind) {
      case PropertyOperationKind::SetProperty:
        host.setProperty(node, operation.name, operation.value);
        break;
      case PropertyOperationKind::RemoveProperty:
        host.removeProperty(node, operation.name);
        break;
      case PropertyOperationKind::AddListener:
        host.addEventListener(node, operation.name, operation.value);
        break;
      case PropertyOperationKind::RemoveListener:
        host.removeEventListener(node, operation.name, operation.value);
        break;
    }
  }
}

} // namespace trellis
