#include "TrellisDOM/client/TrellisDOMHostInterface.h"

#include <algorithm>
#include <stdexcept>

namespace trellis {

namespace {

std::shared_ptr<TrellisDOMComponent> requireComponent(const HostInstancePtr& node, const char* operation) {
  auto component = TrellisDOMHostInterface::asComponent(node);
  if (!component) {
    throw std::invalid_argument(std::string(operation) + ": node does not belong to this render target");
  }
  return component;
}

} // namespace

TrellisDOMComponentPtr TrellisDOMHostInterface::asComponent(const HostInstancePtr& node) {
  return std::dynamic_pointer_cast<TrellisDOMComponent>(node);
}

TrellisDOMComponentPtr TrellisDOMHostInterface::createContainer(const std::string& type) {
  return std::make_shared<TrellisDOMComponent>(type);
}

HostInstancePtr TrellisDOMHostInterface::createHostNode(const std::string& type) {
  auto component = std::make_shared<TrellisDOMComponent>(type);
  ++counters_.createdNodes;
  record("create " + component->debugDescription());
  return component;
}

HostInstancePtr TrellisDOMHostInterface::createTextNode(const std::string& text) {
  auto component = std::make_shared<TrellisDOMComponent>("#text", true, text);
  ++counters_.createdNodes;
  record("create " + component->debugDescription());
  return component;
}

void TrellisDOMHostInterface::setTextContent(const HostInstancePtr& node, const std::string& text) {
  auto component = requireComponent(node, "setTextContent");
  component->setTextContent(text);
  ++counters_.textUpdates;
  record("text " + component->debugDescription());
}

void TrellisDOMHostInterface::setProperty(
    const HostInstancePtr& node,
    const std::string& name,
    const Value& value) {
  auto component = requireComponent(node, "setProperty");
  component->setProp(name, value);
  ++counters_.propertyUpdates;
  record("set " + component->debugDescription() + " " + name + "=" + value.toString());
}

void TrellisDOMHostInterface::removeProperty(const HostInstancePtr& node, const std::string& name) {
  auto component = requireComponent(node, "removeProperty");
  component->removeProp(name);
  ++counters_.propertyUpdates;
  record("unset " + component->debugDescription() + " " + name);
}

void TrellisDOMHostInterface::detachFromParent(const std::shared_ptr<TrellisDOMInstance>& child) {
  if (!child) {
    return;
  }
  auto currentParent = asComponent(child->getParent());
  if (!currentParent) {
    return;
  }
  auto& siblings = currentParent->children;
  siblings.erase(
      std::remove_if(
          siblings.begin(),
          siblings.end(),
          [&](const std::shared_ptr<TrellisDOMInstance>& candidate) {
            return candidate.get() == child.get();
          }),
      siblings.end());
  child->clearParent();
}

void TrellisDOMHostInterface::insertBefore(
    const HostInstancePtr& parent,
    const HostInstancePtr& child,
    const HostInstancePtr& beforeChild) {
  auto parentComponent = requireComponent(parent, "insertBefore");
  auto childComponent = requireComponent(child, "insertBefore");
  if (parentComponent->isTextInstance()) {
    throw std::logic_error("insertBefore: text nodes cannot have children");
  }
  if (beforeChild && beforeChild.get() == child.get()) {
    return;
  }

  auto& siblings = parentComponent->children;
  auto findAnchor = [&]() {
    return std::find_if(
        siblings.begin(),
        siblings.end(),
        [&](const std::shared_ptr<TrellisDOMInstance>& candidate) {
          return candidate.get() == beforeChild.get();
        });
  };
  if (beforeChild && findAnchor() == siblings.end()) {
    throw std::logic_error("insertBefore: anchor is not a child of " + parentComponent->debugDescription());
  }

  const bool isMove = childComponent->getParent() != nullptr;
  detachFromParent(childComponent);
  siblings.insert(beforeChild ? findAnchor() : siblings.end(), childComponent);
  childComponent->setParent(parentComponent);

  if (isMove) {
    ++counters_.moves;
    record("move " + childComponent->debugDescription());
  } else {
    ++counters_.insertions;
    record("insert " + childComponent->debugDescription() + " into " + parentComponent->debugDescription());
  }
}

void TrellisDOMHostInterface::removeChild(const HostInstancePtr& parent, const HostInstancePtr& child) {
  auto parentComponent = requireComponent(parent, "removeChild");
  auto childComponent = requireComponent(child, "removeChild");
  if (childComponent->getParent().get() != parentComponent.get()) {
    return;
  }
  detachFromParent(childComponent);
  ++counters_.removals;
  record("remove " + childComponent->debugDescription());
}

void TrellisDOMHostInterface::addEventListener(
    const HostInstancePtr& node,
    const std::string& eventName,
    const Value& listener) {
  auto component = requireComponent(node, "addEventListener");
  component->addListener(eventName, listener);
  ++counters_.listenerUpdates;
  record("listen " + component->debugDescription() + " " + eventName);
}

void TrellisDOMHostInterface::removeEventListener(
    const HostInstancePtr& node,
    const std::string& eventName,
    const Value& listener) {
  auto component = requireComponent(node, "removeEventListener");
  component->removeListener(eventName, listener);
  ++counters_.listenerUpdates;
  record("unlisten " + component->debugDescription() + " " + eventName);
}

HostInstancePtr TrellisDOMHostInterface::getParentNode(const HostInstancePtr& node) const {
  auto component = asComponent(node);
  if (!component) {
    return nullptr;
  }
  return component->getParent();
}

HostInstancePtr TrellisDOMHostInterface::getNextSibling(const HostInstancePtr& node) const {
  auto component = asComponent(node);
  if (!component) {
    return nullptr;
  }
  auto parent = asComponent(component->getParent());
  if (!parent) {
    return nullptr;
  }
  const auto& siblings = parent->children;
  for (std::size_t index = 0; index < siblings.size(); ++index) {
    if (siblings[index].get() == component.get()) {
      return index + 1 < siblings.size() ? siblings[index + 1] : nullptr;
    }
  }
  return nullptr;
}

void TrellisDOMHostInterface::resetCounters() {
  counters_ = DOMMutationCounters{};
  mutationLog_.clear();
}

void TrellisDOMHostInterface::record(std::string entry) {
  mutationLog_.push_back(std::move(entry));
}

} // namespace trellis
