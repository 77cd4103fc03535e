#include "TrellisReconciler/TrellisReconciler.h"

#include "TrellisDOM/client/TrellisDOMDiffProperties.h"
#include "TrellisReconciler/TrellisChildReconciler.h"
#include "TrellisReconciler/TrellisErrorLogger.h"
#include "TrellisReconciler/TrellisHostNodes.h"
#include "shared/TrellisFeatureFlags.h"

#include <stdexcept>
#include <utility>

namespace trellis {

namespace {

constexpr const char* kRefProp = "ref";

std::shared_ptr<HostRef> getHostRef(const Props& props) {
  auto it = props.find(kRefProp);
  if (it == props.end() || !it->second.holds<HostRef>()) {
    return nullptr;
  }
  return it->second.getReference<HostRef>();
}

void attachRef(const Props& props, const HostInstancePtr& node) {
  if (auto ref = getHostRef(props)) {
    ref->current = node;
  }
}

void detachRef(const Props& props, const HostInstancePtr& node) {
  auto ref = getHostRef(props);
  if (ref && ref->current == node) {
    ref->current = nullptr;
  }
}

void updateRef(const Props& prevProps, const Props& nextProps, const HostInstancePtr& node) {
  auto prevRef = getHostRef(prevProps);
  auto nextRef = getHostRef(nextProps);
  if (prevRef == nextRef) {
    return;
  }
  detachRef(prevProps, node);
  attachRef(nextProps, node);
}

ElementPtr renderComponent(ReconcilerContext& context, const Element& element, PathToken path) {
  const auto& definition = element.type.getComponent();
  if (!definition || !definition->render) {
    throw std::invalid_argument("Component element at " + context.paths.describe(path) + " has no render function");
  }

  HookInvocationScope scope(context.hooks, path, definition->displayName);
  Renderable output = definition->render(element.props);
  scope.complete();
  return normalizeNode(output);
}

InstancePtr createInstance(const ElementPtr& element, PathToken path) {
  auto instance = std::make_shared<Instance>();
  instance->kind = getInstanceKind(element->type);
  instance->element = element;
  instance->key = element->key;
  instance->path = path;
  return instance;
}

void releaseInstance(ReconcilerContext& context, const InstancePtr& instance) {
  if (!instance) {
    return;
  }
  instance->released = true;
  switch (instance->kind) {
    case InstanceKind::Component:
      context.hooks.releasePath(instance->path);
      break;
    case InstanceKind::Host:
      detachRef(instance->element->props, instance->hostNode);
      break;
    case InstanceKind::Text:
    case InstanceKind::Fragment:
      break;
  }
  for (const auto& child : instance->children) {
    releaseInstance(context, child);
  }
}

void populateInstance(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    const InstancePtr& instance,
    const HostInstancePtr& anchor) {
  const ElementPtr& element = instance->element;
  const PathToken path = instance->path;
  switch (instance->kind) {
    case InstanceKind::Text: {
      instance->hostNode = context.host.createTextNode(getTextContent(*element));
      context.host.insertBefore(container, instance->hostNode, anchor);
      break;
    }
    case InstanceKind::Host: {
      instance->hostNode = context.host.createHostNode(element->type.getHostTag());
      applyHostPropertyUpdates(context.host, instance->hostNode, diffHostProperties(nullptr, element->props));
      mountChildren(context, instance->hostNode, *instance, element->children, path, nullptr);
      context.host.insertBefore(container, instance->hostNode, anchor);
      attachRef(element->props, instance->hostNode);
      break;
    }
    case InstanceKind::Fragment: {
      mountChildren(context, container, *instance, element->children, path, anchor);
      break;
    }
    case InstanceKind::Component: {
      ElementPtr rendered = renderComponent(context, *element, path);
      if (auto child = reconcile(context, container, nullptr, rendered, context.paths.renderedChild(path), anchor)) {
        instance->children.push_back(std::move(child));
      }
      break;
    }
  }
}

} // namespace

void traceReconcilerStep(const ReconcilerContext& context, const char* step, PathToken path) {
  if (!enableReconcilerTracing) {
    return;
  }
  logReconcilerStep(step, context.paths.describe(path));
}

bool canUpdateInPlace(const Instance& instance, const Element& element) {
  return instance.element && isSameElementType(*instance.element, element) && instance.key == element.key;
}

InstancePtr reconcile(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    const InstancePtr& prevInstance,
    const ElementPtr& nextElement,
    PathToken path,
    const HostInstancePtr& anchor) {
  if (!nextElement) {
    if (prevInstance) {
      unmountInstance(context, container, prevInstance);
    }
    return nullptr;
  }

  if (!prevInstance) {
    return mountInstance(context, container, nextElement, path, anchor);
  }

  if (!canUpdateInPlace(*prevInstance, *nextElement)) {
    unmountInstance(context, container, prevInstance);
    return mountInstance(context, container, nextElement, path, anchor);
  }

  updateInstance(context, container, prevInstance, nextElement, path, anchor);
  return prevInstance;
}

InstancePtr mountInstance(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    const ElementPtr& element,
    PathToken path,
    const HostInstancePtr& anchor) {
  auto instance = createInstance(element, path);
  traceReconcilerStep(context, "mount", path);

  // A mount that fails part way leaves nothing behind: no host nodes, no hook state.
  try {
    populateInstance(context, container, instance, anchor);
  } catch (...) {
    unmountInstance(context, container, instance);
    throw;
  }
  return instance;
}

void updateInstance(
    ReconcilerContext& context,
    const HostInstancePtr& container,
    const InstancePtr& instance,
    const ElementPtr& element,
    PathToken path,
    const HostInstancePtr& anchor) {
  traceReconcilerStep(context, "update", path);
  ElementPtr prevElement = instance->element;

  switch (instance->kind) {
    case InstanceKind::Text: {
      const std::string& text = getTextContent(*element);
      if (getTextContent(*prevElement) != text) {
        context.host.setTextContent(instance->hostNode, text);
      }
      break;
    }
    case InstanceKind::Host: {
      applyHostPropertyUpdates(
          context.host,
          instance->hostNode,
          diffHostProperties(&prevElement->props, element->props));
      updateRef(prevElement->props, element->props, instance->hostNode);
      instance->element = element;
      reconcileChildren(context, instance->hostNode, *instance, element->children, path, nullptr);
      break;
    }
    case InstanceKind::Fragment: {
      reconcileChildren(context, container, *instance, element->children, path, anchor);
      break;
    }
    case InstanceKind::Component: {
      if (instance->path != path) {
        traceReconcilerStep(context, "migrate", path);
        context.hooks.migrate(instance->path, path);
        instance->path = path;
      }
      ElementPtr rendered = renderComponent(context, *element, path);
      InstancePtr prevChild = instance->children.empty() ? nullptr : instance->children.front();
      InstancePtr nextChild;
      try {
        nextChild = reconcile(context, container, prevChild, rendered, context.paths.renderedChild(path), anchor);
      } catch (...) {
        if (prevChild && prevChild->released) {
          instance->children.clear();
        }
        throw;
      }
      instance->children.clear();
      if (nextChild) {
        instance->children.push_back(std::move(nextChild));
      }
      break;
    }
  }

  instance->element = element;
  instance->key = element->key;
  instance->path = path;
}

void unmountInstance(ReconcilerContext& context, const HostInstancePtr& container, const InstancePtr& instance) {
  if (!instance) {
    return;
  }
  traceReconcilerStep(context, "unmount", instance->path);
  removeHostNodes(context.host, container, getHostNodes(instance));
  releaseInstance(context, instance);
}

} // namespace trellis
