#pragma once

#include "TrellisRuntime/TrellisValue.h"

#include <memory>
#include <string>

namespace trellis {

// Opaque render-target node. Each render target derives its own node type.
class HostInstance : public std::enable_shared_from_this<HostInstance> {
public:
  virtual ~HostInstance() = default;

  [[nodiscard]] virtual std::string debugDescription() const = 0;

protected:
  HostInstance() = default;
};

using HostInstancePtr = std::shared_ptr<HostInstance>;

/**
 * Render-target capability set. The reconciler talks to the render target only
 * through this interface, so non-visual trees can be targeted as well.
 *
 * insertBefore with a null anchor appends. Inserting a node that already has a
 * parent moves it.
 */
class HostInterface {
public:
  HostInterface() = default;
  virtual ~HostInterface() = default;

  HostInterface(const HostInterface&) = delete;
  HostInterface& operator=(const HostInterface&) = delete;

  virtual HostInstancePtr createHostNode(const std::string& type) = 0;

  virtual HostInstancePtr createTextNode(const std::string& text) = 0;

  virtual void setTextContent(const HostInstancePtr& node, const std::string& text) = 0;

  virtual void setProperty(const HostInstancePtr& node, const std::string& name, const Value& value) = 0;

  virtual void removeProperty(const HostInstancePtr& node, const std::string& name) = 0;

  virtual void insertBefore(
      const HostInstancePtr& parent,
      const HostInstancePtr& child,
      const HostInstancePtr& beforeChild) = 0;

  virtual void removeChild(const HostInstancePtr& parent, const HostInstancePtr& child) = 0;

  virtual void addEventListener(
      const HostInstancePtr& node,
      const std::string& eventName,
      const Value& listener) = 0;

  virtual void removeEventListener(
      const HostInstancePtr& node,
      const std::string& eventName,
      const Value& listener) = 0;

  [[nodiscard]] virtual HostInstancePtr getParentNode(const HostInstancePtr& node) const = 0;

  [[nodiscard]] virtual HostInstancePtr getNextSibling(const HostInstancePtr& node) const = 0;
};

// Target of a "ref" prop on a host element.
struct HostRef {
  HostInstancePtr current{};
};

} // namespace trellis
