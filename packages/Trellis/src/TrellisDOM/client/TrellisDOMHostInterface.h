#pragma once

#include "TrellisDOM/client/TrellisDOMComponent.h"
#include "TrellisRuntime/TrellisHostInterface.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace trellis {

struct DOMMutationCounters {
  std::size_t createdNodes{0};
  std::size_t insertions{0};
  std::size_t moves{0};
  std::size_t removals{0};
  std::size_t propertyUpdates{0};
  std::size_t textUpdates{0};
  std::size_t listenerUpdates{0};

  [[nodiscard]] std::size_t total() const noexcept {
    return createdNodes + insertions + moves + removals + propertyUpdates + textUpdates + listenerUpdates;
  }
};

/**
 * In-memory render target. Nodes are TrellisDOMComponent trees; every mutation
 * is counted and appended to a log so callers can inspect exactly what a
 * render pass changed.
 */
class TrellisDOMHostInterface final : public HostInterface {
public:
  TrellisDOMHostInterface() = default;
  ~TrellisDOMHostInterface() override = default;

  // A detached element usable as the root container of a mount.
  TrellisDOMComponentPtr createContainer(const std::string& type = "root");

  HostInstancePtr createHostNode(const std::string& type) override;
  HostInstancePtr createTextNode(const std::string& text) override;
  void setTextContent(const HostInstancePtr& node, const std::string& text) override;
  void setProperty(const HostInstancePtr& node, const std::string& name, const Value& value) override;
  void removeProperty(const HostInstancePtr& node, const std::string& name) override;
  void insertBefore(
      const HostInstancePtr& parent,
      const HostInstancePtr& child,
      const HostInstancePtr& beforeChild) override;
  void removeChild(const HostInstancePtr& parent, const HostInstancePtr& child) override;
  void addEventListener(
      const HostInstancePtr& node,
      const std::string& eventName,
      const Value& listener) override;
  void removeEventListener(
      const HostInstancePtr& node,
      const std::string& eventName,
      const Value& listener) override;
  [[nodiscard]] HostInstancePtr getParentNode(const HostInstancePtr& node) const override;
  [[nodiscard]] HostInstancePtr getNextSibling(const HostInstancePtr& node) const override;

  [[nodiscard]] const DOMMutationCounters& getCounters() const noexcept {
    return counters_;
  }
  [[nodiscard]] const std::vector<std::string>& getMutationLog() const noexcept {
    return mutationLog_;
  }
  void resetCounters();

  static TrellisDOMComponentPtr asComponent(const HostInstancePtr& node);

private:
  void detachFromParent(const std::shared_ptr<TrellisDOMInstance>& child);
  void record(std::string entry);

  DOMMutationCounters counters_{};
  std::vector<std::string> mutationLog_{};
};

} // namespace trellis
