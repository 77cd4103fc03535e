#include "TrellisRuntime/TrellisRuntime.h"

#include "TrellisDOM/client/TrellisDOMHostInterface.h"

#include <stdexcept>
#include <utility>

namespace trellis {

TrellisRuntime::TrellisRuntime() = default;

TrellisRuntime::TrellisRuntime(std::shared_ptr<HostInterface> hostInterface)
    : hostInterface_(std::move(hostInterface)) {}

TrellisRuntime::~TrellisRuntime() {
  registeredRoots_.clear();
}

void TrellisRuntime::setHostInterface(std::shared_ptr<HostInterface> hostInterface) {
  if (!registeredRoots_.empty()) {
    throw std::logic_error("Cannot replace the host interface while roots are mounted");
  }
  hostInterface_ = std::move(hostInterface);
}

std::shared_ptr<HostInterface> TrellisRuntime::ensureHostInterface() {
  if (!hostInterface_) {
    hostInterface_ = std::make_shared<TrellisDOMHostInterface>();
  }
  return hostInterface_;
}

HostInterface& TrellisRuntime::getHostInterface() {
  return *ensureHostInterface();
}

std::shared_ptr<TrellisRoot> TrellisRuntime::mount(ElementPtr element, const HostInstancePtr& container) {
  if (!container) {
    throw std::invalid_argument("mount requires a container node");
  }
  auto it = registeredRoots_.find(container.get());
  if (it == registeredRoots_.end()) {
    auto root = TrellisRoot::create(*ensureHostInterface(), scheduler_, container);
    it = registeredRoots_.emplace(container.get(), std::move(root)).first;
  }
  it->second->render(std::move(element));
  return it->second;
}

bool TrellisRuntime::unmount(const HostInstancePtr& container) {
  auto it = registeredRoots_.find(container.get());
  if (it == registeredRoots_.end()) {
    return false;
  }
  auto root = std::move(it->second);
  registeredRoots_.erase(it);
  root->unmount();
  return true;
}

std::shared_ptr<TrellisRoot> TrellisRuntime::getRoot(const HostInstancePtr& container) const {
  auto it = registeredRoots_.find(container.get());
  return it == registeredRoots_.end() ? nullptr : it->second;
}

std::size_t TrellisRuntime::getRegisteredRootCount() const {
  return registeredRoots_.size();
}

TaskHandle TrellisRuntime::scheduleTask(Task task) {
  return scheduler_.scheduleTask(std::move(task));
}

void TrellisRuntime::cancelTask(TaskHandle handle) {
  scheduler_.cancelTask(handle);
}

void TrellisRuntime::flushAllTasksForTest() {
  scheduler_.flushWork();
}

} // namespace trellis
