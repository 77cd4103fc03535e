#include "TrellisDOM/client/TrellisDOMHostInterface.h"
#include "TrellisReconciler/TrellisHooks.h"
#include "TrellisRuntime/TrellisRuntime.h"
#include "TrellisTestHelper.h"

#include <cassert>
#include <memory>
#include <stdexcept>

namespace trellis::test {

bool runTrellisRuntimeTests() {
  // The default render target is the in-memory DOM.
  TrellisRuntime defaultRuntime;
  auto* defaultHost = dynamic_cast<TrellisDOMHostInterface*>(&defaultRuntime.getHostInterface());
  assert(defaultHost != nullptr);
  auto defaultContainer = defaultHost->createContainer();
  defaultRuntime.mount(jsx("p", {}, {"hi"}), defaultContainer);
  defaultRuntime.flushAllTasksForTest();
  assert(getMarkup(defaultContainer) == "<p>hi</p>");
  assert(throwsException<std::logic_error>([&defaultRuntime] {
    defaultRuntime.setHostInterface(std::make_shared<TrellisDOMHostInterface>());
  }));
  assert(throwsException<std::invalid_argument>([&defaultRuntime] { defaultRuntime.mount(jsx("p"), nullptr); }));

  // Roots are independent per container.
  StateSetter<int> lastSetter;
  auto env = createTestEnvironment();
  auto Counter = defineComponent("Counter", [&lastSetter](const Props& props) -> Renderable {
    auto count = useState(static_cast<int>(props.at("start").getNumber()));
    lastSetter = count.second;
    return jsx("span", {}, {count.first});
  });

  auto secondContainer = env.host->createContainer();
  auto firstRoot = env.runtime->mount(jsx(Counter, {{"start", 1}}), env.container);
  env.runtime->flushAllTasksForTest();
  const auto firstSetter = lastSetter;
  auto secondRoot = env.runtime->mount(jsx(Counter, {{"start", 10}}), secondContainer);
  env.runtime->flushAllTasksForTest();
  assert(firstRoot != secondRoot);
  assert(env.runtime->getRegisteredRootCount() == 2);
  assert(env.runtime->getRoot(env.container) == firstRoot);
  assert(env.runtime->getRoot(secondContainer) == secondRoot);

  firstSetter(2);
  env.runtime->flushAllTasksForTest();
  assert(getMarkup(env.container) == "<span>2</span>");
  assert(getMarkup(secondContainer) == "<span>10</span>");
  assert(firstRoot->getRenderCount() == 2);
  assert(secondRoot->getRenderCount() == 1);

  // Mounting into a known container re-renders its root.
  assert(env.runtime->mount(jsx(Counter, {{"start", 99}}), env.container) == firstRoot);
  env.runtime->flushAllTasksForTest();
  assert(getMarkup(env.container) == "<span>2</span>");

  assert(env.runtime->unmount(secondContainer));
  assert(env.runtime->getRoot(secondContainer) == nullptr);
  assert(secondContainer->children.empty());
  assert(getMarkup(env.container) == "<span>2</span>");

  // Embedder tasks share the queue with render work.
  bool taskRan = false;
  TaskHandle handle = env.runtime->scheduleTask([&taskRan] { taskRan = true; });
  TaskHandle cancelled = env.runtime->scheduleTask([] { throw std::runtime_error("cancelled task ran"); });
  env.runtime->cancelTask(cancelled);
  assert(handle);
  env.runtime->flushAllTasksForTest();
  assert(taskRan);

  return true;
}

} // namespace trellis::test
