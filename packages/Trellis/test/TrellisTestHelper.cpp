#include "TrellisTestHelper.h"

#include <utility>

namespace trellis::test {

TestEnvironment createTestEnvironment() {
  TestEnvironment environment;
  environment.host = std::make_shared<TrellisDOMHostInterface>();
  environment.runtime = std::make_unique<TrellisRuntime>(environment.host);
  environment.container = environment.host->createContainer();
  return environment;
}

std::string getMarkup(const TrellisDOMComponentPtr& container) {
  return container->innerMarkup();
}

TrellisDOMComponentPtr getChildComponent(const TrellisDOMComponentPtr& parent, std::size_t index) {
  if (!parent || index >= parent->children.size()) {
    return nullptr;
  }
  return std::dynamic_pointer_cast<TrellisDOMComponent>(parent->children[index]);
}

} // namespace trellis::test
