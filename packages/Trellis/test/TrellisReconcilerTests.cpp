#include "TrellisReconciler/TrellisChildReconciler.h"
#include "TrellisReconciler/TrellisHooks.h"
#include "TrellisTestHelper.h"
#include "shared/TrellisErrors.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace trellis::test {

namespace {

ElementPtr createList(const std::vector<std::string>& keys) {
  std::vector<Renderable> items;
  for (const auto& key : keys) {
    items.emplace_back(jsx("li", {}, {key}, key));
  }
  return jsx("ul", {}, items);
}

void render(TestEnvironment& env, ElementPtr element) {
  env.runtime->mount(std::move(element), env.container);
  env.runtime->flushAllTasksForTest();
}

void testIdenticalRenderIsIdempotent() {
  auto env = createTestEnvironment();
  auto buildTree = [] {
    return jsx(
        "div",
        {{"className", "app"}, {"tabIndex", 1}},
        {jsx("h1", {}, {"Title"}), createList({"a", "b"}), "footer", 3});
  };

  render(env, buildTree());
  assert(
      getMarkup(env.container) ==
      "<div className=\"app\" tabIndex=\"1\"><h1>Title</h1><ul><li>a</li><li>b</li></ul>footer3</div>");
  assert(env.host->getCounters().createdNodes == 10);

  env.host->resetCounters();
  render(env, buildTree());
  assert(env.host->getCounters().total() == 0);
  assert(env.host->getMutationLog().empty());
}

void testKeyedReorderMovesOnlyWhatChanged() {
  auto env = createTestEnvironment();
  render(env, createList({"1", "2", "3"}));
  auto list = getChildComponent(env.container, 0);
  auto first = list->children[0];
  auto second = list->children[1];
  auto third = list->children[2];

  env.host->resetCounters();
  render(env, createList({"3", "1", "2"}));
  const auto& counters = env.host->getCounters();
  assert(getMarkup(env.container) == "<ul><li>3</li><li>1</li><li>2</li></ul>");
  assert(counters.moves == 1);
  assert(counters.total() == 1);
  assert(list->children[0] == third);
  assert(list->children[1] == first);
  assert(list->children[2] == second);

  // Removal and insertion in the middle.
  env.host->resetCounters();
  render(env, createList({"1", "4", "2"}));
  assert(getMarkup(env.container) == "<ul><li>1</li><li>4</li><li>2</li></ul>");
  assert(env.host->getCounters().removals == 1);
  assert(env.host->getCounters().createdNodes == 2);
  assert(env.host->getCounters().moves == 0);
  assert(list->children[0] == first);
  assert(list->children[2] == second);

  // Reversing three children needs two moves.
  env.host->resetCounters();
  render(env, createList({"2", "4", "1"}));
  assert(getMarkup(env.container) == "<ul><li>2</li><li>4</li><li>1</li></ul>");
  assert(env.host->getCounters().moves == 2);
  assert(env.host->getCounters().createdNodes == 0);
  assert(env.host->getCounters().removals == 0);

  env.host->resetCounters();
  render(env, createList({}));
  assert(getMarkup(env.container) == "<ul></ul>");
  assert(env.host->getCounters().removals == 3);
}

void testUnkeyedTextUpdate() {
  auto env = createTestEnvironment();
  render(env, jsx("p", {}, {"a", "b"}));
  auto paragraph = getChildComponent(env.container, 0);
  auto firstText = paragraph->children[0];

  env.host->resetCounters();
  render(env, jsx("p", {}, {"a", "c"}));
  assert(getMarkup(env.container) == "<p>ac</p>");
  assert(env.host->getCounters().textUpdates == 1);
  assert(env.host->getCounters().total() == 1);
  assert(paragraph->children[0] == firstText);

  env.host->resetCounters();
  render(env, jsx("p", {}, {"a", jsx("br"), "c"}));
  assert(getMarkup(env.container) == "<p>a<br></br>c</p>");
  assert(env.host->getCounters().removals == 0);
}

void testUnmountRemovesEverything() {
  int cleanups = 0;
  auto env = createTestEnvironment();
  auto Leaf = defineComponent("Leaf", [&cleanups](const Props& props) -> Renderable {
    useEffect([&cleanups] { return [&cleanups] { ++cleanups; }; }, {});
    return jsx("span", {}, {props.at("label").getString()});
  });

  auto root = env.runtime->mount(
      jsx("div",
          {},
          {jsx(Leaf, {{"label", "a"}}),
           fragment({jsx(Leaf, {{"label", "b"}}), jsx(Leaf, {{"label", "c"}})}),
           "text"}),
      env.container);
  env.runtime->flushAllTasksForTest();
  assert(getMarkup(env.container) == "<div><span>a</span><span>b</span><span>c</span>text</div>");
  assert(root->getHookStore().getPathCount() == 3);
  assert(cleanups == 0);

  assert(env.runtime->unmount(env.container));
  assert(env.container->children.empty());
  assert(cleanups == 3);
  assert(root->isUnmounted());
  assert(root->getHookStore().getPathCount() == 0);
  assert(root->getRootInstance() == nullptr);
  assert(env.runtime->getRegisteredRootCount() == 0);
  assert(!env.runtime->unmount(env.container));

  // The container can host a fresh root afterwards.
  render(env, jsx("p"));
  assert(getMarkup(env.container) == "<p></p>");
  assert(env.runtime->getRoot(env.container) != root);
}

void testTypeChangeRemounts() {
  auto env = createTestEnvironment();
  render(env, jsx("div", {}, {"x"}));
  env.host->resetCounters();
  render(env, jsx("span", {}, {"x"}));
  assert(getMarkup(env.container) == "<span>x</span>");
  assert(env.host->getCounters().removals == 1);
  assert(env.host->getCounters().createdNodes == 2);
  assert(env.host->getCounters().insertions == 2);

  StateSetter<int> setA;
  auto A = defineComponent("A", [&setA](const Props&) -> Renderable {
    auto value = useState(0);
    setA = value.second;
    return jsx("b", {}, {value.first});
  });
  auto B = defineComponent("B", [](const Props&) -> Renderable {
    auto value = useState(10);
    return jsx("i", {}, {value.first});
  });

  auto componentEnv = createTestEnvironment();
  render(componentEnv, jsx(A));
  setA(5);
  componentEnv.runtime->flushAllTasksForTest();
  assert(getMarkup(componentEnv.container) == "<b>5</b>");

  render(componentEnv, jsx(B));
  assert(getMarkup(componentEnv.container) == "<i>10</i>");
  assert(!setA.isActive());

  render(componentEnv, jsx(A));
  assert(getMarkup(componentEnv.container) == "<b>0</b>");
}

void testFragmentsKeepSiblingOrder() {
  auto env = createTestEnvironment();
  auto buildTree = [](std::vector<Renderable> middle) {
    return jsx("div", {}, {jsx("p", {}, {"first"}), fragment(std::move(middle)), jsx("span")});
  };

  render(env, buildTree({jsx("a"), jsx("b")}));
  assert(getMarkup(env.container) == "<div><p>first</p><a></a><b></b><span></span></div>");

  env.host->resetCounters();
  render(env, buildTree({jsx("a"), jsx("i"), jsx("b")}));
  assert(getMarkup(env.container) == "<div><p>first</p><a></a><i></i><b></b><span></span></div>");
  assert(env.host->getCounters().createdNodes == 1);
  assert(env.host->getCounters().insertions == 1);
  assert(env.host->getCounters().moves == 0);

  env.host->resetCounters();
  render(env, buildTree({jsx("b")}));
  assert(getMarkup(env.container) == "<div><p>first</p><b></b><span></span></div>");
  assert(env.host->getCounters().removals == 2);
  assert(env.host->getCounters().createdNodes == 0);

  render(env, buildTree({}));
  assert(getMarkup(env.container) == "<div><p>first</p><span></span></div>");
  render(env, buildTree({jsx("a")}));
  assert(getMarkup(env.container) == "<div><p>first</p><a></a><span></span></div>");

  // Keyed fragments move as a unit.
  auto group = [](const std::string& key) {
    return fragment({jsx("li", {}, {key + "1"}), jsx("li", {}, {key + "2"})}, key);
  };
  auto listEnv = createTestEnvironment();
  render(listEnv, jsx("ul", {}, {group("x"), group("y")}));
  assert(getMarkup(listEnv.container) == "<ul><li>x1</li><li>x2</li><li>y1</li><li>y2</li></ul>");
  listEnv.host->resetCounters();
  render(listEnv, jsx("ul", {}, {group("y"), group("x")}));
  assert(getMarkup(listEnv.container) == "<ul><li>y1</li><li>y2</li><li>x1</li><li>x2</li></ul>");
  assert(listEnv.host->getCounters().moves == 2);
  assert(listEnv.host->getCounters().createdNodes == 0);

  // A sequence returned at the root renders as a fragment.
  auto sequenceEnv = createTestEnvironment();
  auto Pair = defineComponent("Pair", [](const Props&) -> Renderable {
    return std::vector<Renderable>{jsx("dt"), jsx("dd")};
  });
  render(sequenceEnv, jsx(Pair));
  assert(getMarkup(sequenceEnv.container) == "<dt></dt><dd></dd>");
}

void testDuplicateKeysAreRejected() {
  auto env = createTestEnvironment();
  env.runtime->mount(createList({"1", "1"}), env.container);
  bool threw = false;
  try {
    env.runtime->flushAllTasksForTest();
  } catch (const DuplicateKeyError& error) {
    threw = true;
    assert(error.getKey() == "1");
    assert(error.getParentPath() == "0");
  }
  assert(threw);
  assert(env.container->children.empty());

  auto updateEnv = createTestEnvironment();
  render(updateEnv, createList({"1", "2"}));
  updateEnv.host->resetCounters();
  updateEnv.runtime->mount(createList({"2", "2"}), updateEnv.container);
  assert(throwsException<DuplicateKeyError>([&updateEnv] { updateEnv.runtime->flushAllTasksForTest(); }));
  assert(getMarkup(updateEnv.container) == "<ul><li>1</li><li>2</li></ul>");
  assert(updateEnv.host->getCounters().total() == 0);

  // Unkeyed siblings never conflict.
  render(updateEnv, jsx("ul", {}, {jsx("li"), jsx("li")}));
  assert(getMarkup(updateEnv.container) == "<ul><li></li><li></li></ul>");
}

void testFailedPassesLeaveTreeConsistent() {
  // A nested component that throws keeps its siblings mounted exactly once.
  bool shouldThrow = false;
  auto Fragile = defineComponent("Fragile", [&shouldThrow](const Props&) -> Renderable {
    if (shouldThrow) {
      throw std::runtime_error("render failed");
    }
    return jsx("p", {}, {"ok"});
  });
  auto env = createTestEnvironment();
  auto buildTree = [Fragile] { return jsx("div", {}, {jsx("span", {}, {"a"}), jsx(Fragile)}); };
  render(env, buildTree());

  shouldThrow = true;
  env.runtime->mount(buildTree(), env.container);
  assert(throwsException<std::runtime_error>([&env] { env.runtime->flushAllTasksForTest(); }));
  assert(getMarkup(env.container) == "<div><span>a</span><p>ok</p></div>");

  shouldThrow = false;
  env.host->resetCounters();
  render(env, buildTree());
  assert(getMarkup(env.container) == "<div><span>a</span><p>ok</p></div>");
  assert(env.host->getCounters().total() == 0);

  // Duplicate keys in a nested list.
  auto sectionEnv = createTestEnvironment();
  auto buildSection = [](const std::vector<std::string>& keys) {
    return jsx("section", {}, {jsx("h1", {}, {"t"}), createList(keys)});
  };
  render(sectionEnv, buildSection({"k1", "k2"}));
  sectionEnv.runtime->mount(buildSection({"k1", "k1"}), sectionEnv.container);
  assert(throwsException<DuplicateKeyError>([&sectionEnv] { sectionEnv.runtime->flushAllTasksForTest(); }));
  assert(getMarkup(sectionEnv.container) == "<section><h1>t</h1><ul><li>k1</li><li>k2</li></ul></section>");

  sectionEnv.host->resetCounters();
  render(sectionEnv, buildSection({"k2", "k1"}));
  assert(getMarkup(sectionEnv.container) == "<section><h1>t</h1><ul><li>k2</li><li>k1</li></ul></section>");
  assert(sectionEnv.host->getCounters().moves == 1);
  assert(sectionEnv.host->getCounters().createdNodes == 0);

  // A keyed reorder interrupted part way keeps the moves it already made.
  std::string failingId;
  auto Item = defineComponent("Item", [&failingId](const Props& props) -> Renderable {
    const std::string id = props.at("id").getString();
    if (id == failingId) {
      throw std::runtime_error("item failed");
    }
    return jsx("li", {}, {id});
  });
  auto buildItems = [Item](const std::vector<std::string>& ids) {
    std::vector<Renderable> items;
    for (const auto& id : ids) {
      items.emplace_back(jsx(Item, {{"id", id}}, {}, id));
    }
    return jsx("ul", {}, items);
  };
  auto itemEnv = createTestEnvironment();
  render(itemEnv, buildItems({"A", "B", "C"}));
  failingId = "A";
  itemEnv.runtime->mount(buildItems({"C", "A", "B"}), itemEnv.container);
  assert(throwsException<std::runtime_error>([&itemEnv] { itemEnv.runtime->flushAllTasksForTest(); }));
  assert(getMarkup(itemEnv.container) == "<ul><li>C</li><li>A</li><li>B</li></ul>");

  failingId.clear();
  itemEnv.host->resetCounters();
  render(itemEnv, buildItems({"C", "A", "B"}));
  assert(getMarkup(itemEnv.container) == "<ul><li>C</li><li>A</li><li>B</li></ul>");
  assert(itemEnv.host->getCounters().total() == 0);

  // A mount that fails part way leaves no hook state behind.
  int counterInits = 0;
  auto Counter = defineComponent("Counter", [&counterInits](const Props&) -> Renderable {
    auto value = useState<int>([&counterInits] {
      ++counterInits;
      return 7;
    });
    return jsx("b", {}, {value.first});
  });
  auto mountEnv = createTestEnvironment();
  shouldThrow = true;
  mountEnv.runtime->mount(jsx("div", {}, {jsx(Counter), jsx(Fragile)}), mountEnv.container);
  assert(throwsException<std::runtime_error>([&mountEnv] { mountEnv.runtime->flushAllTasksForTest(); }));
  assert(mountEnv.container->children.empty());
  assert(counterInits == 1);

  shouldThrow = false;
  render(mountEnv, jsx("div", {}, {jsx(Counter), jsx(Fragile)}));
  assert(getMarkup(mountEnv.container) == "<div><b>7</b><p>ok</p></div>");
  assert(counterInits == 2);

  // A component whose new child fails to mount drops the child it replaced.
  bool showBroken = false;
  auto Broken = defineComponent("Broken", [](const Props&) -> Renderable {
    throw std::runtime_error("mount failed");
  });
  auto Shell = defineComponent("Shell", [&showBroken, Broken](const Props&) -> Renderable {
    if (showBroken) {
      return jsx(Broken);
    }
    return jsx("p", {}, {"shell"});
  });
  auto shellEnv = createTestEnvironment();
  render(shellEnv, jsx("div", {}, {jsx(Shell), jsx("span")}));
  auto shellRoot = shellEnv.runtime->getRoot(shellEnv.container);

  showBroken = true;
  shellRoot->scheduleUpdate();
  assert(throwsException<std::runtime_error>([&shellEnv] { shellEnv.runtime->flushAllTasksForTest(); }));
  assert(getMarkup(shellEnv.container) == "<div><span></span></div>");

  showBroken = false;
  shellRoot->scheduleUpdate();
  shellEnv.runtime->flushAllTasksForTest();
  assert(getMarkup(shellEnv.container) == "<div><p>shell</p><span></span></div>");
}

void testDetachedNodesAreSkipped() {
  auto env = createTestEnvironment();
  render(env, jsx("div", {}, {jsx("p", {}, {"gone"}), jsx("span")}));
  auto div = getChildComponent(env.container, 0);
  auto paragraph = div->children[0];
  env.host->removeChild(div, paragraph);
  assert(getMarkup(env.container) == "<div><span></span></div>");

  env.host->resetCounters();
  render(env, jsx("div", {}, {jsx("span")}));
  assert(getMarkup(env.container) == "<div><span></span></div>");
  assert(env.host->getCounters().removals == 0);
  assert(env.host->getCounters().total() == 0);
}

void testPropertiesListenersAndRefs() {
  int clicks = 0;
  int otherClicks = 0;
  auto env = createTestEnvironment();
  Value onClick = Value::handler([&clicks](const Value&) { ++clicks; });
  Value otherOnClick = Value::handler([&otherClicks](const Value&) { ++otherClicks; });
  auto ref = std::make_shared<HostRef>();

  render(
      env,
      jsx("button",
          {{"className", "primary"}, {"onClick", onClick}, {"ref", Value::reference(ref)}, {"disabled", false}},
          {"Go"}));
  auto button = getChildComponent(env.container, 0);
  assert(getMarkup(env.container) == "<button className=\"primary\">Go</button>");
  assert(ref->current == button);
  assert(button->getProp("ref") == nullptr);
  assert(button->getProp("onClick") == nullptr);
  assert(button->getProp("disabled") == nullptr);
  assert(button->getListenerCount("click") == 1);
  assert(button->dispatchEvent("click") == 1);
  assert(clicks == 1);

  env.host->resetCounters();
  render(
      env,
      jsx("button",
          {{"className", "primary"}, {"onClick", onClick}, {"ref", Value::reference(ref)}, {"disabled", false}},
          {"Go"}));
  assert(env.host->getCounters().total() == 0);

  env.host->resetCounters();
  render(
      env,
      jsx("button",
          {{"className", "secondary"}, {"onClick", otherOnClick}, {"ref", Value::reference(ref)}, {"disabled", true}},
          {"Go"}));
  assert(getMarkup(env.container) == "<button className=\"secondary\" disabled=\"true\">Go</button>");
  assert(env.host->getCounters().propertyUpdates == 2);
  assert(env.host->getCounters().listenerUpdates == 2);
  assert(button->getListenerCount("click") == 1);
  button->dispatchEvent("click");
  assert(clicks == 1);
  assert(otherClicks == 1);

  env.host->resetCounters();
  render(env, jsx("button", {}, {"Go"}));
  assert(getMarkup(env.container) == "<button>Go</button>");
  assert(env.host->getCounters().propertyUpdates == 2);
  assert(env.host->getCounters().listenerUpdates == 1);
  assert(button->getListenerCount("click") == 0);
  assert(ref->current == nullptr);

  render(env, jsx("button", {{"ref", Value::reference(ref)}}, {"Go"}));
  assert(ref->current == button);
  env.runtime->unmount(env.container);
  assert(ref->current == nullptr);

  // Handlers bound by a component update its state.
  auto counterEnv = createTestEnvironment();
  auto ClickCounter = defineComponent("ClickCounter", [](const Props&) -> Renderable {
    auto count = useState(0);
    auto setCount = count.second;
    return jsx(
        "button",
        {{"onClick", Value::handler([setCount](const Value&) { setCount.update([](int c) { return c + 1; }); })}},
        {count.first});
  });
  render(counterEnv, jsx(ClickCounter));
  auto counterButton = getChildComponent(counterEnv.container, 0);
  counterButton->dispatchEvent("click");
  counterButton->dispatchEvent("click");
  counterEnv.runtime->flushAllTasksForTest();
  assert(getMarkup(counterEnv.container) == "<button>2</button>");
  assert(counterButton->getListenerCount("click") == 1);
}

void testLongestIncreasingSubsequence() {
  assert(longestIncreasingSubsequence({}).empty());
  assert((longestIncreasingSubsequence({0, 1, 2}) == std::vector<std::size_t>{0, 1, 2}));
  assert(longestIncreasingSubsequence({2, 0, 1}).size() == 2);
  assert((longestIncreasingSubsequence({2, 0, 1}) == std::vector<std::size_t>{1, 2}));
  assert(longestIncreasingSubsequence({3, 2, 1, 0}).size() == 1);
  assert((longestIncreasingSubsequence({4, 1, 5, 2, 3}) == std::vector<std::size_t>{1, 3, 4}));
}

} // namespace

bool runTrellisReconcilerTests() {
  testIdenticalRenderIsIdempotent();
  testKeyedReorderMovesOnlyWhatChanged();
  testUnkeyedTextUpdate();
  testUnmountRemovesEverything();
  testTypeChangeRemounts();
  testFragmentsKeepSiblingOrder();
  testDuplicateKeysAreRejected();
  testFailedPassesLeaveTreeConsistent();
  testDetachedNodesAreSkipped();
  testPropertiesListenersAndRefs();
  testLongestIncreasingSubsequence();
  return true;
}

} // namespace trellis::test
