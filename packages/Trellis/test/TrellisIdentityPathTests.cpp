#include "TrellisReconciler/TrellisIdentityPath.h"
#include "TrellisTestHelper.h"

#include <cassert>
#include <stdexcept>

namespace trellis::test {

bool runTrellisIdentityPathTests() {
  IdentityPathTable paths;
  const PathToken root = paths.getRoot();
  assert(root != InvalidPathToken);
  assert(paths.describe(root) == "0");
  assert(paths.size() == 1);

  const PathToken rendered = paths.renderedChild(root);
  const PathToken div = paths.positional(rendered, ElementType("div"), 1);
  const PathToken item = paths.keyed(div, "item-3");
  assert(paths.describe(rendered) == "0.c0");
  assert(paths.describe(div) == "0.c0.cdiv_1");
  assert(paths.describe(item) == "0.c0.cdiv_1.kitem-3");
  assert(paths.getParent(item) == div);
  assert(paths.getParent(root) == InvalidPathToken);

  // Interning is stable.
  assert(paths.keyed(div, "item-3") == item);
  assert(paths.positional(rendered, ElementType("div"), 1) == div);
  assert(paths.positional(rendered, ElementType("div"), 2) != div);
  assert(paths.positional(rendered, ElementType("span"), 1) != div);
  assert(paths.keyed(root, "a") != paths.keyed(div, "a"));

  // Keys never collide with positional slots.
  assert(paths.keyed(rendered, "div_1") != div);

  auto First = defineComponent("Same", [](const Props&) -> Renderable { return nullptr; });
  auto Second = defineComponent("Same", [](const Props&) -> Renderable { return nullptr; });
  const PathToken first = paths.positional(root, First, 0);
  const PathToken second = paths.positional(root, Second, 0);
  assert(first != second);
  assert(paths.describe(first) == "0.cSame_0");

  Element keyedElement{ElementType("li"), std::string("k"), {}, {}};
  Element unkeyedElement{ElementType("li"), std::nullopt, {}, {}};
  assert(paths.childPath(div, keyedElement, 4) == paths.keyed(div, "k"));
  assert(paths.childPath(div, unkeyedElement, 4) == paths.positional(div, ElementType("li"), 4));

  // Lookups never intern.
  const std::size_t sizeBeforeLookup = paths.size();
  assert(paths.findPositional(rendered, ElementType("div"), 1) == div);
  assert(paths.findPositional(rendered, ElementType("div"), 7) == InvalidPathToken);
  assert(paths.findPositional(item, ElementType("p"), 0) == InvalidPathToken);
  assert(paths.size() == sizeBeforeLookup);

  // Tokens not reached during a pass are dropped; the root is permanent.
  paths.beginPass();
  const PathToken renderedAgain = paths.renderedChild(root);
  const PathToken divAgain = paths.positional(renderedAgain, ElementType("div"), 1);
  assert(renderedAgain == rendered);
  assert(divAgain == div);
  const std::size_t dropped = paths.sweep();
  assert(dropped > 0);
  assert(paths.size() == 3);
  assert(paths.contains(root));
  assert(paths.contains(div));
  assert(!paths.contains(item));
  assert(paths.describe(item) == "<released>");

  // A dropped path gets a fresh token when it is produced again.
  const PathToken itemAgain = paths.keyed(div, "item-3");
  assert(itemAgain != item);
  assert(paths.describe(itemAgain) == "0.c0.cdiv_1.kitem-3");

  paths.beginPass();
  paths.sweep();
  assert(paths.size() == 1);
  assert(paths.describe(root) == "0");

  assert(throwsException<std::logic_error>([&paths, item] { paths.keyed(item, "orphan"); }));

  return true;
}

} // namespace trellis::test
