#include "TrellisReconciler/TrellisIdentityPath.h"

#include "shared/TrellisFeatureFlags.h"

#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

namespace trellis {

namespace {

std::string makeLabel(const SlotKey& slot) {
  switch (slot.kind) {
    case SlotKind::Root:
      return slot.name;
    case SlotKind::Keyed:
      return "k" + slot.name;
    case SlotKind::Positional:
      return "c" + slot.name + "_" + std::to_string(slot.index);
    case SlotKind::RenderedChild:
      return "c0";
  }
  return std::string{};
}

SlotKey makePositionalSlot(const ElementType& type, std::size_t index) {
  const void* identity = type.isComponent() ? static_cast<const void*>(type.getComponent().get()) : nullptr;
  return SlotKey{SlotKind::Positional, type.getDisplayName(), identity, index};
}

} // namespace

bool operator<(const SlotKey& a, const SlotKey& b) {
  return std::tie(a.kind, a.name, a.typeIdentity, a.index) <
      std::tie(b.kind, b.name, b.typeIdentity, b.index);
}

IdentityPathTable::IdentityPathTable() {
  SlotKey slot{SlotKind::Root, std::string(rootPathName), nullptr, 0};
  root_ = intern(InvalidPathToken, std::move(slot));
}

PathToken IdentityPathTable::keyed(PathToken parent, const std::string& key) {
  return intern(parent, SlotKey{SlotKind::Keyed, key, nullptr, 0});
}

PathToken IdentityPathTable::positional(PathToken parent, const ElementType& type, std::size_t index) {
  return intern(parent, makePositionalSlot(type, index));
}

PathToken IdentityPathTable::findPositional(PathToken parent, const ElementType& type, std::size_t index) const {
  return find(parent, makePositionalSlot(type, index));
}

PathToken IdentityPathTable::renderedChild(PathToken parent) {
  return intern(parent, SlotKey{SlotKind::RenderedChild, std::string{}, nullptr, 0});
}

PathToken IdentityPathTable::childPath(PathToken parent, const Element& element, std::size_t index) {
  if (element.key) {
    return keyed(parent, *element.key);
  }
  return positional(parent, element.type, index);
}

bool IdentityPathTable::contains(PathToken token) const {
  return entries_.find(token) != entries_.end();
}

PathToken IdentityPathTable::getParent(PathToken token) const {
  auto it = entries_.find(token);
  if (it == entries_.end()) {
    return InvalidPathToken;
  }
  return it->second.parent;
}

std::string IdentityPathTable::describe(PathToken token) const {
  std::vector<const std::string*> labels;
  for (auto it = entries_.find(token); it != entries_.end(); it = entries_.find(it->second.parent)) {
    labels.push_back(&it->second.label);
  }
  if (labels.empty()) {
    return "<released>";
  }
  std::string description;
  for (auto it = labels.rbegin(); it != labels.rend(); ++it) {
    if (!description.empty()) {
      description += '.';
    }
    description += **it;
  }
  return description;
}

void IdentityPathTable::beginPass() {
  touched_.clear();
}

std::size_t IdentityPathTable::sweep() {
  std::size_t dropped = 0;
  for (auto it = tokensBySlot_.begin(); it != tokensBySlot_.end();) {
    const PathToken token = it->second;
    if (token == root_ || touched_.count(token) != 0) {
      ++it;
      continue;
    }
    entries_.erase(token);
    it = tokensBySlot_.erase(it);
    ++dropped;
  }
  return dropped;
}

PathToken IdentityPathTable::find(PathToken parent, const SlotKey& slot) const {
  auto it = tokensBySlot_.find(std::make_pair(parent, slot));
  return it == tokensBySlot_.end() ? InvalidPathToken : it->second;
}

PathToken IdentityPathTable::intern(PathToken parent, SlotKey slot) {
  if (parent != InvalidPathToken && !contains(parent)) {
    throw std::logic_error("Identity path parent is not interned");
  }
  auto lookup = std::make_pair(parent, slot);
  auto it = tokensBySlot_.find(lookup);
  if (it != tokensBySlot_.end()) {
    touched_.insert(it->second);
    return it->second;
  }

  const PathToken token = nextToken_++;
  Entry entry{parent, slot, makeLabel(slot)};
  entries_.emplace(token, std::move(entry));
  tokensBySlot_.emplace(std::move(lookup), token);
  touched_.insert(token);
  return token;
}

} // namespace trellis
