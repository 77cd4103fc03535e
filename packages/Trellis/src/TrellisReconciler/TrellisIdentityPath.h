#pragma once

#include "TrellisRuntime/TrellisJSXRuntime.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace trellis {

using PathToken = std::uint64_t;

inline constexpr PathToken InvalidPathToken = 0;

enum class SlotKind : std::uint8_t {
  Root = 0,
  Keyed = 1,
  Positional = 2,
  RenderedChild = 3,
};

struct SlotKey {
  SlotKind kind{SlotKind::Root};
  // Key for keyed slots, type display name for positional ones.
  std::string name{};
  // Component definition for positional component slots, so two components
  // sharing a display name never share a path.
  const void* typeIdentity{nullptr};
  std::size_t index{0};

  friend bool operator<(const SlotKey& a, const SlotKey& b);
};

/**
 * Interns structural identity paths as integer tokens. A path is the parent's
 * token plus the slot a node occupies under it: its key when it has one,
 * otherwise its (type, index) pair. A component's rendered child has a
 * dedicated slot.
 *
 * Tokens are never reused. Tokens that were not produced or touched during a
 * render pass are dropped by sweep(); the root token is permanent.
 */
class IdentityPathTable {
public:
  IdentityPathTable();

  IdentityPathTable(const IdentityPathTable&) = delete;
  IdentityPathTable& operator=(const IdentityPathTable&) = delete;

  [[nodiscard]] PathToken getRoot() const noexcept {
    return root_;
  }

  PathToken keyed(PathToken parent, const std::string& key);
  PathToken positional(PathToken parent, const ElementType& type, std::size_t index);
  PathToken renderedChild(PathToken parent);

  // Token of an already interned positional slot, or InvalidPathToken. Never interns.
  [[nodiscard]] PathToken findPositional(PathToken parent, const ElementType& type, std::size_t index) const;

  // keyed() when the element has a key, positional() otherwise.
  PathToken childPath(PathToken parent, const Element& element, std::size_t index);

  [[nodiscard]] bool contains(PathToken token) const;
  [[nodiscard]] PathToken getParent(PathToken token) const;

  // Printable form, e.g. "0.c0.cdiv_1.kitem-3".
  [[nodiscard]] std::string describe(PathToken token) const;

  void beginPass();
  // Drops every token not touched since beginPass(); returns how many were dropped.
  std::size_t sweep();

  [[nodiscard]] std::size_t size() const noexcept {
    return entries_.size();
  }

private:
  struct Entry {
    PathToken parent{InvalidPathToken};
    SlotKey slot{};
    std::string label{};
  };

  PathToken intern(PathToken parent, SlotKey slot);
  [[nodiscard]] PathToken find(PathToken parent, const SlotKey& slot) const;

  PathToken root_{InvalidPathToken};
  PathToken nextToken_{1};
  std::map<std::pair<PathToken, SlotKey>, PathToken> tokensBySlot_{};
  std::unordered_map<PathToken, Entry> entries_{};
  std::unordered_set<PathToken> touched_{};
};

} // namespace trellis
