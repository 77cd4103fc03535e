#pragma once

#include "TrellisRuntime/TrellisValue.h"

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

struct Element;
class Renderable;

using ElementPtr = std::shared_ptr<const Element>;
using Children = std::vector<ElementPtr>;
using Props = std::unordered_map<std::string, Value>;
using RenderFunction = std::function<Renderable(const Props& props)>;

struct ComponentDefinition {
  std::string displayName;
  RenderFunction render;
};

using ComponentType = std::shared_ptr<const ComponentDefinition>;

ComponentType defineComponent(std::string displayName, RenderFunction render);

struct FragmentTag {};
struct TextTag {};

inline constexpr FragmentTag Fragment{};
inline constexpr TextTag Text{};

class ElementType {
public:
  enum class Kind : std::uint8_t {
    Host = 0,
    Fragment = 1,
    Text = 2,
    Component = 3,
  };

  ElementType(const char* hostTag);
  ElementType(std::string hostTag);
  ElementType(ComponentType component);
  ElementType(FragmentTag);
  ElementType(TextTag);

  [[nodiscard]] Kind getKind() const noexcept {
    return kind_;
  }
  [[nodiscard]] bool isHost() const noexcept {
    return kind_ == Kind::Host;
  }
  [[nodiscard]] bool isFragment() const noexcept {
    return kind_ == Kind::Fragment;
  }
  [[nodiscard]] bool isText() const noexcept {
    return kind_ == Kind::Text;
  }
  [[nodiscard]] bool isComponent() const noexcept {
    return kind_ == Kind::Component;
  }

  [[nodiscard]] const std::string& getHostTag() const noexcept {
    return tag_;
  }
  [[nodiscard]] const ComponentType& getComponent() const noexcept {
    return component_;
  }

  // Host tag, component display name, "#fragment" or "#text".
  [[nodiscard]] std::string getDisplayName() const;

  friend bool operator==(const ElementType& a, const ElementType& b);
  friend bool operator!=(const ElementType& a, const ElementType& b);

private:
  Kind kind_{Kind::Host};
  std::string tag_{};
  ComponentType component_{};
};

struct Element {
  ElementType type;
  std::optional<std::string> key;
  Props props;
  Children children;
};

/**
 * Arbitrary render output: empty, booleans, numbers, strings, elements and
 * nested sequences of those. normalizeNode reduces it to a canonical element.
 */
class Renderable {
public:
  enum class Kind : std::uint8_t {
    Empty = 0,
    Bool = 1,
    Number = 2,
    String = 3,
    Element = 4,
    Sequence = 5,
  };

  Renderable() = default;
  Renderable(std::nullptr_t);
  Renderable(bool value);
  Renderable(int value);
  Renderable(double value);
  Renderable(const char* text);
  Renderable(std::string text);
  Renderable(ElementPtr element);
  Renderable(std::vector<Renderable> items);
  Renderable(const Children& elements);

  [[nodiscard]] Kind getKind() const noexcept {
    return kind_;
  }
  [[nodiscard]] bool getBool() const noexcept {
    return bool_;
  }
  [[nodiscard]] double getNumber() const noexcept {
    return number_;
  }
  [[nodiscard]] const std::string& getText() const noexcept {
    return text_;
  }
  [[nodiscard]] const ElementPtr& getElement() const noexcept {
    return element_;
  }
  [[nodiscard]] const std::vector<Renderable>& getItems() const noexcept {
    return items_;
  }

  // null, undefined-like and boolean output renders nothing
  [[nodiscard]] bool isEmptyValue() const noexcept;

private:
  Kind kind_{Kind::Empty};
  bool bool_{false};
  double number_{0.0};
  std::string text_{};
  ElementPtr element_{};
  std::vector<Renderable> items_{};
};

ElementPtr jsx(
    ElementType type,
    Props props = {},
    std::vector<Renderable> children = {},
    std::optional<std::string> key = std::nullopt);

// Same as jsx for a statically known child list.
ElementPtr jsxs(
    ElementType type,
    Props props,
    std::initializer_list<Renderable> children,
    std::optional<std::string> key = std::nullopt);

ElementPtr fragment(std::vector<Renderable> children, std::optional<std::string> key = std::nullopt);

ElementPtr createTextElement(std::string text);

ElementPtr normalizeNode(const Renderable& node);

Children flattenChildren(const std::vector<Renderable>& children);

// Children a component element received, as exposed through its "children" prop.
Children getChildren(const Props& props);

const std::string& getTextContent(const Element& element);

bool isSameElementType(const Element& a, const Element& b);

} // namespace trellis
