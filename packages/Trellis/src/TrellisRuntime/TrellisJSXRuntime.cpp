#include "TrellisRuntime/TrellisJSXRuntime.h"

#include <string_view>
#include <utility>

namespace trellis {

namespace {

constexpr const char* kChildrenProp = "children";
constexpr const char* kKeyProp = "key";
constexpr const char* kNodeValueProp = "nodeValue";

bool isReservedDevProp(std::string_view name) {
  return name == "__self" || name == "__source";
}

std::optional<std::string> coerceKey(const Value& value) {
  if (value.isString()) {
    return value.getString();
  }
  if (value.isNumber()) {
    return numberToString(value.getNumber());
  }
  return std::nullopt;
}

void appendFlattened(const Renderable& child, Children& out) {
  if (child.getKind() == Renderable::Kind::Sequence) {
    for (const auto& item : child.getItems()) {
      appendFlattened(item, out);
    }
    return;
  }
  if (child.isEmptyValue()) {
    return;
  }
  if (auto normalized = normalizeNode(child)) {
    out.push_back(std::move(normalized));
  }
}

} // namespace

ComponentType defineComponent(std::string displayName, RenderFunction render) {
  return std::make_shared<const ComponentDefinition>(
      ComponentDefinition{std::move(displayName), std::move(render)});
}

ElementType::ElementType(const char* hostTag) : kind_(Kind::Host), tag_(hostTag != nullptr ? hostTag : "") {}

ElementType::ElementType(std::string hostTag) : kind_(Kind::Host), tag_(std::move(hostTag)) {}

ElementType::ElementType(ComponentType component)
    : kind_(Kind::Component), component_(std::move(component)) {}

ElementType::ElementType(FragmentTag) : kind_(Kind::Fragment) {}

ElementType::ElementType(TextTag) : kind_(Kind::Text) {}

std::string ElementType::getDisplayName() const {
  switch (kind_) {
    case Kind::Host:
      return tag_;
    case Kind::Fragment:
      return "#fragment";
    case Kind::Text:
      return "#text";
    case Kind::Component:
      if (component_ && !component_->displayName.empty()) {
        return component_->displayName;
      }
      return "Component";
  }
  return std::string{};
}

bool operator==(const ElementType& a, const ElementType& b) {
  if (a.kind_ != b.kind_) {
    return false;
  }
  switch (a.kind_) {
    case ElementType::Kind::Host:
      return a.tag_ == b.tag_;
    case ElementType::Kind::Component:
      return a.component_ == b.component_;
    case ElementType::Kind::Fragment:
    case ElementType::Kind::Text:
      return true;
  }
  return false;
}

bool operator!=(const ElementType& a, const ElementType& b) {
  return !(a == b);
}

Renderable::Renderable(std::nullptr_t) {}

Renderable::Renderable(bool value) : kind_(Kind::Bool), bool_(value) {}

Renderable::Renderable(int value) : kind_(Kind::Number), number_(static_cast<double>(value)) {}

Renderable::Renderable(double value) : kind_(Kind::Number), number_(value) {}

Renderable::Renderable(const char* text) : kind_(Kind::String), text_(text != nullptr ? text : "") {}

Renderable::Renderable(std::string text) : kind_(Kind::String), text_(std::move(text)) {}

Renderable::Renderable(ElementPtr element)
    : kind_(element ? Kind::Element : Kind::Empty), element_(std::move(element)) {}

Renderable::Renderable(std::vector<Renderable> items) : kind_(Kind::Sequence), items_(std::move(items)) {}

Renderable::Renderable(const Children& elements) : kind_(Kind::Sequence) {
  items_.reserve(elements.size());
  for (const auto& element : elements) {
    items_.emplace_back(element);
  }
}

bool Renderable::isEmptyValue() const noexcept {
  return kind_ == Kind::Empty || kind_ == Kind::Bool;
}

ElementPtr jsx(
    ElementType type,
    Props props,
    std::vector<Renderable> children,
    std::optional<std::string> key) {
  Element element{std::move(type), std::move(key), {}, {}};

  Children flattened = flattenChildren(children);
  auto childrenIt = props.find(kChildrenProp);
  if (childrenIt != props.end()) {
    if (childrenIt->second.holds<Children>()) {
      for (const auto& child : childrenIt->second.getObject<Children>()) {
        if (child) {
          flattened.push_back(child);
        }
      }
    } else if (childrenIt->second.isString() || childrenIt->second.isNumber()) {
      flattened.push_back(createTextElement(childrenIt->second.toString()));
    }
    props.erase(childrenIt);
  }

  for (auto& [name, value] : props) {
    if (name == kKeyProp) {
      if (!element.key) {
        element.key = coerceKey(value);
      }
      continue;
    }
    if (isReservedDevProp(name)) {
      continue;
    }
    element.props.emplace(name, std::move(value));
  }

  if (element.type.isComponent()) {
    if (!flattened.empty()) {
      element.props[kChildrenProp] = Value::object(flattened);
    }
  }
  element.children = std::move(flattened);

  return std::make_shared<const Element>(std::move(element));
}

ElementPtr jsxs(
    ElementType type,
    Props props,
    std::initializer_list<Renderable> children,
    std::optional<std::string> key) {
  return jsx(std::move(type), std::move(props), std::vector<Renderable>(children), std::move(key));
}

ElementPtr fragment(std::vector<Renderable> children, std::optional<std::string> key) {
  return jsx(Fragment, {}, std::move(children), std::move(key));
}

ElementPtr createTextElement(std::string text) {
  Element element{Text, std::nullopt, {}, {}};
  element.props.emplace(kNodeValueProp, Value(std::move(text)));
  return std::make_shared<const Element>(std::move(element));
}

ElementPtr normalizeNode(const Renderable& node) {
  switch (node.getKind()) {
    case Renderable::Kind::Empty:
    case Renderable::Kind::Bool:
      return nullptr;
    case Renderable::Kind::Number:
      return createTextElement(numberToString(node.getNumber()));
    case Renderable::Kind::String:
      return createTextElement(node.getText());
    case Renderable::Kind::Element:
      return node.getElement();
    case Renderable::Kind::Sequence: {
      Children flattened = flattenChildren(node.getItems());
      if (flattened.empty()) {
        return nullptr;
      }
      Element element{Fragment, std::nullopt, {}, std::move(flattened)};
      return std::make_shared<const Element>(std::move(element));
    }
  }
  return nullptr;
}

Children flattenChildren(const std::vector<Renderable>& children) {
  Children result;
  for (const auto& child : children) {
    appendFlattened(child, result);
  }
  return result;
}

Children getChildren(const Props& props) {
  auto it = props.find(kChildrenProp);
  if (it == props.end() || !it->second.holds<Children>()) {
    return {};
  }
  return it->second.getObject<Children>();
}

const std::string& getTextContent(const Element& element) {
  static const std::string empty;
  auto it = element.props.find(kNodeValueProp);
  if (it == element.props.end() || !it->second.isString()) {
    return empty;
  }
  return it->second.getString();
}

bool isSameElementType(const Element& a, const Element& b) {
  return a.type == b.type;
}

} // namespace trellis
