#include "TrellisDOM/client/TrellisDOMComponent.h"

#include <algorithm>
#include <map>

namespace trellis {

namespace {

std::string escapeMarkup(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '<':
        escaped += "&lt;";
        break;
      case '>':
        escaped += "&gt;";
        break;
      case '&':
        escaped += "&amp;";
        break;
      case '"':
        escaped += "&quot;";
        break;
      default:
        escaped += c;
        break;
    }
  }
  return escaped;
}

} // namespace

TrellisDOMComponent::TrellisDOMComponent(
    std::string type,
    bool isTextInstance,
    std::string textContent)
    : type_(std::move(type)),
      isTextInstance_(isTextInstance),
      textContent_(std::move(textContent)) {}

bool TrellisDOMComponent::isTextInstance() const {
  return isTextInstance_;
}

const std::string& TrellisDOMComponent::getType() const noexcept {
  return type_;
}

const std::unordered_map<std::string, Value>& TrellisDOMComponent::getProps() const noexcept {
  return props_;
}

const std::string& TrellisDOMComponent::getTextContent() const noexcept {
  return textContent_;
}

const Value* TrellisDOMComponent::getProp(const std::string& name) const {
  auto it = props_.find(name);
  if (it == props_.end()) {
    return nullptr;
  }
  return &it->second;
}

void TrellisDOMComponent::setProp(const std::string& name, Value value) {
  props_[name] = std::move(value);
}

void TrellisDOMComponent::removeProp(const std::string& name) {
  props_.erase(name);
}

void TrellisDOMComponent::setTextContent(std::string text) {
  textContent_ = std::move(text);
}

void TrellisDOMComponent::addListener(const std::string& eventName, const Value& listener) {
  listeners_[eventName].push_back(listener);
}

void TrellisDOMComponent::removeListener(const std::string& eventName, const Value& listener) {
  auto it = listeners_.find(eventName);
  if (it == listeners_.end()) {
    return;
  }
  auto& bound = it->second;
  bound.erase(
      std::remove_if(
          bound.begin(),
          bound.end(),
          [&](const Value& candidate) {
            return Value::sameValue(candidate, listener);
          }),
      bound.end());
  if (bound.empty()) {
    listeners_.erase(it);
  }
}

std::size_t TrellisDOMComponent::getListenerCount(const std::string& eventName) const {
  auto it = listeners_.find(eventName);
  return it == listeners_.end() ? 0 : it->second.size();
}

std::size_t TrellisDOMComponent::dispatchEvent(const std::string& eventName, const Value& event) {
  auto it = listeners_.find(eventName);
  if (it == listeners_.end()) {
    return 0;
  }
  // Listeners may rebind during dispatch.
  const std::vector<Value> snapshot = it->second;
  for (const auto& listener : snapshot) {
    listener.call({event});
  }
  return snapshot.size();
}

std::string TrellisDOMComponent::debugDescription() const {
  if (isTextInstance_) {
    return "#text{" + textContent_ + "}";
  }
  return "<" + type_ + ">";
}

std::string TrellisDOMComponent::toMarkup() const {
  if (isTextInstance_) {
    return escapeMarkup(textContent_);
  }

  std::map<std::string, const Value*> sorted;
  for (const auto& [name, value] : props_) {
    sorted.emplace(name, &value);
  }

  std::string markup = "<" + type_;
  for (const auto& [name, value] : sorted) {
    if (value->isFunction() || value->isObject() || value->isNullish()) {
      continue;
    }
    markup += " " + name + "=\"" + escapeMarkup(value->toString()) + "\"";
  }
  markup += ">";
  markup += innerMarkup();
  markup += "</" + type_ + ">";
  return markup;
}

std::string TrellisDOMComponent::innerMarkup() const {
  std::string markup;
  for (const auto& child : children) {
    auto component = std::dynamic_pointer_cast<TrellisDOMComponent>(child);
    if (component) {
      markup += component->toMarkup();
    }
  }
  return markup;
}

} // namespace trellis
