#pragma once

#include "TrellisDOM/client/TrellisDOMInstance.h"
#include "TrellisRuntime/TrellisValue.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

class TrellisDOMComponent final : public TrellisDOMInstance {
public:
  explicit TrellisDOMComponent(
      std::string type,
      bool isTextInstance = false,
      std::string textContent = {});

  [[nodiscard]] bool isTextInstance() const override;
  [[nodiscard]] const std::string& getType() const noexcept;
  [[nodiscard]] const std::unordered_map<std::string, Value>& getProps() const noexcept;
  [[nodiscard]] const std::string& getTextContent() const noexcept;
  [[nodiscard]] const Value* getProp(const std::string& name) const;

  void setProp(const std::string& name, Value value);
  void removeProp(const std::string& name);
  void setTextContent(std::string text);

  void addListener(const std::string& eventName, const Value& listener);
  void removeListener(const std::string& eventName, const Value& listener);
  [[nodiscard]] std::size_t getListenerCount(const std::string& eventName) const;

  // Calls every listener bound to eventName with the event value; returns the number called.
  std::size_t dispatchEvent(const std::string& eventName, const Value& event = Value::undefined());

  [[nodiscard]] std::string debugDescription() const override;

  // Serialized subtree: <tag a="1">text</tag>, attributes in name order.
  [[nodiscard]] std::string toMarkup() const;
  [[nodiscard]] std::string innerMarkup() const;

  std::vector<std::shared_ptr<TrellisDOMInstance>> children;

private:
  std::string type_;
  bool isTextInstance_{false};
  std::unordered_map<std::string, Value> props_;
  std::unordered_map<std::string, std::vector<Value>> listeners_;
  std::string textContent_{};
};

using TrellisDOMComponentPtr = std::shared_ptr<TrellisDOMComponent>;

} // namespace trellis
