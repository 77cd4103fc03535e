#pragma once

#include <stdexcept>
#include <string>

namespace trellis {

class DuplicateKeyError : public std::logic_error {
public:
  DuplicateKeyError(const std::string& key, const std::string& parentPath);

  [[nodiscard]] const std::string& getKey() const noexcept;
  [[nodiscard]] const std::string& getParentPath() const noexcept;

private:
  std::string key_;
  std::string parentPath_;
};

class HookOrderError : public std::logic_error {
public:
  explicit HookOrderError(const std::string& message);
};

class InvalidHookCallError : public std::logic_error {
public:
  InvalidHookCallError();
};

} // namespace trellis
