#pragma once

#include "TrellisRuntime/TrellisHostInterface.h"

#include <memory>
#include <string>

namespace trellis {

class TrellisDOMInstance : public HostInstance {
public:
  ~TrellisDOMInstance() override = default;

  [[nodiscard]] std::shared_ptr<TrellisDOMInstance> getParent() const;
  void setParent(const std::shared_ptr<TrellisDOMInstance>& parent);
  void clearParent();

  [[nodiscard]] virtual bool isTextInstance() const = 0;

protected:
  TrellisDOMInstance() = default;

private:
  std::weak_ptr<TrellisDOMInstance> parent_;
};

} // namespace trellis
