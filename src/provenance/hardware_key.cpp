#include "pxl/provenance/hardware_key.h"

#include <algorithm>
#include <mutex>

namespace pxl::provenance {

HardwareKeyRegistry& HardwareKeyRegistry::Instance() noexcept {
  static HardwareKeyRegistry registry;
  return registry;
}

void HardwareKeyRegistry::RegisterCapability(HardwareKeyCapabilityPtr capability) {
  if (!capability) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = std::string(capability->Id());
  auto it = std::find_if(capabilities_.begin(), capabilities_.end(),
                         [&id](const HardwareKeyCapabilityPtr& existing) {
                           return existing && existing->Id() == id;
                         });
  if (it != capabilities_.end()) {
    *it = std::move(capability);
    return;
  }
  capabilities_.push_back(std::move(capability));
}

HardwareKeyCapabilityPtr HardwareKeyRegistry::FindCapability(std::string_view id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& capability : capabilities_) {
    if (capability && capability->Id() == id) {
      return capability;
    }
  }
  return nullptr;
}

std::vector<HardwareKeyCapabilityPtr> HardwareKeyRegistry::Capabilities() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capabilities_;
}

std::vector<std::string> HardwareKeyRegistry::CapabilityIds() const {
  std::vector<std::string> ids;
  std::lock_guard<std::mutex> lock(mutex_);
  ids.reserve(capabilities_.size());
  for (const auto& capability : capabilities_) {
    if (capability) {
      ids.emplace_back(capability->Id());
    }
  }
  return ids;
}

void HardwareKeyRegistry::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  capabilities_.clear();
}

}  // namespace pxl::provenance
