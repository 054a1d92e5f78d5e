#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace flowstate::store {
class FlowStateStore;
}

namespace flowstate::core {

struct CleanupReport {
  std::string checkpoint_id;
  std::size_t versions_removed = 0;
};

// End-of-life housekeeping for one flow, injected into the manager.
class FlowCleanup {
 public:
  virtual ~FlowCleanup() = default;

  virtual CleanupReport Cleanup(const std::string& flow_id, const std::string& tenant_id) = 0;
};

// Takes a final archival checkpoint, then prunes version history down to
// the newest keep_versions entries.
class StoreFlowCleanup final : public FlowCleanup {
 public:
  StoreFlowCleanup(std::shared_ptr<store::FlowStateStore> store, uint32_t keep_versions);

  CleanupReport Cleanup(const std::string& flow_id, const std::string& tenant_id) override;

 private:
  std::shared_ptr<store::FlowStateStore> store_;
  uint32_t                               keep_versions_;
};

} // namespace flowstate::core
