#include "internal/core/flow_cleanup.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/flow_state_store.hpp"

namespace flowstate::core {

StoreFlowCleanup::StoreFlowCleanup(std::shared_ptr<store::FlowStateStore> store, uint32_t keep_versions)
    : store_(std::move(store)), keep_versions_(keep_versions) {
  if (!store_) {
    throw std::invalid_argument("StoreFlowCleanup requires a store");
  }
}

CleanupReport StoreFlowCleanup::Cleanup(const std::string& flow_id, const std::string& tenant_id) {
  CleanupReport report;
  report.checkpoint_id    = store_->CreateCheckpoint(flow_id, tenant_id, "");
  report.versions_removed = store_->CleanupOldVersions(flow_id, tenant_id, keep_versions_);

  FLOWSTATE_LOG_INFO("Flow cleanup finished", {observability::StringField("flow_id", flow_id), observability::StringField("tenant_id", tenant_id),
                                               observability::StringField("checkpoint_id", report.checkpoint_id),
                                               observability::IntField("versions_removed", static_cast<int64_t>(report.versions_removed))});
  return report;
}

} // namespace flowstate::core
