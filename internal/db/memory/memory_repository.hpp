#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flowstate::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertFlowState(Transaction&, const model::FlowStateRecord&) override;
  std::optional<model::FlowStateRecord> GetFlowState(Transaction&, const std::string& flow_id,
                                                     const std::string& tenant_id) override;
  std::optional<model::FlowStateRecord> GetFlowStateForUpdate(Transaction&, const std::string& flow_id,
                                                              const std::string& tenant_id) override;
  Result UpdateFlowState(Transaction&, const model::FlowStateRecord&, uint64_t expected_version) override;
  Result UpdateCheckpoints(Transaction&, const std::string& flow_id, const std::string& tenant_id,
                           const std::string& checkpoints_blob) override;
  Result DeleteFlowState(Transaction&, const std::string& flow_id, const std::string& tenant_id) override;
  std::vector<model::FlowStateRecord> ListFlowStates(Transaction&, const std::string& tenant_id) override;

  Result InsertFlowVersion(Transaction&, const model::FlowVersionRecord&) override;
  std::vector<model::FlowVersionRecord> ListFlowVersions(Transaction&, const std::string& flow_id,
                                                         const std::string& tenant_id) override;
  Result DeleteFlowVersionsBelow(Transaction&, const std::string& flow_id, const std::string& tenant_id,
                                 uint64_t min_version) override;

  Result InsertArchivedState(Transaction&, const model::ArchivedStateRecord&) override;
  std::vector<model::ArchivedStateRecord> ListArchivedStates(Transaction&, const std::string& flow_id,
                                                             const std::string& tenant_id) override;
  Result TrimArchivedStates(Transaction&, const std::string& flow_id, const std::string& tenant_id,
                            uint64_t max_entries) override;

private:
  friend class MemoryTransaction;

  // (tenant_id, flow_id)
  using FlowKey = std::pair<std::string, std::string>;

  struct State {
    std::map<FlowKey, model::FlowStateRecord>                  flows;
    std::map<FlowKey, std::vector<model::FlowVersionRecord>>   versions;
    std::map<FlowKey, std::vector<model::ArchivedStateRecord>> archives;
  };

  // held by a transaction from Begin() until Commit()/Rollback()
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State      committed_;
};

}
