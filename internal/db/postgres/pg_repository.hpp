#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace flowstate::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertFlowState(Transaction&, const model::FlowStateRecord&) override;
  std::optional<model::FlowStateRecord> GetFlowState(Transaction&, const std::string& flow_id, const std::string& tenant_id) override;
  std::optional<model::FlowStateRecord> GetFlowStateForUpdate(Transaction&, const std::string& flow_id, const std::string& tenant_id) override;
  Result UpdateFlowState(Transaction&, const model::FlowStateRecord&, uint64_t expected_version) override;
  Result UpdateCheckpoints(Transaction&, const std::string& flow_id, const std::string& tenant_id, const std::string& checkpoints_blob) override;
  Result DeleteFlowState(Transaction&, const std::string& flow_id, const std::string& tenant_id) override;
  std::vector<model::FlowStateRecord> ListFlowStates(Transaction&, const std::string& tenant_id) override;

  Result InsertFlowVersion(Transaction&, const model::FlowVersionRecord&) override;
  std::vector<model::FlowVersionRecord> ListFlowVersions(Transaction&, const std::string& flow_id, const std::string& tenant_id) override;
  Result DeleteFlowVersionsBelow(Transaction&, const std::string& flow_id, const std::string& tenant_id, uint64_t min_version) override;

  Result InsertArchivedState(Transaction&, const model::ArchivedStateRecord&) override;
  std::vector<model::ArchivedStateRecord> ListArchivedStates(Transaction&, const std::string& flow_id, const std::string& tenant_id) override;
  Result TrimArchivedStates(Transaction&, const std::string& flow_id, const std::string& tenant_id, uint64_t max_entries) override;

 private:
  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace flowstate::db::postgres
