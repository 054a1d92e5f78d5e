#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace flowstate::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
