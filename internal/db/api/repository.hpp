#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/archived_state_record.hpp"
#include "internal/db/model/flow_state_record.hpp"
#include "internal/db/model/flow_version_record.hpp"

namespace flowstate::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateFlowState is a compare-and-set on version: it applies only
    when the stored version equals expected_version, else Conflict
  - Version increments are atomic with the state write

  The DB is the source of truth for:
    flow state
    checkpoints
    version history
    archived snapshots
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Flow state (current record)
  // ---------------------------------------------------------------------

  virtual Result InsertFlowState(Transaction&, const model::FlowStateRecord&) = 0;

  virtual std::optional<model::FlowStateRecord> GetFlowState(Transaction&, const std::string& flow_id, const std::string& tenant_id) = 0;

  // Like GetFlowState, but blocks other writers of the row until the
  // transaction ends. Used ahead of read-modify-write of the record.
  virtual std::optional<model::FlowStateRecord> GetFlowStateForUpdate(Transaction&, const std::string& flow_id, const std::string& tenant_id) = 0;

  // Writes version, phase, status, state_blob and updated_at_ms.
  virtual Result UpdateFlowState(Transaction&, const model::FlowStateRecord&, uint64_t expected_version) = 0;

  // Replaces the embedded checkpoint ring without touching version.
  virtual Result UpdateCheckpoints(Transaction&, const std::string& flow_id, const std::string& tenant_id, const std::string& checkpoints_blob) = 0;

  // Removes the record together with its history and archives.
  virtual Result DeleteFlowState(Transaction&, const std::string& flow_id, const std::string& tenant_id) = 0;

  virtual std::vector<model::FlowStateRecord> ListFlowStates(Transaction&, const std::string& tenant_id) = 0;

  // ---------------------------------------------------------------------
  // Version history
  // ---------------------------------------------------------------------

  virtual Result InsertFlowVersion(Transaction&, const model::FlowVersionRecord&) = 0;

  // Ascending by version.
  virtual std::vector<model::FlowVersionRecord> ListFlowVersions(Transaction&, const std::string& flow_id, const std::string& tenant_id) = 0;

  virtual Result DeleteFlowVersionsBelow(Transaction&, const std::string& flow_id, const std::string& tenant_id, uint64_t min_version) = 0;

  // ---------------------------------------------------------------------
  // Archived snapshots
  // ---------------------------------------------------------------------

  virtual Result InsertArchivedState(Transaction&, const model::ArchivedStateRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::ArchivedStateRecord> ListArchivedStates(Transaction&, const std::string& flow_id, const std::string& tenant_id) = 0;

  // Keeps the newest max_entries archives of the flow.
  virtual Result TrimArchivedStates(Transaction&, const std::string& flow_id, const std::string& tenant_id, uint64_t max_entries) = 0;
};

} // namespace flowstate::db
