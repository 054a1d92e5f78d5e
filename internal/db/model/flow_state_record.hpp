#pragma once

#include <cstdint>
#include <string>

namespace flowstate::db::model {

/*
  Persistent flow state row. One per (flow_id, tenant_id).

  IMPORTANT:
  - This is the authoritative record; caches are derived from it.
  - version is the optimistic concurrency counter (1 after the first write).
  - phase/status mirror the document for indexed querying.
  - checkpoints_blob is a serialized flowstate.v1.CheckpointRing.
*/

struct FlowStateRecord {
  std::string flow_id;
  std::string tenant_id;

  uint64_t version = 0;

  std::string phase;
  std::string status;

  // codec output (compressed / field-encrypted)
  std::string state_blob;
  std::string checkpoints_blob;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

}
