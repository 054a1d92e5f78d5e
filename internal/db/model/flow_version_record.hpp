#pragma once

#include <cstdint>
#include <string>

namespace flowstate::db::model {

// One row per successful state write, pruned by cleanup.
struct FlowVersionRecord {
  std::string flow_id;
  std::string tenant_id;
  uint64_t    version = 0;
  std::string phase;
  std::string status;
  std::string state_blob;
  uint64_t    created_at_ms = 0;
};

} // namespace flowstate::db::model
