#pragma once

#include <cstdint>
#include <string>

namespace flowstate::db::model {

// Corrupted or superseded state kept for forensic inspection.
struct ArchivedStateRecord {
  std::string archive_id;
  std::string flow_id;
  std::string tenant_id;
  uint64_t    version = 0;
  std::string reason;
  std::string state_blob;
  uint64_t    archived_at_ms = 0;
};

} // namespace flowstate::db::model
