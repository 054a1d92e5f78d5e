#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace flowstate::util {

/*
  UUID helpers

  Checkpoint and archive ids are RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewId();

} // namespace flowstate::util
