#pragma once

#include <string>
#include <vector>

namespace flowstate::db::sql {

/*
  Ordered schema migrations. Index i holds the statements of version i+1.
  Append only; never edit a released entry.
*/

const std::vector<std::vector<std::string>>& SqliteMigrations();
const std::vector<std::vector<std::string>>& PostgresMigrations();

} // namespace flowstate::db::sql
