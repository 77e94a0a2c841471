#pragma once

#include "sqlite_db.hpp"

namespace creditgate::db::sqlite {

/*
  Creates every table and index the repository needs. Idempotent.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace creditgate::db::sqlite
