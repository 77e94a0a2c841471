#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace creditgate::db::postgres {

/*
  Creates every table and index the repository needs. Idempotent.
*/
void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

} // namespace creditgate::db::postgres
