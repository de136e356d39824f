#pragma once

#include <memory>

namespace jobclaim::db {

namespace sqlite {
class SqliteDB;
}

namespace postgres {
class PgPool;
}

/*
  Idempotent schema bootstrap (CREATE ... IF NOT EXISTS), run by the
  composition root before the repository is handed out. The trailing probe
  SELECTs fail fast when an existing table has an incompatible layout.
*/

void BootstrapSqliteSchema(sqlite::SqliteDB& db);

void BootstrapPostgresSchema(const std::shared_ptr<postgres::PgPool>& pool);

} // namespace jobclaim::db
