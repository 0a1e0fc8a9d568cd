#include "mbt/db/db.h"
#include "mbt/common/config.h"
#include "mbt/log/logger.h"
#include <sstream>

namespace mbt::db {

DbConfig DbConfig::from_env() {
  DbConfig c;
  c.host = getenv_or("MBT_DB_HOST", c.host);
  c.port = std::stoi(getenv_or("MBT_DB_PORT", "5432"));
  c.user = getenv_or("MBT_DB_USER", c.user);
  c.password = getenv_or("MBT_DB_PASSWORD", "");
  c.name = getenv_or("MBT_DB_NAME", c.name);
  return c;
}

Db::Db(DbConfig cfg) : cfg_(std::move(cfg)) {}

Db::~Db() {
  if (conn_) PQfinish(conn_);
}

std::string Db::conninfo() const {
  std::ostringstream ss;
  ss << "host=" << cfg_.host
     << " port=" << cfg_.port
     << " dbname=" << cfg_.name
     << " user=" << cfg_.user;
  if (!cfg_.password.empty()) ss << " password=" << cfg_.password;
  ss << " connect_timeout=10";
  return ss.str();
}

void Db::connect() {
  if (conn_) PQfinish(conn_);
  conn_ = PQconnectdb(conninfo().c_str());
  if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
    std::string err = conn_ ? PQerrorMessage(conn_) : "PQconnectdb failed";
    throw DbError("DB connect failed: " + err);
  }
}

bool Db::is_connected() const {
  return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void Db::ensure_connected() {
  if (!conn_) throw DbError("DB not connected");
  if (PQstatus(conn_) == CONNECTION_OK) return;
  Logger::instance().warn("DB connection lost, resetting");
  PQreset(conn_);
  if (PQstatus(conn_) != CONNECTION_OK) {
    throw DbError(std::string("DB reconnect failed: ") + PQerrorMessage(conn_));
  }
}

PGresult* Db::exec(const std::string& sql) {
  ensure_connected();
  return PQexec(conn_, sql.c_str());
}

PGresult* Db::exec_params(const std::string& sql,
                          const std::vector<std::string>& params) {
  ensure_connected();
  std::vector<const char*> values;
  values.reserve(params.size());
  for (auto& p : params) values.push_back(p.c_str());

  return PQexecParams(
      conn_,
      sql.c_str(),
      static_cast<int>(params.size()),
      nullptr,                 // param types (infer)
      values.data(),
      nullptr,                 // lengths
      nullptr,                 // formats
      0                        // result text
  );
}

void Db::must_ok(PGresult* r, const std::string& ctx) {
  if (!r) throw DbError(ctx + ": PGresult is null");
  auto st = PQresultStatus(r);
  if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
    std::string err = PQresultErrorMessage(r);
    PQclear(r);
    throw DbError(ctx + ": " + err);
  }
}

Db::Transaction::Transaction(Db& db) : db_(db) {
  PGresult* r = db_.exec("BEGIN");
  must_ok(r, "BEGIN");
  PQclear(r);
}

Db::Transaction::~Transaction() {
  if (done_) return;
  try {
    PGresult* r = db_.exec("ROLLBACK");
    must_ok(r, "ROLLBACK");
    PQclear(r);
  } catch (const DbError& e) {
    Logger::instance().error(std::string("transaction rollback failed: ") + e.what());
  }
}

void Db::Transaction::commit() {
  PGresult* r = db_.exec("COMMIT");
  done_ = true;
  must_ok(r, "COMMIT");
  PQclear(r);
}

} // namespace mbt::db
