#include "mbt/storage/pg_resume_store.h"
#include <libpq-fe.h>
#include <chrono>

namespace mbt::storage {

using db::Db;

static const char* kTokenColumns =
    "token, transfer_id, file_name, file_size, checksum_md5, checksum_sha256, chunk_size, "
    "temp_directory, encrypted, "
    "(extract(epoch from created_at) * 1000)::bigint, "
    "(extract(epoch from last_activity) * 1000)::bigint, "
    "is_completed";

static std::string to_ms(Clock::time_point tp) {
  using namespace std::chrono;
  return std::to_string(duration_cast<milliseconds>(tp.time_since_epoch()).count());
}

static Clock::time_point from_ms(const char* s) {
  return Clock::time_point(std::chrono::milliseconds(std::stoll(s)));
}

static bool pg_bool(const char* s) { return s && s[0] == 't'; }

static ResumeToken token_row(PGresult* r, int i) {
  ResumeToken t;
  t.token = PQgetvalue(r, i, 0);
  t.transfer_id = PQgetvalue(r, i, 1);
  t.file_name = PQgetvalue(r, i, 2);
  t.file_size = std::stoull(PQgetvalue(r, i, 3));
  t.checksum_md5 = PQgetvalue(r, i, 4);
  t.checksum_sha256 = PQgetvalue(r, i, 5);
  t.chunk_size = static_cast<uint32_t>(std::stoul(PQgetvalue(r, i, 6)));
  t.temp_directory = PQgetvalue(r, i, 7);
  t.encrypted = pg_bool(PQgetvalue(r, i, 8));
  t.created_at = from_ms(PQgetvalue(r, i, 9));
  t.last_activity = from_ms(PQgetvalue(r, i, 10));
  t.is_completed = pg_bool(PQgetvalue(r, i, 11));
  return t;
}

void PgResumeStore::ensure_schema() {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string sql =
      "CREATE TABLE IF NOT EXISTS resume_tokens ("
      "  transfer_id     TEXT PRIMARY KEY,"
      "  token           TEXT NOT NULL UNIQUE,"
      "  file_name       TEXT NOT NULL,"
      "  file_size       BIGINT NOT NULL,"
      "  checksum_md5    TEXT NOT NULL,"
      "  checksum_sha256 TEXT NOT NULL,"
      "  chunk_size      INTEGER NOT NULL,"
      "  temp_directory  TEXT NOT NULL DEFAULT '',"
      "  encrypted       BOOLEAN NOT NULL DEFAULT FALSE,"
      "  created_at      TIMESTAMPTZ NOT NULL DEFAULT now(),"
      "  last_activity   TIMESTAMPTZ NOT NULL DEFAULT now(),"
      "  is_completed    BOOLEAN NOT NULL DEFAULT FALSE"
      ");"
      "CREATE TABLE IF NOT EXISTS resume_chunks ("
      "  transfer_id    TEXT NOT NULL REFERENCES resume_tokens(transfer_id) ON DELETE CASCADE,"
      "  chunk_index    INTEGER NOT NULL,"
      "  chunk_size     BIGINT NOT NULL,"
      "  chunk_checksum TEXT NOT NULL,"
      "  completed_at   TIMESTAMPTZ NOT NULL DEFAULT now(),"
      "  PRIMARY KEY (transfer_id, chunk_index)"
      ");"
      "CREATE INDEX IF NOT EXISTS idx_resume_tokens_activity "
      "  ON resume_tokens(last_activity) WHERE NOT is_completed;";
  PGresult* r = db_.exec(sql);
  Db::must_ok(r, "ensure_schema");
  PQclear(r);
}

void PgResumeStore::create(const ResumeToken& t) {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string sql =
      "INSERT INTO resume_tokens(token, transfer_id, file_name, file_size, checksum_md5, checksum_sha256, "
      "chunk_size, temp_directory, encrypted, created_at, last_activity, is_completed) "
      "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, "
      "to_timestamp($10::double precision / 1000), to_timestamp($11::double precision / 1000), $12);";
  PGresult* r = db_.exec_params(sql, {
      t.token, t.transfer_id, t.file_name, std::to_string(t.file_size),
      t.checksum_md5, t.checksum_sha256, std::to_string(t.chunk_size),
      t.temp_directory, t.encrypted ? "true" : "false",
      to_ms(t.created_at), to_ms(t.last_activity), t.is_completed ? "true" : "false"});
  Db::must_ok(r, "create_resume_token");
  PQclear(r);
}

std::vector<ResumeToken> PgResumeStore::query_tokens(const std::string& where,
                                                     const std::vector<std::string>& params,
                                                     const std::string& ctx) {
  const std::string sql = std::string("SELECT ") + kTokenColumns + " FROM resume_tokens " + where + ";";
  PGresult* r = params.empty() ? db_.exec(sql) : db_.exec_params(sql, params);
  Db::must_ok(r, ctx);

  std::vector<ResumeToken> out;
  int n = PQntuples(r);
  out.reserve(n);
  for (int i = 0; i < n; i++) out.push_back(token_row(r, i));
  PQclear(r);
  return out;
}

std::optional<ResumeToken> PgResumeStore::find_by_token(const std::string& token) {
  std::lock_guard<std::mutex> lk(mu_);
  auto rows = query_tokens("WHERE token = $1 LIMIT 1", {token}, "find_by_token");
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::optional<ResumeToken> PgResumeStore::find_by_transfer(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto rows = query_tokens("WHERE transfer_id = $1 LIMIT 1", {transfer_id}, "find_by_transfer");
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<ResumeChunk> PgResumeStore::completed_chunks(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string sql =
      "SELECT chunk_index, chunk_size, chunk_checksum, "
      "(extract(epoch from completed_at) * 1000)::bigint "
      "FROM resume_chunks WHERE transfer_id = $1 ORDER BY chunk_index;";
  PGresult* r = db_.exec_params(sql, {transfer_id});
  Db::must_ok(r, "completed_chunks");

  std::vector<ResumeChunk> out;
  int n = PQntuples(r);
  out.reserve(n);
  for (int i = 0; i < n; i++) {
    ResumeChunk c;
    c.transfer_id = transfer_id;
    c.chunk_index = static_cast<uint32_t>(std::stoul(PQgetvalue(r, i, 0)));
    c.chunk_size = std::stoull(PQgetvalue(r, i, 1));
    c.chunk_checksum = PQgetvalue(r, i, 2);
    c.completed_at = from_ms(PQgetvalue(r, i, 3));
    out.push_back(std::move(c));
  }
  PQclear(r);
  return out;
}

bool PgResumeStore::mark_chunk_complete(const ResumeChunk& c) {
  std::lock_guard<std::mutex> lk(mu_);
  Db::Transaction tx(db_);
  const std::string sql =
      "INSERT INTO resume_chunks(transfer_id, chunk_index, chunk_size, chunk_checksum, completed_at) "
      "VALUES ($1, $2, $3, $4, to_timestamp($5::double precision / 1000)) "
      "ON CONFLICT (transfer_id, chunk_index) DO NOTHING;";
  PGresult* r = db_.exec_params(sql, {
      c.transfer_id, std::to_string(c.chunk_index), std::to_string(c.chunk_size),
      c.chunk_checksum, to_ms(c.completed_at)});
  Db::must_ok(r, "mark_chunk_complete");
  bool inserted = std::string(PQcmdTuples(r)) == "1";
  PQclear(r);

  if (inserted) {
    PGresult* u = db_.exec_params(
        "UPDATE resume_tokens SET last_activity = now() WHERE transfer_id = $1;", {c.transfer_id});
    Db::must_ok(u, "mark_chunk_complete(touch)");
    PQclear(u);
  }
  tx.commit();
  return inserted;
}

void PgResumeStore::touch(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lk(mu_);
  PGresult* r = db_.exec_params(
      "UPDATE resume_tokens SET last_activity = now() WHERE transfer_id = $1;", {transfer_id});
  Db::must_ok(r, "touch_resume_token");
  PQclear(r);
}

void PgResumeStore::mark_completed(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lk(mu_);
  PGresult* r = db_.exec_params(
      "UPDATE resume_tokens SET is_completed = TRUE, last_activity = now() WHERE transfer_id = $1;",
      {transfer_id});
  Db::must_ok(r, "mark_completed");
  PQclear(r);
}

bool PgResumeStore::remove(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lk(mu_);
  PGresult* r = db_.exec_params("DELETE FROM resume_tokens WHERE transfer_id = $1;", {transfer_id});
  Db::must_ok(r, "remove_resume_token");
  bool removed = std::string(PQcmdTuples(r)) != "0";
  PQclear(r);
  return removed;
}

std::vector<ResumeToken> PgResumeStore::list_stale(Clock::time_point cutoff) {
  std::lock_guard<std::mutex> lk(mu_);
  return query_tokens(
      "WHERE NOT is_completed AND last_activity < to_timestamp($1::double precision / 1000) "
      "ORDER BY last_activity",
      {to_ms(cutoff)}, "list_stale");
}

std::vector<ResumeToken> PgResumeStore::list_active() {
  std::lock_guard<std::mutex> lk(mu_);
  return query_tokens("WHERE NOT is_completed ORDER BY created_at", {}, "list_active");
}

} // namespace mbt::storage
