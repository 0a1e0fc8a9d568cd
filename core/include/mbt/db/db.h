#pragma once

#include <libpq-fe.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace mbt::db {

class DbError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct DbConfig {
  std::string host = "127.0.0.1";
  int port = 5432;
  std::string user = "postgres";
  std::string password;
  std::string name = "mbt";

  // MBT_DB_HOST, MBT_DB_PORT, MBT_DB_USER, MBT_DB_PASSWORD, MBT_DB_NAME
  static DbConfig from_env();
};

class Db {
 public:
  explicit Db(DbConfig cfg);
  ~Db();

  Db(const Db&) = delete;
  Db& operator=(const Db&) = delete;

  void connect();
  bool is_connected() const;
  // PQreset on a dropped connection; throws DbError if that fails too.
  void ensure_connected();

  // Execute a parameterized query: PQexecParams
  PGresult* exec_params(const std::string& sql,
                        const std::vector<std::string>& params);

  // Simple exec (no params)
  PGresult* exec(const std::string& sql);

  // Throws DbError (and clears r) unless r is COMMAND_OK / TUPLES_OK.
  static void must_ok(PGresult* r, const std::string& ctx);

  // BEGIN on construction; ROLLBACK on destruction unless committed.
  class Transaction {
   public:
    explicit Transaction(Db& db);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

   private:
    Db& db_;
    bool done_ = false;
  };

 private:
  DbConfig cfg_;
  PGconn* conn_ = nullptr;
  std::string conninfo() const;
};

} // namespace mbt::db
