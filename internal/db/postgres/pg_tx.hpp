#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace tams::db::postgres {

/*
  Postgres transaction over a pooled connection.

  Runs at SERIALIZABLE so concurrent segment writers on one flow cannot
  both pass the overlap check; the loser's Commit() throws StorageFailure.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::transaction_base& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::transaction<pqxx::isolation_level::serializable>> tx_;
  bool committed_ = false;
  bool finished_ = false;
};

}
