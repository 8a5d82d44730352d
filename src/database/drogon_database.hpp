#pragma once

/// @file
/// @brief Connection and transaction handles backed by Drogon's ORM clients.
///
/// All calls block until the database has answered. They must not be made
/// from one of Drogon's event loop threads.

#include "database/database.hpp"
#include "utils/config.hpp"

#include <drogon/orm/DbClient.h>
#include <future>
#include <memory>
#include <string>

class DrogonTransaction final : public Transaction {
public:
  DrogonTransaction(std::shared_ptr<drogon::orm::Transaction> transaction,
                    std::future<bool> committed);
  ~DrogonTransaction() override;

  DrogonTransaction(const DrogonTransaction &) = delete;
  DrogonTransaction &operator=(const DrogonTransaction &) = delete;

  void execute(const std::string &sql, const SqlParameters &params) override;
  void commit() override;
  void rollback() override;

private:
  std::shared_ptr<drogon::orm::Transaction> _transaction;
  std::future<bool> _committed;
};

class DrogonConnection final : public Connection {
public:
  explicit DrogonConnection(drogon::orm::DbClientPtr client);

  void execute(const std::string &sql, const SqlParameters &params) override;

  [[nodiscard]] std::unique_ptr<Transaction> begin_transaction() override;

private:
  drogon::orm::DbClientPtr _client;
};

/**
 * @brief Creates a Drogon database client for the configured backend.
 *
 * The client owns its own event loop, so it can be used without running the
 * Drogon application.
 */
[[nodiscard]] drogon::orm::DbClientPtr make_db_client(const DBConfig &config);
