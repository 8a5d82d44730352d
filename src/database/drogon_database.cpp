#include "database/drogon_database.hpp"
#include "utils/errors.hpp"
#include <drogon/orm/Exception.h>
#include <drogon/orm/Result.h>
#include <drogon/orm/SqlBinder.h>
#include <optional>
#include <trantor/utils/Logger.h>
#include <utility>
#include <variant>

namespace {
/**
 * @brief Binds the parameters and runs the statement in blocking mode.
 *
 * The binder executes when it goes out of scope. In blocking mode that
 * happens on this thread and the callbacks run before the scope is left.
 */
void execute_blocking(drogon::orm::DbClient &client, const std::string &sql,
                      const SqlParameters &params) {
  std::optional<std::string> failure;
  {
    auto binder = client << sql;
    for (const auto &param : params) {
      std::visit([&binder](const auto value) { binder << value; }, param);
    }
    binder << drogon::orm::Mode::Blocking;
    binder >> [](const drogon::orm::Result &) {};
    binder >> [&failure](const drogon::orm::DrogonDbException &e) {
      failure = e.base().what();
    };
  }
  if (failure.has_value()) {
    throw DatabaseError(failure.value());
  }
}
} // namespace

DrogonTransaction::DrogonTransaction(
    std::shared_ptr<drogon::orm::Transaction> transaction,
    std::future<bool> committed)
    : _transaction(std::move(transaction)), _committed(std::move(committed)) {}

DrogonTransaction::~DrogonTransaction() {
  // Drogon commits a transaction when its last reference goes away. One that
  // was neither committed nor rolled back must not end up committed.
  if (_transaction != nullptr) {
    LOG_DEBUG << "Transaction dropped without commit, rolling back";
    _transaction->rollback();
  }
}

void DrogonTransaction::execute(const std::string &sql,
                                const SqlParameters &params) {
  if (_transaction == nullptr) {
    throw DatabaseError("Transaction has already been finished");
  }
  execute_blocking(*_transaction, sql, params);
}

void DrogonTransaction::commit() {
  if (_transaction == nullptr) {
    throw DatabaseError("Transaction has already been finished");
  }
  // Releasing the last reference makes Drogon send the COMMIT. The outcome
  // arrives through the commit callback.
  _transaction.reset();
  try {
    if (!_committed.get()) {
      throw DatabaseError("The database did not accept the commit");
    }
  } catch (const std::future_error &) {
    // Drogon drops the callback when it already rolled the transaction back.
    throw DatabaseError("The transaction was rolled back before the commit");
  }
}

void DrogonTransaction::rollback() {
  if (_transaction == nullptr) {
    throw DatabaseError("Transaction has already been finished");
  }
  _transaction->rollback();
  _transaction.reset();
}

DrogonConnection::DrogonConnection(drogon::orm::DbClientPtr client)
    : _client(std::move(client)) {}

void DrogonConnection::execute(const std::string &sql,
                               const SqlParameters &params) {
  execute_blocking(*_client, sql, params);
}

[[nodiscard]] std::unique_ptr<Transaction>
DrogonConnection::begin_transaction() {
  auto committed = std::make_shared<std::promise<bool>>();
  auto outcome = committed->get_future();

  std::shared_ptr<drogon::orm::Transaction> transaction;
  try {
    transaction = _client->newTransaction(
        [committed](bool success) { committed->set_value(success); });
  } catch (const drogon::orm::DrogonDbException &e) {
    throw DatabaseError(e.base().what());
  }
  if (transaction == nullptr) {
    throw DatabaseError("No database connection available");
  }

  return std::make_unique<DrogonTransaction>(std::move(transaction),
                                             std::move(outcome));
}

[[nodiscard]] drogon::orm::DbClientPtr make_db_client(const DBConfig &config) {
  const auto connection_string = config.get_connection_string();
  switch (config.backend) {
  case DatabaseBackend::Postgresql:
    return drogon::orm::DbClient::newPgClient(connection_string,
                                              config.connections);
  case DatabaseBackend::Mysql:
    return drogon::orm::DbClient::newMysqlClient(connection_string,
                                                 config.connections);
  case DatabaseBackend::Sqlite3:
    return drogon::orm::DbClient::newSqlite3Client(connection_string,
                                                   config.connections);
  }
  throw ConfigError("Unknown database backend");
}
