#pragma once

#include "RunJournal/SQLiteStatement.hpp"

#include <filesystem>
#include <string>

struct sqlite3;

namespace fs = std::filesystem;

/**
 * @brief RAII wrapper for a SQLite database connection.
 */
class SQLiteConnection
{
  public:
    /**
     * @brief Default busy timeout for SQLite connections.
     */
    static constexpr int SqliteBusyTimeoutMs = 5000;

    /**
     * @brief Open or create the database file.
     *
     * @param[in] databasePath Path to the SQLite database file
     * @param[in] busyTimeoutMs Busy timeout in milliseconds
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit SQLiteConnection(const fs::path& databasePath, int busyTimeoutMs = SqliteBusyTimeoutMs);
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    /**
     * @brief Execute one or more SQL statements without results.
     *
     * @param[in] sqlStatement SQL to execute
     * @throws std::runtime_error on SQLite errors
     */
    void Execute(const std::string& sqlStatement);

    /**
     * @brief Prepare a SQL statement.
     *
     * @param[in] sqlStatement SQL statement to prepare
     * @return Prepared SQLite statement
     * @throws std::runtime_error on SQLite errors
     */
    SQLiteStatement Prepare(const std::string& sqlStatement);

  private:
    void Close();

    sqlite3* _database;
};

/**
 * @brief Scoped SQLite transaction, rolled back unless committed.
 */
class SQLiteTransaction
{
  public:
    explicit SQLiteTransaction(SQLiteConnection& connection);
    ~SQLiteTransaction();

    SQLiteTransaction(const SQLiteTransaction&) = delete;
    SQLiteTransaction& operator=(const SQLiteTransaction&) = delete;

    void Commit();

  private:
    SQLiteConnection& _connection;
    bool _committed;
};
