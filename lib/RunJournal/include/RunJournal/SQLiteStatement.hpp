#pragma once

#include <cstdint>
#include <memory>
#include <string>

struct sqlite3_stmt;

/**
 * @brief Prepared journal statement. Any step that SQLite rejects throws std::runtime_error.
 */
class SQLiteStatement
{
  public:
    explicit SQLiteStatement(sqlite3_stmt* statement);

    void BindText(int index, const std::string& value);
    void BindInt64(int index, std::int64_t value);

    /**
     * @brief Advance to the next result row.
     *
     * @return false once the result set is exhausted
     */
    bool FetchRow();
    /**
     * @brief Run an INSERT or DDL statement to completion.
     */
    void Execute();
    /**
     * @brief Rewind the statement and drop its bindings so the next row can be bound.
     */
    void Reset();

    std::string ColumnText(int index) const;
    std::int64_t ColumnInt64(int index) const;

  private:
    struct Finalizer
    {
        void operator()(sqlite3_stmt* statement) const;
    };

    int Step(const char* action);

    std::unique_ptr<sqlite3_stmt, Finalizer> _statement;
};
