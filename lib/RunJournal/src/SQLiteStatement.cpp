#include "RunJournal/SQLiteStatement.hpp"

#include <sqlite3.h>

#include <stdexcept>

void SQLiteStatement::Finalizer::operator()(sqlite3_stmt* statement) const
{
    sqlite3_finalize(statement);
}

SQLiteStatement::SQLiteStatement(sqlite3_stmt* statement) : _statement(statement)
{
    if (nullptr == _statement)
    {
        throw std::runtime_error("Cannot wrap a statement that failed to prepare");
    }
}

void SQLiteStatement::BindText(int index, const std::string& value)
{
    if (SQLITE_OK != sqlite3_bind_text(_statement.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT))
    {
        throw std::runtime_error("Cannot bind journal value " + std::to_string(index) + ": " +
                                 sqlite3_errmsg(sqlite3_db_handle(_statement.get())));
    }
}

void SQLiteStatement::BindInt64(int index, std::int64_t value)
{
    if (SQLITE_OK != sqlite3_bind_int64(_statement.get(), index, value))
    {
        throw std::runtime_error("Cannot bind journal value " + std::to_string(index) + ": " +
                                 sqlite3_errmsg(sqlite3_db_handle(_statement.get())));
    }
}

int SQLiteStatement::Step(const char* action)
{
    const int stepResult = sqlite3_step(_statement.get());
    if ((SQLITE_ROW != stepResult) && (SQLITE_DONE != stepResult))
    {
        throw std::runtime_error(std::string(action) + " failed: " + sqlite3_errmsg(sqlite3_db_handle(_statement.get())));
    }
    return stepResult;
}

bool SQLiteStatement::FetchRow()
{
    return SQLITE_ROW == Step("Journal query");
}

void SQLiteStatement::Execute()
{
    // A statement meant to write must not yield rows
    if (SQLITE_DONE != Step("Journal write"))
    {
        throw std::runtime_error("Journal write returned rows: " + std::string(sqlite3_sql(_statement.get())));
    }
}

void SQLiteStatement::Reset()
{
    sqlite3_reset(_statement.get());
    sqlite3_clear_bindings(_statement.get());
}

std::string SQLiteStatement::ColumnText(int index) const
{
    const auto* text = sqlite3_column_text(_statement.get(), index);
    return (nullptr == text) ? std::string() : std::string(reinterpret_cast<const char*>(text));
}

std::int64_t SQLiteStatement::ColumnInt64(int index) const
{
    return sqlite3_column_int64(_statement.get(), index);
}
