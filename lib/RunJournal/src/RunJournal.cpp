#include "RunJournal/RunJournal.hpp"

#include <stdexcept>

namespace
{
constexpr const char* SqlCreateTables = "CREATE TABLE IF NOT EXISTS runs ("
                                        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                                        "snapshot TEXT NOT NULL,"
                                        "started_at TEXT NOT NULL,"
                                        "duration_ms INTEGER NOT NULL,"
                                        "status TEXT NOT NULL,"
                                        "failed_count INTEGER NOT NULL);"
                                        "CREATE TABLE IF NOT EXISTS failed_files ("
                                        "run_id INTEGER NOT NULL REFERENCES runs(id),"
                                        "path TEXT NOT NULL);";
}

RunJournal::RunJournal(SQLiteConnection& connection) : _connection(connection)
{
}

bool RunJournal::InitializeSchema()
{
    try
    {
        _connection.Execute(SqlCreateTables);
        return true;
    }
    catch (const std::runtime_error&)
    {
        return false;
    }
}

bool RunJournal::RecordRun(const RunRecord& record, const std::vector<fs::path>& failedFiles)
{
    try
    {
        SQLiteTransaction transaction(_connection);

        auto runStatement = _connection.Prepare("INSERT INTO runs(snapshot, started_at, duration_ms, status, failed_count) "
                                                "VALUES(?1, ?2, ?3, ?4, ?5);");
        runStatement.BindText(1, record.snapshot);
        runStatement.BindText(2, record.startedAt);
        runStatement.BindInt64(3, record.durationMs);
        runStatement.BindText(4, record.status);
        runStatement.BindInt64(5, record.failedCount);
        runStatement.Execute();

        std::int64_t runId = 0;
        {
            auto idStatement = _connection.Prepare("SELECT last_insert_rowid();");
            if (false == idStatement.FetchRow())
            {
                return false;
            }
            runId = idStatement.ColumnInt64(0);
        }

        auto failedStatement = _connection.Prepare("INSERT INTO failed_files(run_id, path) VALUES(?1, ?2);");
        for (const auto& failedFile : failedFiles)
        {
            failedStatement.BindInt64(1, runId);
            failedStatement.BindText(2, failedFile.string());
            failedStatement.Execute();
            failedStatement.Reset();
        }

        transaction.Commit();
        return true;
    }
    catch (const std::runtime_error&)
    {
        return false;
    }
}

std::vector<RunRecord> RunJournal::GetRuns()
{
    auto statement = _connection.Prepare("SELECT snapshot, started_at, duration_ms, status, failed_count FROM runs ORDER BY id DESC;");

    std::vector<RunRecord> results;
    while (statement.FetchRow())
    {
        results.push_back({statement.ColumnText(0), statement.ColumnText(1), statement.ColumnInt64(2), statement.ColumnText(3),
                           statement.ColumnInt64(4)});
    }
    return results;
}

std::vector<std::string> RunJournal::GetFailedFiles(const std::string& snapshot)
{
    auto statement = _connection.Prepare("SELECT failed_files.path FROM failed_files "
                                         "JOIN runs ON runs.id = failed_files.run_id "
                                         "WHERE runs.snapshot = ?1 ORDER BY failed_files.rowid;");
    statement.BindText(1, snapshot);

    std::vector<std::string> results;
    while (statement.FetchRow())
    {
        results.push_back(statement.ColumnText(0));
    }
    return results;
}
