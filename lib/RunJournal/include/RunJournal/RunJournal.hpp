#pragma once

#include "RunJournal/SQLiteConnection.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief One finished backup run as stored in the journal.
 */
struct RunRecord
{
    std::string snapshot;     /**< Snapshot directory name */
    std::string startedAt;    /**< Start timestamp, yyyy-MM-dd_HHmm_ss */
    std::int64_t durationMs;  /**< Wall-clock duration of the run */
    std::string status;       /**< CopyStatus string of the run */
    std::int64_t failedCount; /**< Number of files that were not backed up */
};

/**
 * @brief Adapter for persisting the backup run history using SQLite.
 */
class RunJournal
{
  public:
    /**
     * @brief Create a journal bound to an open SQLite connection.
     *
     * @param[in] connection Connection to the journal database
     */
    explicit RunJournal(SQLiteConnection& connection);

    /**
     * @brief Create required database schema if it does not exist.
     *
     * @return true on success, false on error
     */
    bool InitializeSchema();

    /**
     * @brief Store a run and its failed files in one transaction.
     *
     * @param[in] record Run summary
     * @param[in] failedFiles Source paths that were not backed up
     * @return true on success, false on error
     */
    bool RecordRun(const RunRecord& record, const std::vector<fs::path>& failedFiles);

    /**
     * @brief Retrieve all stored runs, newest first.
     *
     * @return Collection of run records
     * @throws std::runtime_error on SQLite errors
     */
    std::vector<RunRecord> GetRuns();

    /**
     * @brief Retrieve the failed files recorded for a snapshot.
     *
     * @param[in] snapshot Snapshot directory name
     * @return Failed source paths in recording order
     * @throws std::runtime_error on SQLite errors
     */
    std::vector<std::string> GetFailedFiles(const std::string& snapshot);

  private:
    SQLiteConnection& _connection;
};
