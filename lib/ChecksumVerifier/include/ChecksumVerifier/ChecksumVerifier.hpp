#pragma once

#include "Logger/Logger.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Infrastructure component verifying copied files by SHA-256 digest using OpenSSL.
 */
class ChecksumVerifier
{
  public:
    /**
     * @brief Construct a checksum verifier.
     *
     * @param[in] logger Logger for digest diagnostics
     */
    explicit ChecksumVerifier(Logger& logger);
    virtual ~ChecksumVerifier() = default;

    /**
     * @brief Compare the contents of an original file and its copy.
     *
     * Directories are never content-compared: if either path is a directory the
     * result is true. Any read or digest error yields false.
     *
     * @param[in] originalPath Source file
     * @param[in] copyPath Copied file
     * @return true if both digests are equal, false on mismatch or error
     */
    virtual bool Verify(const fs::path& originalPath, const fs::path& copyPath) const;

    /**
     * @brief Compute the SHA-256 digest of a file.
     *
     * @param[in] filePath Path to the file to hash
     * @param[out] outputDigest Lower-case hex encoded digest
     * @return true on success, false on error
     */
    bool ComputeSha256(const fs::path& filePath, std::string& outputDigest) const;

  private:
    Logger& _logger;
};
