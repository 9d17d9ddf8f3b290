#include "ChecksumVerifier/ChecksumVerifier.hpp"

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

namespace
{
constexpr std::size_t FileReadBufferSize = 8192;

struct DigestContextDeleter
{
    void operator()(EVP_MD_CTX* context) const
    {
        EVP_MD_CTX_free(context);
    }
};

using DigestContextPtr = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string ToHex(const unsigned char* data, unsigned int length)
{
    std::ostringstream outputStream;
    outputStream << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i)
    {
        outputStream << std::setw(2) << static_cast<unsigned int>(data[i]);
    }
    return outputStream.str();
}
}

ChecksumVerifier::ChecksumVerifier(Logger& logger) : _logger(logger)
{
}

bool ChecksumVerifier::Verify(const fs::path& originalPath, const fs::path& copyPath) const
{
    std::error_code errorCode;
    const bool originalIsDirectory = fs::is_directory(originalPath, errorCode);
    errorCode.clear();
    const bool copyIsDirectory = fs::is_directory(copyPath, errorCode);
    if ((true == originalIsDirectory) || (true == copyIsDirectory))
    {
        _logger.Debug("Skipping checksum verification for directory: " + originalPath.string());
        return true;
    }

    std::string originalDigest;
    if (false == ComputeSha256(originalPath, originalDigest))
    {
        _logger.Error("Failed to compute checksum for " + originalPath.string());
        return false;
    }

    std::string copyDigest;
    if (false == ComputeSha256(copyPath, copyDigest))
    {
        _logger.Error("Failed to compute checksum for " + copyPath.string());
        return false;
    }

    if (originalDigest != copyDigest)
    {
        _logger.Warning("Checksum mismatch: " + originalDigest + " (original) != " + copyDigest + " (copied)");
        return false;
    }

    _logger.Debug("File checksum verified: " + copyPath.string());
    return true;
}

bool ChecksumVerifier::ComputeSha256(const fs::path& filePath, std::string& outputDigest) const
{
    std::ifstream inputStream(filePath, std::ios::binary);
    if (false == inputStream.is_open())
    {
        return false;
    }

    DigestContextPtr context(EVP_MD_CTX_new());
    if (nullptr == context)
    {
        return false;
    }

    if (1 != EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr))
    {
        return false;
    }

    char buffer[FileReadBufferSize];
    const std::streamsize bufferSize = static_cast<std::streamsize>(sizeof(buffer));
    while (true)
    {
        inputStream.read(buffer, bufferSize);
        const std::streamsize bytesRead = inputStream.gcount();
        if (0 < bytesRead)
        {
            if (1 != EVP_DigestUpdate(context.get(), buffer, static_cast<std::size_t>(bytesRead)))
            {
                return false;
            }
        }
        if (bufferSize > bytesRead)
        {
            break;
        }
    }

    if (true == inputStream.bad())
    {
        return false;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (1 != EVP_DigestFinal_ex(context.get(), digest, &digestLength))
    {
        return false;
    }

    outputDigest = ToHex(digest, digestLength);
    return true;
}
