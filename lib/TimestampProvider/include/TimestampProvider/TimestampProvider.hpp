#pragma once

#include <ctime>
#include <string>

/**
 * @brief Infrastructure component providing snapshot timestamps using C time APIs.
 */
class TimestampProvider
{
  public:
    /**
     * @brief Get the current local time as a snapshot name timestamp.
     *
     * @return Timestamp formatted as yyyy-MM-dd_HHmm_ss
     */
    std::string NowFilesystemSafe() const;

    /**
     * @brief Format a point in time as a snapshot name timestamp.
     *
     * @param[in] time Seconds since the epoch, converted to local time
     * @return Timestamp formatted as yyyy-MM-dd_HHmm_ss
     */
    std::string Format(std::time_t time) const;
};
