#pragma once

#include <chrono>
#include <string>

/**
 * @brief Format a run duration for humans.
 *
 * Minutes and seconds are shown when non-zero, milliseconds only when both are zero,
 * e.g. "2 minutes, 1 second" or "250 milliseconds". A zero duration is "0 seconds".
 *
 * @param[in] duration Duration to format
 * @return Formatted duration
 */
std::string FormatDuration(std::chrono::milliseconds duration);
