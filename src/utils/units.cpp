/**
 * @file units.cpp
 * @brief Implementation of unit conversion utilities.
 *
 * Formats byte counts (bytes/Kb/Mb/Gb/Tb, 1024-based) and durations
 * (days/hours/minutes/seconds) for progress status lines and log messages.
 */

#include "units.hpp"

#include <vector>

/**
 * @brief Converts bytes to human-readable string with appropriate unit.
 *
 * Automatically selects the most appropriate unit (bytes, Kb, Mb, Gb, Tb)
 * based on the size, ensuring the numeric value is less than 4096.
 *
 * @param size Size in bytes.
 * @param default_unit Unit suffix to use for raw bytes (e.g., " bytes", "").
 * @param min_unit Minimum unit divisor (1 for bytes, 1024 for KB, etc.).
 * @return Human-readable size string (e.g., "15Mb", "2048 bytes").
 */
std::string bytes2human(uint64_t size, const char* default_unit, uint64_t min_unit){
    static const std::vector<std::string> units { "", "Kb", "Mb", "Gb", "Tb" };

    size_t i = 0;
    while( min_unit > 1 ){
        min_unit /= 1024;
        size /= 1024;
        i++;
    }
    while( i<units.size()-1 && size >= 4096 ){
        i++;
        size /= 1024;
    }
    return std::to_string(size) + (i == 0 ? default_unit : units[i]);
}

/**
 * @brief Converts seconds to human-readable duration string.
 *
 * Formats time duration as combinations of days, hours, minutes, and seconds
 * (e.g., "2d5h", "3h15m30s", "45s"). The maxUnits parameter limits how many
 * different units are shown.
 *
 * @param seconds Duration in seconds.
 * @param maxUnits Maximum number of different time units to display.
 * @return Human-readable duration string.
 */
std::string seconds2human(uint64_t seconds, size_t maxUnits) {
    // Define time units and their corresponding abbreviations
    static const std::vector<std::pair<uint64_t, std::string>> units = {
        {86400, "d"}, // Days
        {3600, "h"},  // Hours
        {60, "m"},    // Minutes
        {1, "s"}      // Seconds
    };

    std::string result;
    size_t unitsAdded = 0;

    for (const auto& unit : units) {
        if (seconds >= unit.first || unitsAdded > 0) { // Ensure we process lower units if a higher one has been added
            if (unitsAdded < maxUnits) {
                uint64_t amount = seconds / unit.first;
                seconds %= unit.first; // Calculate remainder for the next unit
                if (amount > 0 || unitsAdded > 0) { // Add the unit if it's non-zero or if we've already added a unit before
                    result += std::to_string(amount) + unit.second;
                    ++unitsAdded;
                }
            } else {
                break; // Stop if we've added the maximum number of units
            }
        }
    }

    return result.empty() ? "0s" : result; // Handle the case where seconds is 0
}
