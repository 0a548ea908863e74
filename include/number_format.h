#ifndef NUMBER_FORMAT_H
#define NUMBER_FORMAT_H

#include <chrono>
#include <cstdint>
#include <string>

/**
 * @brief Human-readable formatting of counts, sizes, floats and times
 */
class NumberFormat {
public:
    /**
     * @brief Format a parameter count with a K/M/B/T suffix
     * @param count Raw count (e.g. 133700000)
     * @return Scaled string (e.g. "133.70M", "7B", "999")
     */
    static std::string formatParameterCount(std::uint64_t count);

    /**
     * @brief Shortest round-trip representation, switching to exponent form
     *        for exponents below -4 or at or above 6
     * @param value Value to format
     * @return e.g. "8e+09", "1000", "0.25", "1.234567e+06"
     */
    static std::string formatGeneral(double value);

    /**
     * @brief Shortest round-trip representation without an exponent
     * @param value Value to format
     * @return e.g. "4096", "0.5"
     */
    static std::string formatDecimal(double value);

    /**
     * @brief Format a byte count using decimal units
     * @param bytes Size in bytes
     * @return e.g. "512 B", "1.0 KB", "4.7 GB", "13 GB"
     */
    static std::string formatBytes(std::int64_t bytes);

    /**
     * @brief Describe the distance between two points in time
     * @param then The point in time being described
     * @param now The reference point
     * @return e.g. "24 hours ago", "2 days ago", "3 minutes from now"
     */
    static std::string formatRelativeTime(std::chrono::system_clock::time_point then,
                                          std::chrono::system_clock::time_point now);

    /**
     * @brief Parse an RFC 3339 timestamp ("2024-05-01T12:00:00.5-07:00")
     * @param text Timestamp text
     * @param result Output: parsed UTC time point
     * @return True if the timestamp was parsed
     */
    static bool parseTimestamp(const std::string& text, std::chrono::system_clock::time_point& result);
};

#endif // NUMBER_FORMAT_H
