#include "number_format.h"
#include <charconv>
#include <cmath>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

const double THOUSAND = 1e3;
const double MILLION = 1e6;
const double BILLION = 1e9;
const double TRILLION = 1e12;

// Infinity and NaN are spelled the same way for every float format
bool formatNonFinite(double value, std::string& out) {
    if (std::isnan(value)) {
        out = "NaN";
        return true;
    }
    if (std::isinf(value)) {
        out = value > 0 ? "+Inf" : "-Inf";
        return true;
    }
    return false;
}

std::string toChars(double value, std::chars_format fmt) {
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, fmt);
    return std::string(buffer, result.ptr);
}

std::string scaled(double number, int precision, const char* suffix) {
    std::ostringstream oss;
    if (number == std::floor(number)) {
        precision = 0;
    }
    oss << std::fixed << std::setprecision(precision) << number << suffix;
    return oss.str();
}

std::string plural(long long value, const char* unit) {
    return std::to_string(value) + " " + unit;
}

std::string humanDuration(double seconds) {
    long long wholeSeconds = static_cast<long long>(seconds);
    if (wholeSeconds < 1) {
        return "Less than a second";
    }
    if (wholeSeconds == 1) {
        return "1 second";
    }
    if (wholeSeconds < 60) {
        return plural(wholeSeconds, "seconds");
    }

    long long minutes = static_cast<long long>(seconds / 60.0);
    if (minutes == 1) {
        return "About a minute";
    }
    if (minutes < 60) {
        return plural(minutes, "minutes");
    }

    long long hours = std::llround(seconds / 3600.0);
    if (hours == 1) {
        return "About an hour";
    }
    if (hours < 48) {
        return plural(hours, "hours");
    }
    if (hours < 24 * 7 * 2) {
        return plural(hours / 24, "days");
    }
    if (hours < 24 * 30 * 2) {
        return plural(hours / 24 / 7, "weeks");
    }
    if (hours < 24 * 365 * 2) {
        return plural(hours / 24 / 30, "months");
    }
    return plural(static_cast<long long>(seconds / 3600.0 / 24.0 / 365.0), "years");
}

std::time_t toUtcTime(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

} // namespace

std::string NumberFormat::formatParameterCount(std::uint64_t count) {
    double value = static_cast<double>(count);

    if (value >= TRILLION) {
        return scaled(value / TRILLION, 1, "T");
    }
    if (value >= BILLION) {
        return scaled(value / BILLION, 1, "B");
    }
    if (value >= MILLION) {
        return scaled(value / MILLION, 2, "M");
    }
    if (value >= THOUSAND) {
        return scaled(value / THOUSAND, 0, "K");
    }
    return std::to_string(count);
}

std::string NumberFormat::formatGeneral(double value) {
    std::string special;
    if (formatNonFinite(value, special)) {
        return special;
    }

    // Shortest digits in exponent form tell us the decimal exponent
    std::string scientific = toChars(value, std::chars_format::scientific);
    size_t ePos = scientific.find('e');
    int exponent = 0;
    if (ePos != std::string::npos) {
        const char* first = scientific.data() + ePos + 1;
        if (*first == '+') {
            ++first;
        }
        std::from_chars(first, scientific.data() + scientific.size(), exponent);
    }

    if (exponent < -4 || exponent >= 6) {
        return scientific;
    }
    return toChars(value, std::chars_format::fixed);
}

std::string NumberFormat::formatDecimal(double value) {
    std::string special;
    if (formatNonFinite(value, special)) {
        return special;
    }
    return toChars(value, std::chars_format::fixed);
}

std::string NumberFormat::formatBytes(std::int64_t bytes) {
    const char* units[] = {"KB", "MB", "GB", "TB"};
    const double thresholds[] = {THOUSAND, MILLION, BILLION, TRILLION};

    int unitIndex = -1;
    for (int i = 3; i >= 0; --i) {
        if (static_cast<double>(bytes) >= thresholds[i]) {
            unitIndex = i;
            break;
        }
    }
    if (unitIndex < 0) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes) / thresholds[unitIndex];
    std::ostringstream oss;
    if (value >= 10.0 || value == std::trunc(value)) {
        oss << static_cast<long long>(value) << " " << units[unitIndex];
    } else {
        oss << std::fixed << std::setprecision(1) << value << " " << units[unitIndex];
    }
    return oss.str();
}

std::string NumberFormat::formatRelativeTime(std::chrono::system_clock::time_point then,
                                             std::chrono::system_clock::time_point now) {
    double seconds = std::chrono::duration<double>(now - then).count();

    if (seconds / 3600.0 / 24.0 / 365.0 < -20.0) {
        return "Forever";
    }
    if (seconds < 0) {
        return humanDuration(-seconds) + " from now";
    }
    return humanDuration(seconds) + " ago";
}

bool NumberFormat::parseTimestamp(const std::string& text, std::chrono::system_clock::time_point& result) {
    std::tm tm = {};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return false;
    }

    std::string rest;
    std::getline(iss, rest);
    size_t pos = 0;

    // Fractional seconds, nanosecond resolution at most
    long long nanos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (rest[pos] - '0');
                digits++;
            }
            ++pos;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    long offsetSeconds = 0;
    if (pos < rest.size() && (rest[pos] == 'Z' || rest[pos] == 'z')) {
        ++pos;
    } else if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
        int sign = rest[pos] == '-' ? -1 : 1;
        int hours = 0;
        int minutes = 0;
        if (std::sscanf(rest.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
            return false;
        }
        offsetSeconds = sign * (hours * 3600L + minutes * 60L);
        pos += 6;
    }
    if (pos != rest.size()) {
        return false;
    }

    std::time_t utc = toUtcTime(&tm);
    if (utc == static_cast<std::time_t>(-1)) {
        return false;
    }

    result = std::chrono::system_clock::from_time_t(utc - offsetSeconds) +
             std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos));
    return true;
}
