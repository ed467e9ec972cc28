#include "time_utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

double get_current_epoch_seconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(since_epoch).count();
}

bool parse_iso_time_to_epoch(const std::string& timestamp, double& epoch_seconds_out) {
    if (timestamp.size() < 19) {
        return false;
    }

    std::tm parsed_time = {};
    std::istringstream ss(timestamp.substr(0, 19));
    ss >> std::get_time(&parsed_time, ISO_8601_WITHOUT_Z);
    if (ss.fail()) {
        return false;
    }

    size_t cursor = 19;
    double fractional_seconds = 0.0;
    if (cursor < timestamp.size() && timestamp[cursor] == '.') {
        size_t fraction_end = cursor + 1;
        while (fraction_end < timestamp.size() && std::isdigit(static_cast<unsigned char>(timestamp[fraction_end]))) {
            ++fraction_end;
        }
        if (fraction_end == cursor + 1) {
            return false;
        }
        fractional_seconds = std::strtod(timestamp.substr(cursor, fraction_end - cursor).c_str(), nullptr);
        cursor = fraction_end;
    }

    long long offset_seconds = 0;
    if (cursor < timestamp.size()) {
        char zone_designator = timestamp[cursor];
        if (zone_designator == 'Z' || zone_designator == 'z') {
            ++cursor;
        } else if (zone_designator == '+' || zone_designator == '-') {
            // +HH:MM or +HHMM
            std::string zone_digits;
            for (size_t i = cursor + 1; i < timestamp.size(); ++i) {
                if (timestamp[i] == ':') continue;
                if (!std::isdigit(static_cast<unsigned char>(timestamp[i]))) return false;
                zone_digits.push_back(timestamp[i]);
            }
            if (zone_digits.size() != 4) {
                return false;
            }
            int zone_hours = std::stoi(zone_digits.substr(0, 2));
            int zone_minutes = std::stoi(zone_digits.substr(2, 2));
            offset_seconds = zone_hours * SECONDS_PER_HOUR + zone_minutes * SECONDS_PER_MINUTE;
            if (zone_designator == '-') {
                offset_seconds = -offset_seconds;
            }
            cursor = timestamp.size();
        }
        if (cursor != timestamp.size()) {
            return false;
        }
    }

    std::time_t utc_seconds = timegm(&parsed_time);
    if (utc_seconds == static_cast<std::time_t>(-1)) {
        return false;
    }

    epoch_seconds_out = static_cast<double>(utc_seconds - offset_seconds) + fractional_seconds;
    return true;
}

std::string format_epoch_as_iso_utc(double epoch_seconds) {
    std::time_t whole_seconds = static_cast<std::time_t>(std::floor(epoch_seconds));
    struct tm timeinfo;
    gmtime_r(&whole_seconds, &timeinfo);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

std::string format_epoch_as_human_readable(double epoch_seconds) {
    std::time_t whole_seconds = static_cast<std::time_t>(std::floor(epoch_seconds));
    struct tm timeinfo;
    localtime_r(&whole_seconds, &timeinfo);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

} // namespace TimeUtils
