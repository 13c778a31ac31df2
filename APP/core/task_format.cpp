#include "core/task_format.hpp"

#include "utils/string_utils.hpp"

#include <sstream>

namespace todo {
namespace {

int two_digits(std::string_view s, std::size_t pos) {
    return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

bool digits_at(std::string_view s, std::size_t pos, std::size_t count) {
    return pos + count <= s.size() && strings::all_digits(s.substr(pos, count));
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// [Z | +HH:MM | -HH:MM] followed by end of input.
bool valid_offset_suffix(std::string_view s, std::size_t pos) {
    if (pos == s.size()) {
        return true;
    }
    if (s[pos] == 'Z' || s[pos] == 'z') {
        return pos + 1 == s.size();
    }
    if (s[pos] != '+' && s[pos] != '-') {
        return false;
    }
    ++pos;
    if (!digits_at(s, pos, 2) || pos + 5 != s.size() || s[pos + 2] != ':' || !digits_at(s, pos + 3, 2)) {
        return false;
    }
    return two_digits(s, pos) < 24 && two_digits(s, pos + 3) < 60;
}

}

std::optional<std::string> parse_display_timestamp(std::string_view value) {
    // YYYY-MM-DD
    if (value.size() < 10 || !digits_at(value, 0, 4) || value[4] != '-' ||
        !digits_at(value, 5, 2) || value[7] != '-' || !digits_at(value, 8, 2)) {
        return std::nullopt;
    }
    const int year = std::stoi(std::string(value.substr(0, 4)));
    const int month = two_digits(value, 5);
    const int day = two_digits(value, 8);
    if (year < 1 || month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }
    const std::string date(value.substr(0, 10));
    if (value.size() == 10) {
        return date + " 00:00";
    }

    // [T| ]HH:MM
    if ((value[10] != 'T' && value[10] != ' ') || !digits_at(value, 11, 2) ||
        value.size() < 16 || value[13] != ':' || !digits_at(value, 14, 2)) {
        return std::nullopt;
    }
    if (two_digits(value, 11) > 23 || two_digits(value, 14) > 59) {
        return std::nullopt;
    }
    const std::string hour_minute(value.substr(11, 5));

    std::size_t pos = 16;
    if (pos < value.size() && value[pos] == ':') {
        if (!digits_at(value, pos + 1, 2) || two_digits(value, pos + 1) > 59) {
            return std::nullopt;
        }
        pos += 3;
        if (pos < value.size() && (value[pos] == '.' || value[pos] == ',')) {
            ++pos;
            std::size_t fraction = 0;
            while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
                ++pos;
                ++fraction;
            }
            if (fraction == 0 || fraction > 6) {
                return std::nullopt;
            }
        }
    }

    if (!valid_offset_suffix(value, pos)) {
        return std::nullopt;
    }
    return date + " " + hour_minute;
}

std::string format_timestamp(const std::optional<std::string>& created_at) {
    if (!created_at) {
        return kUnknownTimestamp;
    }
    return parse_display_timestamp(*created_at).value_or(kUnknownTimestamp);
}

std::string format_task(const Task& task) {
    std::ostringstream oss;
    oss << '[' << task.id << "] [" << (task.completed ? kCompletedMark : " ") << "] "
        << task.text << " (" << format_timestamp(task.created_at) << ')';
    return oss.str();
}

}
