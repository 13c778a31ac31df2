#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/task.hpp"

namespace todo {

inline constexpr const char* kCompletedMark = "✓";
inline constexpr const char* kUnknownTimestamp = "Unknown";

// "YYYY-MM-DD HH:MM" for an ISO-8601 date or date-time, nullopt otherwise.
std::optional<std::string> parse_display_timestamp(std::string_view value);

std::string format_timestamp(const std::optional<std::string>& created_at);

// [id] [mark] text (timestamp)
std::string format_task(const Task& task);

}
