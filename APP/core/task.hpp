#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace todo {

struct Task {
    int id = 0;
    std::string text;
    bool completed = false;
    // Absent when the stored entry carried no usable timestamp.
    std::optional<std::string> created_at;
};

using TaskCollection = std::vector<Task>;

// Field order on disk: id, text, completed, created_at.
void to_json(nlohmann::ordered_json& j, const Task& task);

// Local wall clock as YYYY-MM-DDTHH:MM:SS.ffffff
std::string current_timestamp();

}
