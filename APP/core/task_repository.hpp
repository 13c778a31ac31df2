#pragma once

#include <optional>
#include <string>

#include "core/task.hpp"

namespace todo::tasks {

// 1 for an empty collection, otherwise the highest id plus one. Throws
// std::runtime_error when the highest id is already INT_MAX.
int next_id(const TaskCollection& tasks);

Task add(std::string text, TaskCollection& tasks);

std::optional<Task> find_by_id(int id, const TaskCollection& tasks);

// Idempotent. Returns false and leaves `tasks` untouched when `id` is absent.
bool complete(int id, TaskCollection& tasks);

bool remove(int id, TaskCollection& tasks);

}
