#include "core/task_repository.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace todo::tasks {
namespace {

// Shared by find_by_id, complete and remove.
template <typename Collection>
auto locate(int id, Collection& tasks) -> decltype(tasks.begin()) {
    return std::find_if(tasks.begin(), tasks.end(),
                        [id](const Task& task) { return task.id == id; });
}

}

int next_id(const TaskCollection& tasks) {
    if (tasks.empty()) {
        return 1;
    }
    const auto it = std::max_element(tasks.begin(), tasks.end(),
                                     [](const Task& a, const Task& b) { return a.id < b.id; });
    if (it->id == std::numeric_limits<int>::max()) {
        throw std::runtime_error("No task ids left: highest id is already " + std::to_string(it->id));
    }
    return it->id + 1;
}

Task add(std::string text, TaskCollection& tasks) {
    Task task;
    task.id = next_id(tasks);
    task.text = std::move(text);
    task.completed = false;
    task.created_at = current_timestamp();
    tasks.push_back(task);
    return task;
}

std::optional<Task> find_by_id(int id, const TaskCollection& tasks) {
    const auto it = locate(id, tasks);
    if (it == tasks.end()) {
        return std::nullopt;
    }
    return *it;
}

bool complete(int id, TaskCollection& tasks) {
    auto it = locate(id, tasks);
    if (it == tasks.end()) {
        return false;
    }
    it->completed = true;
    return true;
}

bool remove(int id, TaskCollection& tasks) {
    auto it = locate(id, tasks);
    if (it == tasks.end()) {
        return false;
    }
    tasks.erase(it);
    return true;
}

}
