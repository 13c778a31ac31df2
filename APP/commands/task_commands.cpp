#include "commands/task_commands.hpp"

#include "core/task_format.hpp"
#include "core/task_repository.hpp"
#include "utils/log.hpp"

#include <limits>
#include <optional>
#include <ostream>

namespace todo::commands {
namespace {

std::optional<int> stored_id(long long id) {
    if (id < 1 || id > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(id);
}

}

TaskCommands::TaskCommands(TaskStore& store, std::ostream& out, std::ostream& err)
    : store_(store), out_(out), err_(err) {}

int TaskCommands::add(const std::string& text) {
    TaskCollection collection = store_.load();
    const Task task = tasks::add(text, collection);
    store_.save(collection);
    out_ << "Added task #" << task.id << ": " << task.text << '\n';
    return kExitOk;
}

int TaskCommands::list() {
    const TaskCollection collection = store_.load();
    if (collection.empty()) {
        out_ << "No tasks found.\n";
        return kExitOk;
    }
    for (const auto& task : collection) {
        out_ << format_task(task) << '\n';
    }
    return kExitOk;
}

int TaskCommands::complete(long long id) {
    TaskCollection collection = store_.load();
    const auto key = stored_id(id);
    if (!key || !tasks::complete(*key, collection)) {
        return report_missing(id);
    }
    store_.save(collection);
    out_ << "Marked task #" << id << " as complete\n";
    return kExitOk;
}

int TaskCommands::remove(long long id) {
    TaskCollection collection = store_.load();
    const auto key = stored_id(id);
    if (!key || !tasks::remove(*key, collection)) {
        return report_missing(id);
    }
    store_.save(collection);
    out_ << "Deleted task #" << id << '\n';
    return kExitOk;
}

int TaskCommands::report_missing(long long id) {
    log::debug("[TaskCommands] No task with id " + std::to_string(id) + "; nothing saved");
    err_ << "Error: Task #" << id << " not found\n";
    return kExitTaskNotFound;
}

}
