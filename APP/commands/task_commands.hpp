#pragma once

#include <iosfwd>
#include <string>

#include "core/task_store.hpp"

namespace todo::commands {

constexpr int kExitOk = 0;
constexpr int kExitTaskNotFound = 1;

// One load -> mutate -> save -> report cycle per call. Each method returns
// the process exit code. The store is only written when the collection
// actually changed. Ids outside the stored range are simply not found.
class TaskCommands {
public:
    TaskCommands(TaskStore& store, std::ostream& out, std::ostream& err);

    int add(const std::string& text);
    int list();
    int complete(long long id);
    int remove(long long id);

private:
    int report_missing(long long id);

    TaskStore& store_;
    std::ostream& out_;
    std::ostream& err_;
};

}
