#pragma once

#include <filesystem>
#include <string>

namespace todo::config {

inline constexpr const char* kTasksFileName = "tasks.json";
inline constexpr const char* kTasksFileEnv = "TODO_TASKS_FILE";

// Directory holding the running executable. `argv0` is only consulted when
// /proc/self/exe cannot be read.
std::filesystem::path executable_dir(const char* argv0);

std::filesystem::path default_tasks_path(const char* argv0);

// An explicit path (from --file or TODO_TASKS_FILE) wins over the default.
std::filesystem::path resolve_tasks_path(const std::string& override_path, const char* argv0);

}
