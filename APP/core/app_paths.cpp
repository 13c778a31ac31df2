#include "core/app_paths.hpp"

#include "utils/log.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace todo::config {

fs::path executable_dir(const char* argv0) {
    std::error_code ec;
    const fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.parent_path();
    }

    if (argv0 && *argv0) {
        const fs::path resolved = fs::weakly_canonical(fs::absolute(fs::path(argv0), ec), ec);
        if (!ec && resolved.has_parent_path()) {
            return resolved.parent_path();
        }
    }

    log::warn("[config] Unable to locate the executable; using the working directory for tasks.json");
    return fs::current_path();
}

fs::path default_tasks_path(const char* argv0) {
    return executable_dir(argv0) / kTasksFileName;
}

fs::path resolve_tasks_path(const std::string& override_path, const char* argv0) {
    if (!override_path.empty()) {
        log::debug("[config] Using tasks file override '" + override_path + "'");
        return fs::path(override_path);
    }
    return default_tasks_path(argv0);
}

}
