#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>

#include "core/task.hpp"

namespace todo {

// Outcome of parsing a tasks file. `error` is empty on success.
struct DecodeResult {
    TaskCollection tasks;
    std::string error;

    bool ok() const { return error.empty(); }
};

DecodeResult decode_tasks(const std::string& contents);

std::string encode_tasks(const TaskCollection& tasks);

// JSON array of tasks backed by one file. Corrupt files are reset to an
// empty array; I/O failures throw std::runtime_error.
//
// No locking: concurrent invocations against the same file race and the
// last save wins.
class TaskStore {
public:
    explicit TaskStore(std::filesystem::path path);
    TaskStore(std::filesystem::path path, std::ostream& diagnostics);

    const std::filesystem::path& path() const { return path_; }

    TaskCollection load();

    void save(const TaskCollection& tasks);

private:
    void write_file(const std::string& payload);

    std::filesystem::path path_;
    std::ostream& diagnostics_;
};

}
