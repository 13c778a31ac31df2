#include "doctest/doctest.h"

#include <filesystem>
#include <system_error>

#include "core/app_paths.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

TEST_CASE("log levels parse case-insensitively") {
    using todo::log::Level;
    CHECK(todo::log::parse_level("error") == Level::Error);
    CHECK(todo::log::parse_level("WARN") == Level::Warn);
    CHECK(todo::log::parse_level("warning") == Level::Warn);
    CHECK(todo::log::parse_level(" Info ") == Level::Info);
    CHECK(todo::log::parse_level("debug") == Level::Debug);
    CHECK_FALSE(todo::log::parse_level("chatty").has_value());
    CHECK_FALSE(todo::log::parse_level("").has_value());
}

TEST_CASE("set_level is honoured by level()") {
    const auto previous = todo::log::level();
    todo::log::set_level(todo::log::Level::Debug);
    CHECK(todo::log::level() == todo::log::Level::Debug);
    todo::log::set_level(previous);
    CHECK(todo::log::level() == previous);
}

TEST_CASE("default tasks file sits next to the executable") {
    const fs::path path = todo::config::default_tasks_path(nullptr);
    CHECK(path.filename() == "tasks.json");
    CHECK(path.is_absolute());
    // The test binary is the running executable.
    std::error_code ec;
    const fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        CHECK(path.parent_path() == self.parent_path());
    }
}

TEST_CASE("an explicit tasks file overrides the default") {
    CHECK(todo::config::resolve_tasks_path("/tmp/elsewhere/my.json", nullptr) == fs::path("/tmp/elsewhere/my.json"));
    CHECK(todo::config::resolve_tasks_path("", nullptr) == todo::config::default_tasks_path(nullptr));
}
