#include "commands/task_commands.hpp"
#include "core/app_paths.hpp"
#include "core/task_store.hpp"
#include "utils/log.hpp"

#include <CLI/CLI.hpp>

#include <exception>
#include <functional>
#include <iostream>
#include <string>

namespace {

constexpr int kExitUsage = 2;
constexpr int kExitFatal = 1;

}

int main(int argc, char* argv[]) {
        CLI::App app{"CLI Todo App - Manage your tasks from the command line"};
        app.require_subcommand(1);
        app.footer("\nExamples:\n"
                   "  todo add \"Buy milk\"           Add a new task\n"
                   "  todo list                     List all tasks\n"
                   "  todo complete 1               Mark task #1 as complete\n"
                   "  todo delete 1                 Delete task #1\n");

        std::string file_override;
        bool verbose = false;
        app.add_option("--file", file_override,
                       "Tasks file to use (default: tasks.json next to the executable)")
                ->envname(todo::config::kTasksFileEnv);
        app.add_flag("-v,--verbose", verbose, "Log storage activity to stderr");

        std::function<int(todo::commands::TaskCommands&)> action;

        std::string add_text;
        auto* add_cmd = app.add_subcommand("add", "Add a new task");
        add_cmd->add_option("text", add_text, "Task description")->required();
        add_cmd->callback([&]() {
                action = [&](todo::commands::TaskCommands& commands) { return commands.add(add_text); };
        });

        auto* list_cmd = app.add_subcommand("list", "List all tasks");
        list_cmd->callback([&]() {
                action = [](todo::commands::TaskCommands& commands) { return commands.list(); };
        });

        long long complete_id = 0;
        auto* complete_cmd = app.add_subcommand("complete", "Mark a task as complete");
        complete_cmd->add_option("id", complete_id, "Task ID to complete")->required();
        complete_cmd->callback([&]() {
                action = [&](todo::commands::TaskCommands& commands) { return commands.complete(complete_id); };
        });

        long long delete_id = 0;
        auto* delete_cmd = app.add_subcommand("delete", "Delete a task");
        delete_cmd->add_option("id", delete_id, "Task ID to delete")->required();
        delete_cmd->callback([&]() {
                action = [&](todo::commands::TaskCommands& commands) { return commands.remove(delete_id); };
        });

        try {
                app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
                const int code = app.exit(e);
                return code == 0 ? 0 : kExitUsage;
        }

        if (verbose) {
                todo::log::set_level(todo::log::Level::Debug);
        }

        try {
                todo::TaskStore store(todo::config::resolve_tasks_path(file_override, argc > 0 ? argv[0] : nullptr));
                todo::log::debug("[Main] Tasks file: " + store.path().string());
                todo::commands::TaskCommands commands(store, std::cout, std::cerr);
                return action(commands);
        } catch (const std::exception& e) {
                todo::log::debug(std::string("[Main] Aborting: ") + e.what());
                std::cerr << "Error: " << e.what() << '\n';
                return kExitFatal;
        }
}
