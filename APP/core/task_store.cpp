#include "core/task_store.hpp"

#include "utils/log.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace todo {
namespace {

constexpr int kIndent = 2;

std::string entry_prefix(std::size_t index) {
    return "entry " + std::to_string(index) + ": ";
}

bool read_positive_id(const nlohmann::json& value, int& out) {
    if (!value.is_number_unsigned()) {
        return false;
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw == 0 || raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        return false;
    }
    out = static_cast<int>(raw);
    return true;
}

bool decode_task(const nlohmann::json& entry, std::size_t index, Task& out, std::string& error) {
    if (!entry.is_object()) {
        error = entry_prefix(index) + "task must be a JSON object";
        return false;
    }

    auto id_it = entry.find("id");
    if (id_it == entry.end() || !read_positive_id(*id_it, out.id)) {
        error = entry_prefix(index) + "\"id\" must be a positive integer";
        return false;
    }

    auto text_it = entry.find("text");
    if (text_it == entry.end() || !text_it->is_string()) {
        error = entry_prefix(index) + "\"text\" must be a string";
        return false;
    }
    out.text = text_it->get<std::string>();

    out.completed = false;
    auto completed_it = entry.find("completed");
    if (completed_it != entry.end()) {
        if (!completed_it->is_boolean()) {
            error = entry_prefix(index) + "\"completed\" must be a boolean";
            return false;
        }
        out.completed = completed_it->get<bool>();
    }

    out.created_at.reset();
    auto created_it = entry.find("created_at");
    if (created_it != entry.end() && created_it->is_string()) {
        out.created_at = created_it->get<std::string>();
    }
    return true;
}

void ensure_parent_directory(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code ec;
    if (fs::create_directories(parent, ec)) {
        return;
    }
    if (ec && !fs::exists(parent)) {
        std::ostringstream oss;
        oss << "Failed to create directory '" << parent.u8string() << "' for tasks file: " << ec.message();
        throw std::runtime_error(oss.str());
    }
}

}

DecodeResult decode_tasks(const std::string& contents) {
    DecodeResult result;

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(contents);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = e.what();
        return result;
    }

    if (!parsed.is_array()) {
        result.error = "Tasks file must contain a JSON array";
        return result;
    }

    std::unordered_set<int> seen_ids;
    result.tasks.reserve(parsed.size());
    for (std::size_t i = 0; i < parsed.size(); ++i) {
        Task task;
        if (!decode_task(parsed[i], i, task, result.error)) {
            result.tasks.clear();
            return result;
        }
        if (!seen_ids.insert(task.id).second) {
            result.error = entry_prefix(i) + "duplicate id " + std::to_string(task.id);
            result.tasks.clear();
            return result;
        }
        result.tasks.push_back(std::move(task));
    }
    return result;
}

std::string encode_tasks(const TaskCollection& tasks) {
    nlohmann::ordered_json array = nlohmann::ordered_json::array();
    for (const auto& task : tasks) {
        array.push_back(nlohmann::ordered_json(task));
    }
    return array.dump(kIndent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

TaskStore::TaskStore(fs::path path)
    : TaskStore(std::move(path), std::cerr) {}

TaskStore::TaskStore(fs::path path, std::ostream& diagnostics)
    : path_(std::move(path)), diagnostics_(diagnostics) {}

TaskCollection TaskStore::load() {
    std::error_code ec;
    const bool exists = fs::exists(path_, ec);
    if (ec) {
        throw std::runtime_error("Unable to stat tasks file '" + path_.string() + "': " + ec.message());
    }

    if (!exists) {
        log::debug("[TaskStore] '" + path_.string() + "' missing; creating empty task list");
        save({});
        return {};
    }

    std::string contents;
    {
        std::ifstream in(path_, std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("Unable to open tasks file '" + path_.string() + "' for reading");
        }
        contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw std::runtime_error("Failed while reading tasks file '" + path_.string() + "'");
        }
    }

    DecodeResult result = decode_tasks(contents);
    if (!result.ok()) {
        diagnostics_ << "Error: Corrupted tasks file detected (" << result.error << "). Reinitializing...\n";
        diagnostics_.flush();
        log::info("[TaskStore] Reinitializing '" + path_.string() + "' after decode failure");
        save({});
        return {};
    }

    log::debug("[TaskStore] Loaded " + std::to_string(result.tasks.size()) + " task(s) from '" + path_.string() + "'");
    return std::move(result.tasks);
}

void TaskStore::save(const TaskCollection& tasks) {
    write_file(encode_tasks(tasks));
    log::debug("[TaskStore] Wrote " + std::to_string(tasks.size()) + " task(s) to '" + path_.string() + "'");
}

void TaskStore::write_file(const std::string& payload) {
    ensure_parent_directory(path_);

    const fs::path tmp_full = path_.string() + ".tmp";

    std::error_code ec;
    fs::perms target_perms = fs::perms::unknown;
    if (fs::exists(path_, ec) && !ec) {
        target_perms = fs::status(path_, ec).permissions();
    }
    ec.clear();

    {
        std::ofstream out(tmp_full, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Unable to open temp file '" + tmp_full.string() + "' for writing");
        }
        out << payload;
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmp_full, ec);
            throw std::runtime_error("Failed while writing temp file '" + tmp_full.string() + "'");
        }
    }

    if (target_perms != fs::perms::unknown) {
        fs::permissions(tmp_full, target_perms, ec);
        ec.clear();
    }

    fs::rename(tmp_full, path_, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::error_code cleanup_ec;
        fs::remove(tmp_full, cleanup_ec);
        throw std::runtime_error("rename('" + tmp_full.string() + "' -> '" + path_.string() + "') failed: " + reason);
    }
}

}
