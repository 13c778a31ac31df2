#include "core/task.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace todo {

void to_json(nlohmann::ordered_json& j, const Task& task) {
    j = nlohmann::ordered_json::object();
    j["id"] = task.id;
    j["text"] = task.text;
    j["completed"] = task.completed;
    if (task.created_at) {
        j["created_at"] = *task.created_at;
    }
}

std::string current_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &secs);
#else
    localtime_r(&secs, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

}
