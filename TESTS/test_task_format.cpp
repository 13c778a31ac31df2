#include "doctest/doctest.h"

#include "core/task_format.hpp"

using namespace todo;

TEST_CASE("timestamps render as date, hour and minute") {
    CHECK(format_timestamp(std::string("2024-01-15T10:30:45.123456")) == "2024-01-15 10:30");
    CHECK(format_timestamp(std::string("2024-01-15T10:30:45")) == "2024-01-15 10:30");
    CHECK(format_timestamp(std::string("2024-01-15T10:30")) == "2024-01-15 10:30");
    CHECK(format_timestamp(std::string("2024-01-15 23:59:59.5")) == "2024-01-15 23:59");
    CHECK(format_timestamp(std::string("2024-01-15")) == "2024-01-15 00:00");
}

TEST_CASE("timezone suffixes keep the written wall clock") {
    CHECK(format_timestamp(std::string("2024-06-01T08:05:00Z")) == "2024-06-01 08:05");
    CHECK(format_timestamp(std::string("2024-06-01T08:05:00+02:00")) == "2024-06-01 08:05");
    CHECK(format_timestamp(std::string("2024-06-01T08:05:00.000001-05:30")) == "2024-06-01 08:05");
}

TEST_CASE("missing or malformed timestamps render Unknown") {
    CHECK(format_timestamp(std::nullopt) == "Unknown");
    CHECK(format_timestamp(std::string("")) == "Unknown");
    CHECK(format_timestamp(std::string("yesterday")) == "Unknown");
    CHECK(format_timestamp(std::string("2024-13-01T10:00")) == "Unknown");
    CHECK(format_timestamp(std::string("2023-02-29T10:00")) == "Unknown");
    CHECK(format_timestamp(std::string("2024-01-15T24:00")) == "Unknown");
    CHECK(format_timestamp(std::string("2024-01-15T10:30:45junk")) == "Unknown");
    CHECK(format_timestamp(std::string("2024-01-15T10")) == "Unknown");
    CHECK(format_timestamp(std::string("2024-01-15T10:30:45.1234567")) == "Unknown");
}

TEST_CASE("leap day is accepted in leap years") {
    CHECK(format_timestamp(std::string("2024-02-29T12:00:00")) == "2024-02-29 12:00");
    CHECK(format_timestamp(std::string("2000-02-29")) == "2000-02-29 00:00");
    CHECK(format_timestamp(std::string("1900-02-29")) == "Unknown");
}

TEST_CASE("format_task shows id, status mark, text and timestamp") {
    Task task{1, "Buy milk", false, std::string("2024-01-15T10:30:45.123456")};
    CHECK(format_task(task) == "[1] [ ] Buy milk (2024-01-15 10:30)");

    task.completed = true;
    CHECK(format_task(task) == std::string("[1] [") + kCompletedMark + "] Buy milk (2024-01-15 10:30)");

    Task undated{7, "Caf\xC3\xA9 run", false, std::nullopt};
    CHECK(format_task(undated) == "[7] [ ] Caf\xC3\xA9 run (Unknown)");
}
