/*
 * logging_test.cpp
 *
 * Tests for the diagnostic logging layer.
 *
 *  - Syslog severity parsing and filtering
 *  - LogFields become underscore-prefixed record extensions
 *  - AsyncJsonLogger writes one decodable GELF record per line
 *  - GelfLogger forwards through a Writer and counts failed sends
 *
 * Exit code: 0 = all tests passed, non-zero = failure.
 */

#include "gelf/logging/async_json_logger.hpp"
#include "gelf/logging/gelf_logger.hpp"
#include "gelf/logging/log_event.hpp"
#include "gelf/logging/log_fields.hpp"
#include "gelf/logging/log_level.hpp"
#include "gelf/logging/log_policy.hpp"
#include "gelf/record/record_codec.hpp"

#include "../test_harness.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace gelf;
using namespace gelf::logging;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

class RecordingWriter : public transport::Writer {
public:
    explicit RecordingWriter(bool fail = false) : fail_(fail) {}

    std::expected<void, transport::SendError> send(const record::Record& record) override {
        if (fail_) {
            return std::unexpected(transport::SendError::WriteFailed);
        }
        records.push_back(record);
        return {};
    }

    std::vector<record::Record> records;

private:
    bool fail_;
};

static std::filesystem::path temp_log_path(const std::string& name) {
    return std::filesystem::temp_directory_path() /
           ("gelf_logging_test_" + std::to_string(::getpid())) / name;
}

static std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// ---------------------------------------------------------------------------
// Levels and policies
// ---------------------------------------------------------------------------

TEST(test_parse_log_level) {
    EXPECT(parse_log_level("emergency") == LogLevel::Emergency);
    EXPECT(parse_log_level("warning") == LogLevel::Warning);
    EXPECT(parse_log_level("debug") == LogLevel::Debug);
    EXPECT(!parse_log_level("warn").has_value());
    EXPECT(!parse_log_level("INFO").has_value());
    EXPECT(to_string(LogLevel::Critical) == "critical");
    EXPECT(to_gelf_level(LogLevel::Notice) == 5);
}

TEST(test_should_log) {
    EXPECT(should_log(LogLevel::Error, LogLevel::Info));
    EXPECT(should_log(LogLevel::Info, LogLevel::Info));
    EXPECT(!should_log(LogLevel::Debug, LogLevel::Info));
    EXPECT(should_log(LogLevel::Emergency, LogLevel::Emergency));
    EXPECT(!should_log(LogLevel::Alert, LogLevel::Emergency));
}

TEST(test_parse_drop_policy) {
    EXPECT(parse_drop_policy("drop_oldest") == DropPolicy::DropOldest);
    EXPECT(parse_drop_policy("drop_newest") == DropPolicy::DropNewest);
    EXPECT(!parse_drop_policy("drop").has_value());
}

// ---------------------------------------------------------------------------
// Fields and events
// ---------------------------------------------------------------------------

TEST(test_fields_are_prefixed) {
    LogFields fields;
    fields.add_string("user", "ana");
    fields.add_int("_attempt", 3);
    fields.add_uint("bytes", 1024);
    fields.add_double("ratio", 0.5);
    fields.add_bool("ok", false);
    fields.add_json("tags", "[\"a\",\"b\"]");

    const auto& e = fields.entries();
    EXPECT(e.size() == 6);
    EXPECT(std::get<std::string>(e.at("_user")) == "ana");
    EXPECT(std::get<std::int64_t>(e.at("_attempt")) == 3);
    EXPECT(std::get<std::uint64_t>(e.at("_bytes")) == 1024);
    EXPECT(std::get<double>(e.at("_ratio")) == 0.5);
    EXPECT(std::get<bool>(e.at("_ok")) == false);
    EXPECT(std::get<record::RawJson>(e.at("_tags")).text == "[\"a\",\"b\"]");
}

TEST(test_event_to_record) {
    LogFields fields;
    fields.add_string("error", "timed out");
    LogEvent event{.ts_ms = 1700000000250,
                   .level = LogLevel::Warning,
                   .component = "transport.send",
                   .message = "send_failed",
                   .detail = "long detail",
                   .fields = std::move(fields)};
    auto r = to_record(event, "box-1");
    EXPECT(r.version == "1.1");
    EXPECT(r.host == "box-1");
    EXPECT(r.short_message == "send_failed");
    EXPECT(r.full_message == "long detail");
    EXPECT(r.timestamp == 1700000000.25);
    EXPECT(r.level == 4);
    EXPECT(r.facility == "transport.send");
    EXPECT(std::get<std::string>(r.extra.at("_error")) == "timed out");
}

// ---------------------------------------------------------------------------
// AsyncJsonLogger
// ---------------------------------------------------------------------------

TEST(test_async_logger_writes_gelf_lines) {
    const auto path = temp_log_path("lines.log.json");
    std::filesystem::remove(path);
    {
        AsyncJsonLogger logger(AsyncJsonLoggerOptions{.level = LogLevel::Info,
                                                      .queue_size = 1000,
                                                      .drop_policy = DropPolicy::DropOldest,
                                                      .output_path = path.string(),
                                                      .host = "diag-host"});
        LogFields fields;
        fields.add_uint("line_number", 7);
        logger.log(LogLevel::Error, "transport.send", "send_failed", std::move(fields));
        logger.log(LogLevel::Debug, "core", "filtered_out");
        logger.log_detail(LogLevel::Notice, "app", "input_done", {}, "all lines read");
    }

    auto lines = read_lines(path);
    EXPECT(lines.size() == 2);

    auto first = record::decode(lines[0]);
    EXPECT(first.has_value());
    EXPECT(first->short_message == "send_failed");
    EXPECT(first->facility == "transport.send");
    EXPECT(first->host == "diag-host");
    EXPECT(first->level == 3);
    EXPECT(first->timestamp > 0.0);
    EXPECT(std::get<std::int64_t>(first->extra.at("_line_number")) == 7);

    auto second = record::decode(lines[1]);
    EXPECT(second.has_value());
    EXPECT(second->full_message == "all lines read");
    EXPECT(second->level == 5);
}

TEST(test_async_logger_replaces_unencodable_event) {
    const auto path = temp_log_path("bad.log.json");
    std::filesystem::remove(path);
    {
        AsyncJsonLogger logger(AsyncJsonLoggerOptions{.output_path = path.string(),
                                                      .host = "h"});
        LogFields fields;
        fields.add_json("broken", "{\"a\":");
        logger.log(LogLevel::Info, "core", "bad_fields", std::move(fields));
    }

    auto lines = read_lines(path);
    EXPECT(lines.size() == 1);
    auto r = record::decode(lines[0]);
    EXPECT(r.has_value());
    EXPECT(r->short_message == "unencodable_log_event");
    EXPECT(r->full_message == "bad_fields");
    EXPECT(r->level == 3);
}

TEST(test_async_logger_counts_lines) {
    const auto path = temp_log_path("count.log.json");
    std::filesystem::remove(path);
    AsyncJsonLogger logger(AsyncJsonLoggerOptions{.output_path = path.string(), .host = "h"});
    for (int i = 0; i < 10; ++i) {
        logger.log(LogLevel::Info, "core", "tick");
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (logger.lines_written() < 10 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT(logger.lines_written() == 10);
}

// ---------------------------------------------------------------------------
// GelfLogger
// ---------------------------------------------------------------------------

TEST(test_gelf_logger_sends_records) {
    RecordingWriter writer;
    GelfLogger logger(writer, "app-host", "billing", LogLevel::Info);

    logger.warning("quota near limit");
    logger.debug("not sent");
    LogFields fields;
    fields.add_int("invoice", 12);
    logger.log(LogLevel::Critical, "billing.db", "write_failed", std::move(fields));

    EXPECT(writer.records.size() == 2);
    EXPECT(writer.records[0].short_message == "quota near limit");
    EXPECT(writer.records[0].level == 4);
    EXPECT(writer.records[0].facility == "billing");
    EXPECT(writer.records[0].host == "app-host");
    EXPECT(writer.records[0].timestamp > 0.0);
    EXPECT(writer.records[1].facility == "billing.db");
    EXPECT(writer.records[1].level == 2);
    EXPECT(std::get<std::int64_t>(writer.records[1].extra.at("_invoice")) == 12);
    EXPECT(logger.failures() == 0);
}

TEST(test_gelf_logger_all_severities) {
    RecordingWriter writer;
    GelfLogger logger(writer, "h", "f", LogLevel::Debug);
    logger.emergency("0");
    logger.alert("1");
    logger.critical("2");
    logger.error("3");
    logger.warning("4");
    logger.notice("5");
    logger.info("6");
    logger.debug("7");
    EXPECT(writer.records.size() == 8);
    for (std::size_t i = 0; i < writer.records.size(); ++i) {
        EXPECT(writer.records[i].level == static_cast<int>(i));
        EXPECT(writer.records[i].short_message == std::to_string(i));
    }
}

TEST(test_gelf_logger_counts_failures) {
    RecordingWriter writer(true);
    GelfLogger logger(writer, "h", "f");
    logger.error("a");
    logger.error("b");
    logger.debug("filtered");
    EXPECT(logger.failures() == 2);
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main() {
    std::printf("=== logging tests ===\n\n");

    std::printf("--- levels ---\n");
    RUN(test_parse_log_level);
    RUN(test_should_log);
    RUN(test_parse_drop_policy);

    std::printf("\n--- fields ---\n");
    RUN(test_fields_are_prefixed);
    RUN(test_event_to_record);

    std::printf("\n--- async json logger ---\n");
    RUN(test_async_logger_writes_gelf_lines);
    RUN(test_async_logger_replaces_unencodable_event);
    RUN(test_async_logger_counts_lines);

    std::printf("\n--- gelf logger ---\n");
    RUN(test_gelf_logger_sends_records);
    RUN(test_gelf_logger_all_severities);
    RUN(test_gelf_logger_counts_failures);

    std::filesystem::remove_all(temp_log_path("").parent_path());
    std::printf("\n=== Results: %d/%d passed ===\n", g_passed, g_total);
    return (g_failed == 0) ? 0 : 1;
}
