/*
 * Smud - Logging Tests
 */

#include <catch2/catch_test_macros.hpp>
#include "smud/log.h"
#include <cstdio>
#include <string>
#include <vector>

/* ============================================================================
 * Test Fixtures
 * ============================================================================ */

struct CapturedLine {
    Smud_LogLevel level;
    std::string subsystem;
    std::string message;
};

static void capture_line(Smud_LogLevel level, const char *subsystem,
                         const char *message, void *userdata) {
    auto *lines = static_cast<std::vector<CapturedLine> *>(userdata);
    lines->push_back({level, subsystem, message});
}

class LogCaptureFixture {
public:
    std::vector<CapturedLine> lines;
    uint32_t handle = 0;
    Smud_LogLevel saved_level;

    LogCaptureFixture() {
        saved_level = smud_log_get_level();
        smud_log_set_console_output(false);
        handle = smud_log_add_callback(capture_line, &lines);
    }

    ~LogCaptureFixture() {
        smud_log_remove_callback(handle);
        smud_log_set_level(saved_level);
        smud_log_set_console_output(true);
    }
};

static std::string trimmed(const std::string &s) {
    size_t end = s.find_last_not_of(' ');
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

/* ============================================================================
 * Level Filtering
 * ============================================================================ */

TEST_CASE_METHOD(LogCaptureFixture, "Callbacks receive formatted messages", "[log]") {
    REQUIRE(handle != 0);
    smud_log_set_level(SMUD_LOG_LEVEL_DEBUG);

    smud_log_info(SMUD_LOG_RENDER, "%d batches", 3);

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].level == SMUD_LOG_LEVEL_INFO);
    REQUIRE(trimmed(lines[0].subsystem) == "Render");
    REQUIRE(lines[0].message == "3 batches");
}

TEST_CASE_METHOD(LogCaptureFixture, "Level filter drops verbose messages", "[log]") {
    smud_log_set_level(SMUD_LOG_LEVEL_WARNING);

    smud_log_debug(SMUD_LOG_PICKING, "dropped");
    smud_log_info(SMUD_LOG_PICKING, "dropped");
    smud_log_warning(SMUD_LOG_PICKING, "kept");
    smud_log_error(SMUD_LOG_PICKING, "kept");

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].level == SMUD_LOG_LEVEL_WARNING);
    REQUIRE(lines[1].level == SMUD_LOG_LEVEL_ERROR);
}

TEST_CASE_METHOD(LogCaptureFixture, "Errors always pass the filter", "[log]") {
    smud_log_set_level(SMUD_LOG_LEVEL_ERROR);
    smud_log_error(SMUD_LOG_CORE, "fatal-ish");
    REQUIRE(lines.size() == 1);
}

/* ============================================================================
 * Listeners
 * ============================================================================ */

TEST_CASE("Listener slots are limited", "[log][callback]") {
    std::vector<CapturedLine> sink;
    std::vector<uint32_t> handles;

    for (int i = 0; i < 16; i++) {
        uint32_t h = smud_log_add_callback(capture_line, &sink);
        if (h == 0) break;
        handles.push_back(h);
    }

    REQUIRE(handles.size() == 8);
    REQUIRE(smud_log_add_callback(capture_line, &sink) == 0);

    smud_log_remove_callback(handles[0]);
    uint32_t reused = smud_log_add_callback(capture_line, &sink);
    REQUIRE(reused != 0);
    handles[0] = reused;

    for (uint32_t h : handles) {
        smud_log_remove_callback(h);
    }
}

TEST_CASE("NULL callback is rejected", "[log][callback]") {
    REQUIRE(smud_log_add_callback(nullptr, nullptr) == 0);
    smud_log_remove_callback(0);
    smud_log_remove_callback(12345);
}

/* ============================================================================
 * Log File
 * ============================================================================ */

TEST_CASE("Log file lifecycle", "[log][file]") {
    const char *path = "smud_test.log";
    std::remove(path);

    REQUIRE_FALSE(smud_log_is_initialized());
    REQUIRE(smud_log_get_path() == nullptr);

    REQUIRE(smud_log_init_with_path(path));
    REQUIRE(smud_log_is_initialized());
    REQUIRE(std::string(smud_log_get_path()) == path);

    smud_log_set_console_output(false);
    smud_log_error(SMUD_LOG_CORE, "written to file");
    smud_log_flush();
    smud_log_shutdown();
    smud_log_set_console_output(true);

    REQUIRE_FALSE(smud_log_is_initialized());

    FILE *f = std::fopen(path, "r");
    REQUIRE(f != nullptr);
    std::string contents;
    char buf[256];
    while (std::fgets(buf, sizeof(buf), f)) {
        contents += buf;
    }
    std::fclose(f);
    std::remove(path);

    REQUIRE(contents.find("session start") != std::string::npos);
    REQUIRE(contents.find("[ERROR  ]") != std::string::npos);
    REQUIRE(contents.find("written to file") != std::string::npos);
    REQUIRE(contents.find("session end") != std::string::npos);
}
