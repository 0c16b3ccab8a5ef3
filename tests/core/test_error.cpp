/*
 * Smud - Error Reporting Tests
 */

#include <catch2/catch_test_macros.hpp>
#include "smud/error.h"
#include "smud/log.h"
#include <SDL3/SDL.h>
#include <cstring>
#include <string>
#include <thread>

/* ============================================================================
 * Basic Operations
 * ============================================================================ */

TEST_CASE("Error set, get and clear", "[error]") {
    smud_clear_error();

    SECTION("Starts empty") {
        REQUIRE_FALSE(smud_has_error());
        REQUIRE(std::strlen(smud_get_last_error()) == 0);
    }

    SECTION("Formatted message") {
        smud_set_error("pipeline %u failed: %s", 7u, "no fragment");
        REQUIRE(smud_has_error());
        REQUIRE(std::string(smud_get_last_error()) == "pipeline 7 failed: no fragment");
    }

    SECTION("Newer error replaces older") {
        smud_set_error("first");
        smud_set_error("second");
        REQUIRE(std::string(smud_get_last_error()) == "second");
    }

    SECTION("Clear") {
        smud_set_error("something");
        smud_clear_error();
        REQUIRE_FALSE(smud_has_error());
    }

    SECTION("NULL format clears") {
        smud_set_error("something");
        smud_set_error(nullptr);
        REQUIRE_FALSE(smud_has_error());
    }
}

TEST_CASE("Long error messages are truncated", "[error]") {
    std::string long_text(4096, 'x');
    smud_set_error("%s", long_text.c_str());

    size_t len = std::strlen(smud_get_last_error());
    REQUIRE(len > 0);
    REQUIRE(len < long_text.size());
    smud_clear_error();
}

TEST_CASE("SDL errors carry a prefix", "[error][sdl]") {
    SDL_SetError("device lost");

    smud_set_error_from_sdl("renderer");
    REQUIRE(std::string(smud_get_last_error()) == "renderer: device lost");

    smud_set_error_from_sdl(nullptr);
    REQUIRE(std::string(smud_get_last_error()) == "device lost");
    smud_clear_error();
}

/* ============================================================================
 * Threading
 * ============================================================================ */

TEST_CASE("Errors are per thread", "[error][thread]") {
    smud_clear_error();
    smud_set_error("main thread");

    bool other_saw_error = true;
    std::thread worker([&]() {
        other_saw_error = smud_has_error();
        smud_set_error("worker thread");
    });
    worker.join();

    REQUIRE_FALSE(other_saw_error);
    REQUIRE(std::string(smud_get_last_error()) == "main thread");
    smud_clear_error();
}

/* ============================================================================
 * Logging Bridge
 * ============================================================================ */

struct LoggedError {
    std::string subsystem;
    std::string message;
};

static void count_errors(Smud_LogLevel level, const char *subsystem, const char *message, void *userdata) {
    if (level != SMUD_LOG_LEVEL_ERROR) return;
    LoggedError *last = static_cast<LoggedError *>(userdata);
    last->subsystem = subsystem;
    last->message = message;
}

TEST_CASE("Log and clear error", "[error][log]") {
    LoggedError last;
    smud_log_set_console_output(false);
    uint32_t handle = smud_log_add_callback(count_errors, &last);
    REQUIRE(handle != 0);

    SECTION("Pending error is logged and cleared") {
        smud_set_error("extract: out of memory");
        smud_log_and_clear_error(SMUD_LOG_RENDER);
        REQUIRE(last.message == "extract: out of memory");
        REQUIRE(last.subsystem == SMUD_LOG_RENDER);
        REQUIRE_FALSE(smud_has_error());
    }

    SECTION("NULL subsystem logs under Core") {
        smud_set_error("picking: out of memory");
        smud_log_and_clear_error(NULL);
        REQUIRE(last.subsystem == SMUD_LOG_CORE);
    }

    SECTION("Nothing pending logs nothing") {
        smud_clear_error();
        smud_log_and_clear_error(SMUD_LOG_PICKING);
        REQUIRE(last.message.empty());
    }

    smud_log_remove_callback(handle);
    smud_log_set_console_output(true);
}
