// test_debug_log.cpp - Tests for DebugLogger records, headers, wrapping and file output

#include <catch2/catch_all.hpp>
#include <pretty_diff/debug_log.h>
#include <pretty_diff/errors.h>
#include <pretty_diff/value_diff.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

using namespace pretty_diff;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;

// ============================================================
// Helper Functions
// ============================================================

namespace {

std::filesystem::path scratch_file(const char* name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in{path, std::ios::binary};
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::size_t count_of(const std::string& haystack, std::string_view needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

DebugLogOptions quiet_options(std::filesystem::path path) {
    DebugLogOptions options;
    options.path = std::move(path);
    options.color = false;
    options.auto_flush = false;
    return options;
}

void log_from_helper(DebugLogger& logger) {
    logger.log("from helper");
}

} // namespace

// ============================================================
// Helpers
// ============================================================

TEST_CASE("short_file keeps the last directory", "[debug_log]") {
    REQUIRE(short_file("/home/user/project/source/value.cpp") == "source/value.cpp");
    REQUIRE(short_file("value.cpp") == "value.cpp");
}

TEST_CASE("visible_width", "[debug_log]") {
    REQUIRE(visible_width("") == 0);
    REQUIRE(visible_width("abc") == 3);
    REQUIRE(visible_width("\033[33mabc\033[0m") == 3);
    REQUIRE(visible_width("h\xc3\xa9llo") == 5);
}

TEST_CASE("default log path", "[debug_log]") {
    const auto path = DebugLogOptions::default_path();
    const std::string name = path.filename().string();
    REQUIRE((name == "q" || name.rfind("q.", 0) == 0));
}

// ============================================================
// Records and headers
// ============================================================

TEST_CASE("DebugLogger header", "[debug_log][header]") {
    DebugLogOptions options = quiet_options(scratch_file("pretty_diff_header.log"));
    options.command_line = {"demo", "--name", "it's"};
    DebugLogger logger{options};

    logger.log("hello");
    const std::string out = logger.buffered();

    REQUIRE_THAT(out, ContainsSubstring("test_debug_log.cpp:"));
    REQUIRE_THAT(out, ContainsSubstring("[PID: "));
    REQUIRE_THAT(out, ContainsSubstring("args: demo --name 'it'\"'\"'s']"));
    REQUIRE_THAT(out, EndsWith("s hello\n"));
    REQUIRE(out.front() == '\n');

    SECTION("same call site inside the window shares the header") {
        logger.log("again");
        REQUIRE(count_of(logger.buffered(), "[PID: ") == 1);
    }

    SECTION("another function starts a new header") {
        log_from_helper(logger);
        const std::string both = logger.buffered();
        REQUIRE(count_of(both, "[PID: ") == 2);
        REQUIRE_THAT(both, ContainsSubstring("log_from_helper"));
    }
}

TEST_CASE("DebugLogger header window", "[debug_log][header]") {
    DebugLogOptions options = quiet_options(scratch_file("pretty_diff_window.log"));
    options.header_window = std::chrono::milliseconds{1};
    DebugLogger logger{options};

    logger.log("one");
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    logger.log("two");
    REQUIRE(count_of(logger.buffered(), "[PID: ") == 2);
}

TEST_CASE("DebugLogger wraps long records", "[debug_log][wrap]") {
    DebugLogOptions options = quiet_options(scratch_file("pretty_diff_wrap.log"));
    options.max_line_width = 20;
    DebugLogger logger{options};

    SECTION("break before the arg that overflows") {
        logger.log_args({"aaaaaaaaaa", "bbbbbbbbbb", "cc"});
        REQUIRE_THAT(logger.buffered(), EndsWith("s aaaaaaaaaa\n       bbbbbbbbbb cc\n"));
    }

    SECTION("never break before the first arg") {
        const std::string wide(30, 'x');
        logger.log_args({wide});
        REQUIRE_THAT(logger.buffered(), EndsWith("s " + wide + "\n"));
    }

    SECTION("embedded newlines are indented") {
        logger.log("a\nb");
        REQUIRE_THAT(logger.buffered(), EndsWith("s a\n       b\n"));
    }
}

TEST_CASE("DebugLogger colors", "[debug_log]") {
    DebugLogOptions options = quiet_options(scratch_file("pretty_diff_color.log"));
    options.color = true;
    DebugLogger logger{options};

    logger.log("x");
    REQUIRE_THAT(logger.buffered(), ContainsSubstring("\033[33m"));
    REQUIRE_THAT(logger.buffered(), ContainsSubstring("\033[1m["));
}

// ============================================================
// File output
// ============================================================

TEST_CASE("DebugLogger flush appends to the file", "[debug_log][file]") {
    const auto path = scratch_file("pretty_diff_flush.log");
    DebugLogger logger{quiet_options(path)};

    logger.log("first");
    const std::string pending = logger.buffered();
    logger.flush();

    REQUIRE(logger.buffered().empty());
    REQUIRE(read_file(path) == pending);

    logger.log("second");
    logger.flush();
    REQUIRE_THAT(read_file(path), ContainsSubstring("first"));
    REQUIRE_THAT(read_file(path), EndsWith("s second\n"));

    std::filesystem::remove(path);
}

TEST_CASE("DebugLogger auto flush", "[debug_log][file]") {
    auto options = quiet_options(scratch_file("pretty_diff_auto.log"));
    options.auto_flush = true;
    DebugLogger logger{options};

    logger.log("written");
    REQUIRE(logger.buffered().empty());
    REQUIRE_THAT(read_file(options.path), EndsWith("s written\n"));

    std::filesystem::remove(options.path);
}

TEST_CASE("DebugLogger as a diff sink", "[debug_log][file]") {
    TypeRegistry types;
    DebugLogger logger{quiet_options(scratch_file("pretty_diff_sink.log"))};

    log_diff(logger, Value::of_int(types.int_type(), 1), Value::of_int(types.int_type(), 2));
    REQUIRE_THAT(logger.buffered(), EndsWith("s 1 != 2\n"));
    REQUIRE_THAT(logger.buffered(), ContainsSubstring("test_debug_log.cpp:"));
}

TEST_CASE("append_file", "[debug_log][file]") {
    const auto path = scratch_file("pretty_diff_append.log");

    append_file(path, "a");
    append_file(path, "b");
    REQUIRE(read_file(path) == "ab");
    std::filesystem::remove(path);

    SECTION("missing directory fails to open") {
        const auto bad = std::filesystem::temp_directory_path() / "pretty_diff_no_such_dir" / "q";
        REQUIRE_THROWS_AS(append_file(bad, "x"), FileAppendError);

        DebugLogger logger{quiet_options(bad)};
        logger.log("lost");
        REQUIRE_THROWS_AS(logger.flush(), FileAppendError);
        REQUIRE(logger.buffered().empty());
    }
}
