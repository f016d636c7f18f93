// test_printer.cpp - Tests for Printer adapters and log_diff
// Module 5: Sinks

#include <catch2/catch_all.hpp>
#include <pretty_diff/value_diff.h>

#include <cstdint>
#include <source_location>
#include <sstream>
#include <string>
#include <vector>

using namespace pretty_diff;

namespace {

// Sink without call-site support
struct PlainSink {
    std::vector<std::string> records;
    void log(std::string_view line) { records.emplace_back(line); }
};

// Sink that keeps the location it was given
struct LocatedSink {
    std::vector<std::string> records;
    std::vector<std::uint_least32_t> lines;

    void log(std::string_view line, std::source_location loc = std::source_location::current()) {
        records.emplace_back(line);
        lines.push_back(loc.line());
    }
};

static_assert(FormattedLogSink<PlainSink>);
static_assert(!LocatedLogSink<PlainSink>);
static_assert(LocatedLogSink<LocatedSink>);

} // namespace

TEST_CASE("LinePrinter collects lines", "[printer]") {
    LinePrinter out;
    out.print("first");
    out.printf("{} != {}", 1, "two");
    REQUIRE(out.lines() == std::vector<std::string>{"first", "1 != two"});

    SECTION("take empties the printer") {
        auto lines = out.take();
        REQUIRE(lines.size() == 2);
        REQUIRE(out.lines().empty());
    }

    SECTION("clear") {
        out.clear();
        REQUIRE(out.lines().empty());
    }
}

TEST_CASE("StreamPrinter appends newlines", "[printer]") {
    std::ostringstream os;
    StreamPrinter out{os};
    out.print("a");
    out.printf("{}:{}", "b", 2);
    REQUIRE(os.str() == "a\nb:2\n");
}

TEST_CASE("log_diff forwards each difference", "[printer][log]") {
    TypeRegistry types;
    const Type* point = types.define_struct("Point", {{"X", types.int_type()}, {"Y", types.int_type()}});
    Value a = Value::record(point, {Value::of_int(types.int_type(), 1), Value::of_int(types.int_type(), 2)});
    Value b = Value::record(point, {Value::of_int(types.int_type(), 3), Value::of_int(types.int_type(), 4)});

    SECTION("plain sink") {
        PlainSink sink;
        log_diff(sink, a, b);
        REQUIRE(sink.records == std::vector<std::string>{"X: 1 != 3", "Y: 2 != 4"});
    }

    SECTION("located sink receives the caller's location") {
        LocatedSink sink;
        const auto here = std::source_location::current();
        log_diff(sink, a, b, here);
        REQUIRE(sink.records.size() == 2);
        REQUIRE(sink.lines == std::vector<std::uint_least32_t>{here.line(), here.line()});
    }

    SECTION("no differences, no records") {
        PlainSink sink;
        log_diff(sink, a, a);
        REQUIRE(sink.records.empty());
    }
}
