// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file printer.h
/// @brief Line sinks for diff output.
///
/// A Printer receives one logical line per call. Formatting always happens
/// here, through std::format, before the line reaches a destination, so
/// every adapter renders identically:
/// - LinePrinter:   collects lines into a std::vector<std::string>
/// - StreamPrinter: writes each line plus '\n' to a std::ostream
/// - LogPrinter:    forwards each line to an external log sink
///
/// Usage:
/// @code
///   LinePrinter lines;
///   lines.printf("{} != {}", 1, 2);
///   lines.lines();   // {"1 != 2"}
///
///   DebugLogger logger;
///   LogPrinter out{logger};
///   print_diff(out, a, b);
/// @endcode

#pragma once

#include <pretty_diff/api.h>
#include <pretty_diff/concepts.h>

#include <format>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pretty_diff {

class PRETTY_DIFF_API Printer {
public:
    virtual ~Printer() = default;

    /// Emits one already rendered line
    void print(std::string_view line) { write_line(line); }

    /// Renders `fmt` with std::format and emits the result as one line
    template <typename... Args>
    void printf(std::format_string<Args...> fmt, Args&&... args) {
        write_line(std::format(fmt, std::forward<Args>(args)...));
    }

protected:
    virtual void write_line(std::string_view line) = 0;
};

/// Collects lines in emission order, without trailing newlines
class PRETTY_DIFF_API LinePrinter final : public Printer {
public:
    [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }

    /// Moves the collected lines out and leaves the printer empty
    [[nodiscard]] std::vector<std::string> take() noexcept;

    void clear() noexcept { lines_.clear(); }

protected:
    void write_line(std::string_view line) override;

private:
    std::vector<std::string> lines_;
};

/// Writes `line\n` per call. Stream failures are left in the stream's
/// state for the caller to check.
class PRETTY_DIFF_API StreamPrinter final : public Printer {
public:
    explicit StreamPrinter(std::ostream& os) noexcept : os_(&os) {}

protected:
    void write_line(std::string_view line) override;

private:
    std::ostream* os_;
};

/// Forwards each line to `sink.log(line)`. When the sink can attribute a
/// record to a call site, the location given at construction is passed
/// along so records point at the code that requested the diff.
template <FormattedLogSink Sink>
class LogPrinter final : public Printer {
public:
    explicit LogPrinter(Sink& sink, std::source_location loc = std::source_location::current()) noexcept
        : sink_(&sink), loc_(loc) {}

protected:
    void write_line(std::string_view line) override {
        if constexpr (LocatedLogSink<Sink>) {
            sink_->log(line, loc_);
        } else {
            sink_->log(line);
        }
    }

private:
    Sink* sink_;
    std::source_location loc_;
};

} // namespace pretty_diff
