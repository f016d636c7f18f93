// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file debug_log.h
/// @brief Append-only debug log file with call-site headers.
///
/// Records are grouped under a header naming the call site:
///
/// @code
///   [2024-05-01T14:00:36.125 demo/main.cpp:42 main]
///   [PID: 4711 args: ./demo --verbose]
///   0.000s Name: "Alice" != "Bob"
///   0.001s Items[2]: 3 != 4
/// @endcode
///
/// A new header starts when the calling file or function changes, or when
/// more than `header_window` passed since the previous flush. The relative
/// timestamps restart at every header.
///
/// DebugLogger satisfies LocatedLogSink, so it plugs straight into
/// log_diff():
/// @code
///   DebugLogger logger;
///   log_diff(logger, before, after);
/// @endcode

#pragma once

#include <pretty_diff/api.h>
#include <pretty_diff/config.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace pretty_diff {

struct DebugLogOptions {
    /// Destination file. Defaults to <temp>/q.<user>, or <temp>/q when the
    /// user name is unknown.
    std::filesystem::path path = default_path();

    /// Records wider than this many visible columns wrap before the next arg
    std::size_t max_line_width = PRETTY_DIFF_LOG_MAX_LINE_WIDTH;

    std::chrono::milliseconds header_window{PRETTY_DIFF_LOG_HEADER_WINDOW_MS};

    /// Emit ANSI colors around headers and timestamps
    bool color = true;

    /// Shown in the header, shell-quoted
    std::vector<std::string> command_line;

    /// Flush after every record
    bool auto_flush = true;

    [[nodiscard]] PRETTY_DIFF_API static std::filesystem::path default_path();
};

class PRETTY_DIFF_API DebugLogger {
public:
    using clock = std::chrono::system_clock;

    DebugLogger();
    explicit DebugLogger(DebugLogOptions options);

    DebugLogger(const DebugLogger&) = delete;
    DebugLogger& operator=(const DebugLogger&) = delete;

    /// Appends one record holding `line`
    /// @throws FileAppendError when auto_flush is on and the append fails
    void log(std::string_view line, std::source_location loc = std::source_location::current());

    /// Appends one record made of `args` separated by spaces, wrapping long
    /// records between args
    void log_args(const std::vector<std::string>& args,
                  std::source_location loc = std::source_location::current());

    /// Appends the buffered records to the log file and clears the buffer
    /// @throws FileAppendError
    void flush();

    /// Records not yet written to the file
    [[nodiscard]] std::string buffered() const;

    [[nodiscard]] const DebugLogOptions& options() const noexcept { return options_; }

private:
    void record(const std::vector<std::string>& args, const std::source_location& loc);
    void flush_locked();
    [[nodiscard]] bool should_print_header(std::string_view file, std::string_view func) const;
    [[nodiscard]] std::string header(const std::source_location& loc);
    void output(const std::vector<std::string>& args);
    [[nodiscard]] std::string colorize(std::string_view text, std::string_view color) const;

    DebugLogOptions options_;
    mutable std::mutex mutex_;
    std::string buf_;
    std::string last_file_;
    std::string last_func_;
    clock::time_point start_{};
    clock::time_point last_write_{};
};

/// Appends `data` to `path`, creating it with `perms` when missing.
/// Failures of the individual steps are merged into one message.
/// @throws FileAppendError
PRETTY_DIFF_API void append_file(const std::filesystem::path& path, std::string_view data,
                                 std::filesystem::perms perms = std::filesystem::perms(0666));

/// "<dir>/<file>" of a source path, e.g. "source/value.cpp"
[[nodiscard]] PRETTY_DIFF_API std::string short_file(std::string_view file);

/// Number of terminal columns `text` occupies: UTF-8 code points, not
/// counting ANSI escape sequences
[[nodiscard]] PRETTY_DIFF_API std::size_t visible_width(std::string_view text);

} // namespace pretty_diff
