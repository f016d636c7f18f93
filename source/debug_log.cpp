// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <pretty_diff/debug_log.h>
#include <pretty_diff/errors.h>
#include <pretty_diff/shell_quote.h>

#include <cstdlib>
#include <format>
#include <fstream>
#include <system_error>
#include <utility>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace pretty_diff {

namespace {

constexpr std::string_view kBold = "\033[1m";
constexpr std::string_view kYellow = "\033[33m";
constexpr std::string_view kReset = "\033[0m";

long current_pid()
{
#ifdef _WIN32
    return static_cast<long>(_getpid());
#else
    return static_cast<long>(getpid());
#endif
}

// Inserts `indent` after every newline in `arg`
std::string indent_newlines(std::string_view arg, std::string_view indent)
{
    std::string result;
    result.reserve(arg.size());
    for (char c : arg) {
        result += c;
        if (c == '\n') {
            result += indent;
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================
// Helpers
// ============================================================

std::filesystem::path DebugLogOptions::default_path()
{
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = ".";
    }

    const char* user = std::getenv("USER");
    if (!user || !*user) {
        user = std::getenv("USERNAME");
    }
    if (user && *user) {
        return dir / (std::string{"q."} + user);
    }
    return dir / "q";
}

std::string short_file(std::string_view file)
{
    const std::filesystem::path p{file};
    const auto dir = p.parent_path().filename();
    if (dir.empty()) {
        return p.filename().generic_string();
    }
    return (dir / p.filename()).generic_string();
}

std::size_t visible_width(std::string_view text)
{
    std::size_t width = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c == 0x1b && i + 1 < text.size() && text[i + 1] == '[') {
            // CSI sequence: parameters up to a final byte in 0x40-0x7e
            i += 2;
            while (i < text.size()) {
                const auto f = static_cast<unsigned char>(text[i]);
                if (f >= 0x40 && f <= 0x7e) break;
                ++i;
            }
            continue;
        }
        if ((c & 0xc0) != 0x80) {
            ++width;
        }
    }
    return width;
}

void append_file(const std::filesystem::path& path, std::string_view data, std::filesystem::perms perms)
{
    std::ofstream out{path, std::ios::out | std::ios::app | std::ios::binary};
    if (!out.is_open()) {
        throw FileAppendError(std::format("failed to open \"{}\"", path.string()));
    }

    std::vector<std::string> errors;

    std::error_code ec;
    std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace, ec);
    if (ec) {
        errors.push_back(std::format("chmod {} to mode {:o}: {}", path.string(),
                                     static_cast<unsigned>(perms), ec.message()));
    }

    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        errors.push_back(std::format("write {}", path.string()));
    }

    out.close();
    if (out.fail() && errors.empty()) {
        errors.push_back(std::format("close {}", path.string()));
    }

    if (!errors.empty()) {
        std::string message;
        for (std::size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) message += "; ";
            message += errors[i];
        }
        throw FileAppendError(message);
    }
}

// ============================================================
// DebugLogger
// ============================================================

DebugLogger::DebugLogger() : DebugLogger(DebugLogOptions{}) {}

DebugLogger::DebugLogger(DebugLogOptions options) : options_(std::move(options)) {}

void DebugLogger::log(std::string_view line, std::source_location loc)
{
    record({std::string{line}}, loc);
}

void DebugLogger::log_args(const std::vector<std::string>& args, std::source_location loc)
{
    record(args, loc);
}

void DebugLogger::flush()
{
    std::lock_guard lock{mutex_};
    flush_locked();
}

std::string DebugLogger::buffered() const
{
    std::lock_guard lock{mutex_};
    return buf_;
}

void DebugLogger::record(const std::vector<std::string>& args, const std::source_location& loc)
{
    std::lock_guard lock{mutex_};

    if (const std::string h = header(loc); !h.empty()) {
        buf_ += '\n';
        buf_ += h;
        buf_ += '\n';
    }
    output(args);
    last_write_ = clock::now();

    if (options_.auto_flush) {
        flush_locked();
    }
}

void DebugLogger::flush_locked()
{
    std::string data = std::exchange(buf_, {});
    last_write_ = clock::now();
    append_file(options_.path, data);
}

bool DebugLogger::should_print_header(std::string_view file, std::string_view func) const
{
    if (file != last_file_ || func != last_func_) {
        return true;
    }
    return clock::now() - last_write_ > options_.header_window;
}

std::string DebugLogger::header(const std::source_location& loc)
{
    const std::string_view file = loc.file_name();
    const std::string_view func = loc.function_name();
    if (!should_print_header(file, func)) {
        return {};
    }

    const auto now = clock::now();
    start_ = now;
    last_file_ = file;
    last_func_ = func;

    const auto stamp = std::chrono::floor<std::chrono::milliseconds>(now);
    std::string site = std::format("[{:%FT%T} {}:{} {}]", stamp, short_file(file), loc.line(), func);
    std::string process = std::format("[PID: {} args: {}]", current_pid(), quote_command(options_.command_line));
    return colorize(site, kBold) + "\n" + colorize(process, kBold);
}

void DebugLogger::output(const std::vector<std::string>& args)
{
    const std::chrono::duration<double> elapsed = clock::now() - start_;
    const std::string timestamp = std::format("{:.3f}s", elapsed.count());
    const std::size_t timestamp_width = timestamp.size() + 1;

    buf_ += colorize(timestamp, kYellow);
    buf_ += ' ';

    const std::string indent(timestamp_width, ' ');
    std::string_view padding;
    std::size_t line_args = 0;
    std::size_t line_width = timestamp_width;

    for (const auto& raw : args) {
        const std::size_t arg_width = visible_width(raw);
        line_width += arg_width + padding.size();

        // never break before the first arg of a line
        if (line_width > options_.max_line_width && line_args != 0) {
            buf_ += '\n';
            buf_ += indent;
            line_args = 0;
            line_width = timestamp_width + arg_width;
            padding = {};
        }
        buf_ += padding;
        buf_ += indent_newlines(raw, indent);
        ++line_args;
        padding = " ";
    }

    buf_ += '\n';
}

std::string DebugLogger::colorize(std::string_view text, std::string_view color) const
{
    if (!options_.color) {
        return std::string{text};
    }
    return std::string{color} + std::string{text} + std::string{kReset};
}

} // namespace pretty_diff
