// value_diff.h - Structural diff of two Values, rendered as text lines

#pragma once

#include <pretty_diff/api.h>
#include <pretty_diff/concepts.h>
#include <pretty_diff/cycle_guard.h>
#include <pretty_diff/printer.h>
#include <pretty_diff/value.h>

#include <format>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace pretty_diff {

// ============================================================
// Differ - recursive structural comparison
//
// Walks two values side by side and prints one line per point of
// disagreement. Each line is "<label>: <body>", or just "<body>" at the
// root, where the label is the path from the root:
//
//   Name: "Alice" != "Bob"
//   Items[2]: 3 != 4
//   Tags["x"]: (missing) != true
//   Next.Val: 1 != 2
//   Owner: *User != *Group
//
// Mismatched types, slice lengths and cycles end the walk for that
// subtree. A Differ is a cheap value: relabel() returns a child with an
// extended label and leaves the parent untouched.
// ============================================================

class PRETTY_DIFF_API Differ {
public:
    Differ(Printer& out, CycleGuard& guard) noexcept : out_(&out), guard_(&guard) {}

    /// Compares `a` against `b` and prints every disagreement.
    /// @throws UnsupportedKindError on a kind outside the taxonomy
    /// @throws InvalidMapKeyError when map keys cannot be compared
    void diff(const ValueRef& a, const ValueRef& b) const;

    /// Child differ for a struct field ("Name") or a bracketed segment ("[3]")
    [[nodiscard]] Differ relabel(std::string_view name) const;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

private:
    template <typename... Args>
    void printf(std::format_string<Args...> fmt, Args&&... args) const {
        std::string body = std::format(fmt, std::forward<Args>(args)...);
        if (label_.empty()) {
            out_->print(body);
        } else {
            out_->print(label_ + ": " + body);
        }
    }

    void diff_map(const ValueRef& a, const ValueRef& b) const;

    Printer* out_;
    CycleGuard* guard_;
    std::string label_;
};

/// Prints to `out` a description of every difference between a and b,
/// one print() call per difference, without trailing newline
PRETTY_DIFF_API void print_diff(Printer& out, const Value& a, const Value& b);

/// Every difference between a and b, in walk order
[[nodiscard]] PRETTY_DIFF_API std::vector<std::string> diff(const Value& a, const Value& b);

/// Writes each difference to `os` followed by '\n'
PRETTY_DIFF_API void write_diff(std::ostream& os, const Value& a, const Value& b);

/// Forwards each difference to an external log sink, attributed to the caller
template <FormattedLogSink Sink>
void log_diff(Sink& sink, const Value& a, const Value& b,
              std::source_location loc = std::source_location::current())
{
    LogPrinter<Sink> out{sink, loc};
    print_diff(out, a, b);
}

/// True when diff(a, b) would print at least one line
[[nodiscard]] PRETTY_DIFF_API bool has_any_difference(const Value& a, const Value& b);

} // namespace pretty_diff
