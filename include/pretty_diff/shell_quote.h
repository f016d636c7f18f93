// shell_quote.h - POSIX shell quoting of single tokens and command lines

#pragma once

#include <pretty_diff/api.h>

#include <string>
#include <string_view>
#include <vector>

namespace pretty_diff {

/// Shell-escaped form of `s`, usable as exactly one token.
///
///   quote("")        -> ''
///   quote("a.txt")   -> a.txt
///   quote("it's")    -> 'it'"'"'s'
///
/// Words made only of [A-Za-z0-9_@%+=:,./-] are returned unchanged.
[[nodiscard]] PRETTY_DIFF_API std::string quote(std::string_view s);

/// quote() applied to each argument, joined by single spaces
[[nodiscard]] PRETTY_DIFF_API std::string quote_command(const std::vector<std::string>& args);

} // namespace pretty_diff
