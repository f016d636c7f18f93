// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <pretty_diff/shell_quote.h>

#include <algorithm>

namespace pretty_diff {

namespace {

bool is_safe_char(char c) noexcept
{
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '_': case '@': case '%': case '+': case '=':
        case ':': case ',': case '.': case '/': case '-':
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

std::string quote(std::string_view s)
{
    if (s.empty()) {
        return "''";
    }
    if (std::all_of(s.begin(), s.end(), is_safe_char)) {
        return std::string{s};
    }

    std::string result;
    result.reserve(s.size() + 2);
    result += '\'';
    for (char c : s) {
        if (c == '\'') {
            result += "'\"'\"'";
        } else {
            result += c;
        }
    }
    result += '\'';
    return result;
}

std::string quote_command(const std::vector<std::string>& args)
{
    std::string result;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) result += ' ';
        result += quote(args[i]);
    }
    return result;
}

} // namespace pretty_diff
