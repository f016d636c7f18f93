// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <pretty_diff/printer.h>

namespace pretty_diff {

std::vector<std::string> LinePrinter::take() noexcept
{
    return std::exchange(lines_, {});
}

void LinePrinter::write_line(std::string_view line)
{
    lines_.emplace_back(line);
}

void StreamPrinter::write_line(std::string_view line)
{
    *os_ << line << '\n';
}

} // namespace pretty_diff
