#pragma once

#include <string>
#include <vector>

namespace snipexec::core::text {

bool is_space(char c);

// Removes leading and trailing whitespace.
std::string strip(const std::string& value);

// Removes trailing whitespace only.
std::string rstrip(const std::string& value);

// Splits on '\n' and keeps empty pieces, so joining with '\n' gives the input back.
std::vector<std::string> split_lines(const std::string& value);

// Removes the indentation shared by every non-blank line. Lines made only of
// spaces and tabs become empty. Tabs and spaces are not treated as equal.
std::string dedent(const std::string& value);

}  // namespace snipexec::core::text
