#pragma once

#include <string>
#include <vector>

namespace snipexec::rewriter {

// Logical lines of a snippet: ';' counts as a line break, every piece is
// stripped and blank pieces are dropped.
std::vector<std::string> logical_lines(const std::string& code);

// Appends `print(<last line>)` when the snippet ends in a bare expression
// whose value would otherwise be discarded. Never fails: whenever the last
// line cannot be classified safely the snippet comes back unchanged.
//
//   "1 + 1"        -> "1 + 1\nprint(1 + 1)"
//   "x = 1; x"     -> "x = 1; x\nprint(x)"
//   "print(3)"     -> unchanged (output is already explicit)
//   "y = f(a=1)"   -> unchanged (last line contains '=')
//   "for i in r:"  -> unchanged (not an expression)
std::string maybe_wrap_print(const std::string& code);

}  // namespace snipexec::rewriter
