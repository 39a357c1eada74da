#pragma once

#include <string>

namespace snipexec::rewriter {

// Returns true when `line` is a complete Python expression in "eval" mode,
// i.e. it could be passed to compile(line, "<expr>", "eval") without a
// SyntaxError. Only syntax is checked: names are never resolved and nothing
// is executed. The check covers one logical line; line continuations and
// statements (assignments, loops, imports, ...) are rejected. Brackets may
// nest 200 deep, as in CPython. f-string fields are checked for balanced
// braces only; the expressions inside them are not parsed.
bool is_python_expression(const std::string& line);

}  // namespace snipexec::rewriter
