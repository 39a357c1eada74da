#include "rewriter/print_rewriter.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"
#include "rewriter/expression_checker.hpp"

namespace snipexec::rewriter {

std::vector<std::string> logical_lines(const std::string& code) {
    std::string normalized = code;
    std::replace(normalized.begin(), normalized.end(), ';', '\n');

    std::vector<std::string> lines;
    for (const auto& piece : core::text::split_lines(normalized)) {
        std::string line = core::text::strip(piece);
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

std::string maybe_wrap_print(const std::string& code) {
    if (code.find("print(") != std::string::npos) {
        return code;
    }

    const auto lines = logical_lines(code);
    if (lines.empty()) {
        return code;
    }

    const std::string& last = lines.back();
    if (last.find('=') != std::string::npos) {
        LOG_DEBUG("Rewriter: last line is a statement, leaving snippet as is");
        return code;
    }

    if (!is_python_expression(last)) {
        LOG_DEBUG("Rewriter: last line is not an expression: " + last);
        return code;
    }

    LOG_DEBUG("Rewriter: appending print(" + last + ")");
    return core::text::rstrip(core::text::dedent(code)) + "\nprint(" + last + ")";
}

}  // namespace snipexec::rewriter
