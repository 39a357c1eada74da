#include "core/text/text_utils.hpp"

#include <cctype>
#include <cstddef>
#include <optional>

namespace snipexec::core::text {

namespace {

bool is_blank_indent(const char c) {
    return c == ' ' || c == '\t';
}

std::string common_prefix(const std::string& a, const std::string& b) {
    std::size_t n = 0;
    while (n < a.size() && n < b.size() && a[n] == b[n]) {
        ++n;
    }
    return a.substr(0, n);
}

}  // namespace

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string strip(const std::string& value) {
    std::size_t begin = 0;
    while (begin < value.size() && is_space(value[begin])) {
        ++begin;
    }
    std::size_t end = value.size();
    while (end > begin && is_space(value[end - 1])) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::string rstrip(const std::string& value) {
    std::size_t end = value.size();
    while (end > 0 && is_space(value[end - 1])) {
        --end;
    }
    return value.substr(0, end);
}

std::vector<std::string> split_lines(const std::string& value) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const auto pos = value.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(value.substr(start));
            break;
        }
        lines.push_back(value.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string dedent(const std::string& value) {
    auto lines = split_lines(value);

    std::optional<std::string> margin;
    for (auto& line : lines) {
        std::size_t indent = 0;
        while (indent < line.size() && is_blank_indent(line[indent])) {
            ++indent;
        }
        if (indent == line.size()) {
            line.clear();
            continue;
        }
        const std::string prefix = line.substr(0, indent);
        margin = margin.has_value() ? common_prefix(*margin, prefix) : prefix;
    }

    if (margin.has_value() && !margin->empty()) {
        for (auto& line : lines) {
            if (line.compare(0, margin->size(), *margin) == 0) {
                line.erase(0, margin->size());
            }
        }
    }

    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

}  // namespace snipexec::core::text
