#include "rewriter/expression_checker.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace snipexec::rewriter {

namespace {

enum class TokenKind {
    Name,
    Number,
    String,
    Op,
    End
};

struct Token {
    TokenKind kind;
    std::string text;
};

const std::unordered_set<std::string>& keywords() {
    static const std::unordered_set<std::string> kKeywords = {
        "False", "None",   "True",    "and",      "as",       "assert", "async",
        "await", "break",  "class",   "continue", "def",      "del",    "elif",
        "else",  "except", "finally", "for",      "from",     "global", "if",
        "import", "in",    "is",      "lambda",   "nonlocal", "not",    "or",
        "pass",  "raise",  "return",  "try",      "while",    "with",   "yield"};
    return kKeywords;
}

bool is_keyword(const std::string& name) {
    return keywords().count(name) != 0;
}

bool is_ident_start(const char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) != 0 || c == '_' || u >= 0x80;
}

bool is_ident_char(const char c) {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_string_prefix(std::string prefix) {
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return prefix == "r" || prefix == "u" || prefix == "b" || prefix == "f" ||
           prefix == "br" || prefix == "rb" || prefix == "fr" || prefix == "rf";
}

// Bracket depth the CPython tokenizer accepts (MAXLEVEL).
constexpr std::size_t kMaxNestingLevel = 200;

// Bound on nested expression/unary/not rules, so a line such as "-" * 10**6
// is rejected instead of exhausting the stack.
constexpr std::size_t kMaxParseDepth = 3000;

// Longest operators first so that "**" wins over "*".
constexpr std::array<std::string_view, 47> kOperators = {
    "**=", "//=", ">>=", "<<=", "...", "**", "//", "<<", ">>", "<=", "<>",
    ">=",  "==",  "!=",  "->",  ":=",  "+=", "-=", "*=", "/=", "%=", "&=",
    "|=",  "^=",  "@=",  "+",   "-",   "*",  "/",  "%",  "@",  "&",  "|",
    "^",   "~",   "<",   ">",   "(",   ")",  "[",  "]",  "{",  "}",  ",",
    ":",   ".",   ";"};

class Tokenizer {
public:
    explicit Tokenizer(const std::string& source) : src_(source) {}

    std::optional<std::vector<Token>> run() {
        std::vector<Token> tokens;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c == ' ' || c == '\t' || c == '\f') {
                ++pos_;
                continue;
            }
            if (c == '#') {
                break;
            }
            if (c == '"' || c == '\'') {
                if (!lex_string(pos_)) {
                    return std::nullopt;
                }
                tokens.push_back({TokenKind::String, ""});
                continue;
            }
            if (is_ident_start(c)) {
                const std::size_t start = pos_;
                while (pos_ < src_.size() && is_ident_char(src_[pos_])) {
                    ++pos_;
                }
                std::string name = src_.substr(start, pos_ - start);
                if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') &&
                    is_string_prefix(name)) {
                    const bool formatted = name.find_first_of("fF") != std::string::npos;
                    if (!lex_string(pos_, formatted)) {
                        return std::nullopt;
                    }
                    tokens.push_back({TokenKind::String, ""});
                    continue;
                }
                tokens.push_back({TokenKind::Name, std::move(name)});
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) != 0 ||
                (c == '.' && pos_ + 1 < src_.size() &&
                 std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])) != 0)) {
                if (!lex_number()) {
                    return std::nullopt;
                }
                tokens.push_back({TokenKind::Number, ""});
                continue;
            }

            bool matched = false;
            for (const auto op : kOperators) {
                if (src_.compare(pos_, op.size(), op) == 0) {
                    if (!track_bracket(op)) {
                        return std::nullopt;
                    }
                    tokens.push_back({TokenKind::Op, std::string(op)});
                    pos_ += op.size();
                    matched = true;
                    break;
                }
            }
            // '!' alone, '$', '?', backticks, backslash continuations, stray
            // newlines: none of them can start a token on a single line.
            if (!matched) {
                return std::nullopt;
            }
        }
        tokens.push_back({TokenKind::End, ""});
        return tokens;
    }

private:
    // Keeps the open-bracket stack; a closer must match the innermost opener.
    bool track_bracket(const std::string_view op) {
        if (op == "(" || op == "[" || op == "{") {
            if (brackets_.size() >= kMaxNestingLevel) {
                return false;  // "too many nested parentheses"
            }
            brackets_.push_back(op[0]);
            return true;
        }
        const char opener = op == ")" ? '(' : op == "]" ? '[' : op == "}" ? '{' : '\0';
        if (opener == '\0') {
            return true;
        }
        if (brackets_.empty() || brackets_.back() != opener) {
            return false;
        }
        brackets_.pop_back();
        return true;
    }

    // For f-strings the replacement fields must also balance: "{{" and "}}"
    // are literal braces, a lone "}" or an empty "{}" is an error. The
    // expressions inside the fields are not parsed.
    bool lex_string(const std::size_t quote_pos, const bool formatted = false) {
        const char quote = src_[quote_pos];
        const bool triple = src_.compare(quote_pos, 3, std::string(3, quote)) == 0;
        pos_ = quote_pos + (triple ? 3 : 1);
        std::size_t field_depth = 0;
        bool field_empty = true;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c == '\\') {
                if (pos_ + 1 >= src_.size()) {
                    return false;
                }
                pos_ += 2;
                continue;
            }
            if (c == '\n' && !triple) {
                return false;
            }
            if (c == quote) {
                if (!triple) {
                    ++pos_;
                    return field_depth == 0;
                }
                if (src_.compare(pos_, 3, std::string(3, quote)) == 0) {
                    pos_ += 3;
                    return field_depth == 0;
                }
            }
            if (formatted && !lex_field_char(c, field_depth, field_empty)) {
                return false;
            }
            ++pos_;
        }
        return false;
    }

    bool lex_field_char(const char c, std::size_t& depth, bool& empty) {
        const bool doubled = pos_ + 1 < src_.size() && src_[pos_ + 1] == c;
        if (c == '{') {
            if (depth == 0 && doubled) {
                ++pos_;
                return true;
            }
            if (depth == 0) {
                empty = true;
            }
            ++depth;
            return true;
        }
        if (c == '}') {
            if (depth == 0) {
                if (!doubled) {
                    return false;
                }
                ++pos_;
                return true;
            }
            --depth;
            return depth != 0 || !empty;
        }
        if (depth > 0 && c != ' ' && c != '\t') {
            empty = false;
        }
        return true;
    }

    // Digits with single underscores between them. Returns the digits read.
    std::optional<std::string> digit_part(bool (*accept)(char)) {
        std::string digits;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (accept(c)) {
                digits.push_back(c);
                ++pos_;
                continue;
            }
            if (c == '_' && !digits.empty() && pos_ + 1 < src_.size() &&
                accept(src_[pos_ + 1])) {
                ++pos_;
                continue;
            }
            break;
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        return digits;
    }

    static bool is_dec(const char c) { return c >= '0' && c <= '9'; }
    static bool is_hex(const char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    }
    static bool is_oct(const char c) { return c >= '0' && c <= '7'; }
    static bool is_bin(const char c) { return c == '0' || c == '1'; }

    bool lex_number() {
        if (src_[pos_] == '0' && pos_ + 1 < src_.size()) {
            const char base = static_cast<char>(
                std::tolower(static_cast<unsigned char>(src_[pos_ + 1])));
            bool (*accept)(char) = nullptr;
            if (base == 'x') accept = is_hex;
            if (base == 'o') accept = is_oct;
            if (base == 'b') accept = is_bin;
            if (accept != nullptr) {
                pos_ += 2;
                if (pos_ < src_.size() && src_[pos_] == '_') {
                    ++pos_;
                }
                if (!digit_part(accept)) {
                    return false;
                }
                return !followed_by_ident();
            }
        }

        std::string int_digits;
        bool is_float = false;
        if (src_[pos_] != '.') {
            auto digits = digit_part(is_dec);
            if (!digits) {
                return false;
            }
            int_digits = *digits;
        }
        if (pos_ < src_.size() && src_[pos_] == '.') {
            is_float = true;
            ++pos_;
            if (pos_ < src_.size() && is_dec(src_[pos_]) && !digit_part(is_dec)) {
                return false;
            }
        }
        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
            is_float = true;
            ++pos_;
            if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-')) {
                ++pos_;
            }
            if (!digit_part(is_dec)) {
                return false;
            }
        }
        if (pos_ < src_.size() && (src_[pos_] == 'j' || src_[pos_] == 'J')) {
            is_float = true;
            ++pos_;
        }
        // "012" is rejected, "000" and "012.5" are fine.
        if (!is_float && int_digits.size() > 1 && int_digits[0] == '0' &&
            int_digits.find_first_not_of('0') != std::string::npos) {
            return false;
        }
        return !followed_by_ident();
    }

    bool followed_by_ident() const {
        return pos_ < src_.size() && is_ident_char(src_[pos_]);
    }

    const std::string& src_;
    std::size_t pos_ = 0;
    std::vector<char> brackets_;
};

// Recursive descent over the Python expression grammar. Every method returns
// false as soon as the input stops matching; nothing is built.
class ExpressionParser {
public:
    explicit ExpressionParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    bool parse_eval_input() {
        if (!expressions()) {
            return false;
        }
        return peek().kind == TokenKind::End;
    }

private:
    class DepthGuard {
    public:
        explicit DepthGuard(std::size_t& depth) : depth_(depth) { ++depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        ~DepthGuard() { --depth_; }

        bool exceeded() const { return depth_ > kMaxParseDepth; }

    private:
        std::size_t& depth_;
    };

    const Token& peek(const std::size_t ahead = 0) const {
        const std::size_t index = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[index];
    }

    bool peek_op(const std::string& op, const std::size_t ahead = 0) const {
        const auto& token = peek(ahead);
        return token.kind == TokenKind::Op && token.text == op;
    }

    bool peek_keyword(const std::string& word, const std::size_t ahead = 0) const {
        const auto& token = peek(ahead);
        return token.kind == TokenKind::Name && token.text == word;
    }

    bool accept_op(const std::string& op) {
        if (!peek_op(op)) {
            return false;
        }
        ++pos_;
        return true;
    }

    bool accept_keyword(const std::string& word) {
        if (!peek_keyword(word)) {
            return false;
        }
        ++pos_;
        return true;
    }

    bool accept_identifier() {
        const auto& token = peek();
        if (token.kind != TokenKind::Name || is_keyword(token.text)) {
            return false;
        }
        ++pos_;
        return true;
    }

    bool starts_expression() const {
        const auto& token = peek();
        switch (token.kind) {
            case TokenKind::Number:
            case TokenKind::String:
                return true;
            case TokenKind::Name:
                return !is_keyword(token.text) || token.text == "not" ||
                       token.text == "lambda" || token.text == "True" ||
                       token.text == "False" || token.text == "None";
            case TokenKind::Op:
                return token.text == "(" || token.text == "[" || token.text == "{" ||
                       token.text == "-" || token.text == "+" || token.text == "~" ||
                       token.text == "...";
            default:
                return false;
        }
    }

    bool starts_comprehension() const {
        return peek_keyword("for") || peek_keyword("async");
    }

    // expressions: expression (',' expression)* [',']
    bool expressions() {
        if (!expression()) {
            return false;
        }
        while (accept_op(",")) {
            if (!starts_expression()) {
                break;
            }
            if (!expression()) {
                return false;
            }
        }
        return true;
    }

    bool expression() {
        const DepthGuard guard(depth_);
        if (guard.exceeded()) {
            return false;
        }
        if (peek_keyword("lambda")) {
            return lambdef();
        }
        if (!disjunction()) {
            return false;
        }
        if (accept_keyword("if")) {
            if (!disjunction() || !accept_keyword("else")) {
                return false;
            }
            return expression();
        }
        return true;
    }

    bool lambdef() {
        accept_keyword("lambda");
        while (!peek_op(":")) {
            if (accept_op("**")) {
                if (!accept_identifier()) {
                    return false;
                }
            } else if (accept_op("*")) {
                accept_identifier();
            } else if (!accept_op("/") && !accept_identifier()) {
                return false;
            }
            if (!accept_op(",")) {
                break;
            }
        }
        if (!accept_op(":")) {
            return false;
        }
        return expression();
    }

    bool disjunction() {
        if (!conjunction()) {
            return false;
        }
        while (accept_keyword("or")) {
            if (!conjunction()) {
                return false;
            }
        }
        return true;
    }

    bool conjunction() {
        if (!inversion()) {
            return false;
        }
        while (accept_keyword("and")) {
            if (!inversion()) {
                return false;
            }
        }
        return true;
    }

    bool inversion() {
        const DepthGuard guard(depth_);
        if (guard.exceeded()) {
            return false;
        }
        if (accept_keyword("not")) {
            return inversion();
        }
        return comparison();
    }

    bool accept_compare_op() {
        static const std::array<const char*, 6> kCompareOps = {"==", "!=", "<",
                                                               ">",  "<=", ">="};
        for (const char* op : kCompareOps) {
            if (accept_op(op)) {
                return true;
            }
        }
        if (accept_keyword("in")) {
            return true;
        }
        if (peek_keyword("not") && peek_keyword("in", 1)) {
            pos_ += 2;
            return true;
        }
        if (accept_keyword("is")) {
            accept_keyword("not");
            return true;
        }
        return false;
    }

    bool comparison() {
        if (!bitwise_or()) {
            return false;
        }
        while (accept_compare_op()) {
            if (!bitwise_or()) {
                return false;
            }
        }
        return true;
    }

    template <typename Next>
    bool binary_chain(const std::initializer_list<const char*> ops, Next next) {
        if (!(this->*next)()) {
            return false;
        }
        while (true) {
            bool consumed = false;
            for (const char* op : ops) {
                if (accept_op(op)) {
                    consumed = true;
                    break;
                }
            }
            if (!consumed) {
                return true;
            }
            if (!(this->*next)()) {
                return false;
            }
        }
    }

    bool bitwise_or() { return binary_chain({"|"}, &ExpressionParser::bitwise_xor); }
    bool bitwise_xor() { return binary_chain({"^"}, &ExpressionParser::bitwise_and); }
    bool bitwise_and() { return binary_chain({"&"}, &ExpressionParser::shift_expr); }
    bool shift_expr() { return binary_chain({"<<", ">>"}, &ExpressionParser::sum); }
    bool sum() { return binary_chain({"+", "-"}, &ExpressionParser::term); }
    bool term() {
        return binary_chain({"*", "/", "//", "%", "@"}, &ExpressionParser::factor);
    }

    bool factor() {
        const DepthGuard guard(depth_);
        if (guard.exceeded()) {
            return false;
        }
        if (accept_op("+") || accept_op("-") || accept_op("~")) {
            return factor();
        }
        return power();
    }

    bool power() {
        if (!primary()) {
            return false;
        }
        if (accept_op("**")) {
            return factor();
        }
        return true;
    }

    bool primary() {
        if (!atom()) {
            return false;
        }
        while (true) {
            if (accept_op(".")) {
                if (!accept_identifier()) {
                    return false;
                }
            } else if (accept_op("(")) {
                if (!arguments()) {
                    return false;
                }
            } else if (accept_op("[")) {
                if (!slices()) {
                    return false;
                }
            } else {
                return true;
            }
        }
    }

    bool atom() {
        const auto& token = peek();
        switch (token.kind) {
            case TokenKind::Number:
                ++pos_;
                return true;
            case TokenKind::String:
                while (peek().kind == TokenKind::String) {
                    ++pos_;
                }
                return true;
            case TokenKind::Name:
                if (token.text == "True" || token.text == "False" ||
                    token.text == "None") {
                    ++pos_;
                    return true;
                }
                return accept_identifier();
            case TokenKind::Op:
                if (accept_op("...")) {
                    return true;
                }
                if (accept_op("(")) {
                    return group();
                }
                if (accept_op("[")) {
                    return list_display();
                }
                if (accept_op("{")) {
                    return brace_display();
                }
                return false;
            default:
                return false;
        }
    }

    // star_named_expression: '*' bitwise_or | expression
    bool star_named_expression(bool* starred = nullptr) {
        if (accept_op("*")) {
            if (starred != nullptr) {
                *starred = true;
            }
            return bitwise_or();
        }
        return expression();
    }

    // Items after the first one of a tuple, list or set display.
    bool remaining_items(const std::string& closer) {
        while (accept_op(",")) {
            if (peek_op(closer)) {
                break;
            }
            if (!star_named_expression()) {
                return false;
            }
        }
        return accept_op(closer);
    }

    bool group() {
        if (accept_op(")")) {
            return true;
        }
        bool starred = false;
        if (!star_named_expression(&starred)) {
            return false;
        }
        if (starts_comprehension()) {
            return !starred && for_if_clauses() && accept_op(")");
        }
        if (peek_op(")")) {
            ++pos_;
            return !starred;
        }
        return remaining_items(")");
    }

    bool list_display() {
        if (accept_op("]")) {
            return true;
        }
        bool starred = false;
        if (!star_named_expression(&starred)) {
            return false;
        }
        if (starts_comprehension()) {
            return !starred && for_if_clauses() && accept_op("]");
        }
        return remaining_items("]");
    }

    bool dict_item() {
        if (accept_op("**")) {
            return bitwise_or();
        }
        return expression() && accept_op(":") && expression();
    }

    bool brace_display() {
        if (accept_op("}")) {
            return true;
        }
        bool is_dict = false;
        bool starred = false;
        if (accept_op("**")) {
            if (!bitwise_or()) {
                return false;
            }
            is_dict = true;
        } else {
            if (!star_named_expression(&starred)) {
                return false;
            }
            if (!starred && accept_op(":")) {
                if (!expression()) {
                    return false;
                }
                is_dict = true;
                if (starts_comprehension()) {
                    return for_if_clauses() && accept_op("}");
                }
            }
        }

        if (!is_dict) {
            if (starts_comprehension()) {
                return !starred && for_if_clauses() && accept_op("}");
            }
            return remaining_items("}");
        }

        while (accept_op(",")) {
            if (peek_op("}")) {
                break;
            }
            if (!dict_item()) {
                return false;
            }
        }
        return accept_op("}");
    }

    bool for_if_clauses() {
        // async comprehensions are only legal inside async functions.
        if (peek_keyword("async")) {
            return false;
        }
        if (!accept_keyword("for")) {
            return false;
        }
        while (true) {
            if (!star_targets() || !accept_keyword("in") || !disjunction()) {
                return false;
            }
            while (accept_keyword("if")) {
                if (!disjunction()) {
                    return false;
                }
            }
            if (peek_keyword("async")) {
                return false;
            }
            if (!accept_keyword("for")) {
                return true;
            }
        }
    }

    bool star_targets() {
        if (!star_target()) {
            return false;
        }
        while (accept_op(",")) {
            if (peek_keyword("in") || peek_op(")") || peek_op("]")) {
                break;
            }
            if (!star_target()) {
                return false;
            }
        }
        return true;
    }

    bool star_target() {
        accept_op("*");
        if (accept_op("(")) {
            if (accept_op(")")) {
                return true;
            }
            return star_targets() && accept_op(")");
        }
        if (accept_op("[")) {
            if (accept_op("]")) {
                return true;
            }
            return star_targets() && accept_op("]");
        }
        if (!accept_identifier()) {
            return false;
        }
        // Attribute and subscript targets; a call may not come last.
        bool ends_in_call = false;
        while (true) {
            if (accept_op(".")) {
                if (!accept_identifier()) {
                    return false;
                }
                ends_in_call = false;
            } else if (accept_op("[")) {
                if (!slices()) {
                    return false;
                }
                ends_in_call = false;
            } else if (accept_op("(")) {
                if (!arguments()) {
                    return false;
                }
                ends_in_call = true;
            } else {
                return !ends_in_call;
            }
        }
    }

    // Called after '('; consumes through ')'.
    bool arguments() {
        if (accept_op(")")) {
            return true;
        }
        bool first = true;
        while (true) {
            if (accept_op("*") || accept_op("**")) {
                if (!expression()) {
                    return false;
                }
            } else {
                if (!expression()) {
                    return false;
                }
                // A bare generator is only allowed as the sole argument.
                if (first && starts_comprehension()) {
                    return for_if_clauses() && accept_op(")");
                }
            }
            first = false;
            if (!accept_op(",")) {
                break;
            }
            if (peek_op(")")) {
                break;
            }
        }
        return accept_op(")");
    }

    bool slice() {
        if (accept_op("*")) {
            return bitwise_or();
        }
        bool has_part = false;
        if (!peek_op(":")) {
            if (!expression()) {
                return false;
            }
            has_part = true;
        }
        if (accept_op(":")) {
            has_part = true;
            if (starts_expression() && !expression()) {
                return false;
            }
            if (accept_op(":") && starts_expression() && !expression()) {
                return false;
            }
        }
        return has_part;
    }

    // Called after '['; consumes through ']'.
    bool slices() {
        if (!slice()) {
            return false;
        }
        while (accept_op(",")) {
            if (peek_op("]")) {
                break;
            }
            if (!slice()) {
                return false;
            }
        }
        return accept_op("]");
    }

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
};

}  // namespace

bool is_python_expression(const std::string& line) {
    auto tokens = Tokenizer(line).run();
    if (!tokens.has_value()) {
        return false;
    }
    ExpressionParser parser(std::move(*tokens));
    return parser.parse_eval_input();
}

}  // namespace snipexec::rewriter
