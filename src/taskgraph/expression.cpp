#include "taskgraph/expression.hpp"
#include "taskgraph/task_errors.hpp"

#include <cctype>

namespace PHR {
namespace TaskGraph {

namespace {

const char* const kExpressionSource = "<expression>";

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && isSpace(text[begin])) ++begin;
    size_t end = text.size();
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

void appendLiteral(Expression& expr, const std::string& text) {
    if (text.empty()) {
        return;
    }
    if (!expr.segments.empty()) {
        if (auto* last = std::get_if<LiteralSegment>(&expr.segments.back())) {
            last->text += text;
            return;
        }
    }
    expr.segments.push_back(LiteralSegment{text});
}

// EN: Returns the index of the bracket closing the one at 'open_pos', or npos.
// FR: Retourne l'index de la parenthèse fermant celle en 'open_pos', ou npos.
size_t findClosing(const std::string& text, size_t open_pos) {
    const char open = text[open_pos];
    const char close = open == '(' ? ')' : '}';
    int depth = 0;
    for (size_t i = open_pos; i < text.size(); ++i) {
        if (text[i] == open) {
            ++depth;
        } else if (text[i] == close) {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

void collectReferences(const Expression& expr, std::vector<std::string>& out) {
    for (const auto& segment : expr.segments) {
        if (const auto* ref = std::get_if<ReferenceSegment>(&segment)) {
            out.push_back(ref->name);
        } else if (const auto* extraction = std::get_if<ExtractionSegment>(&segment)) {
            collectReferences(*extraction->command, out);
        }
    }
}

} // namespace

Expression Expression::literal(const std::string& text) {
    Expression expr;
    appendLiteral(expr, text);
    return expr;
}

bool Expression::isLiteral() const {
    for (const auto& segment : segments) {
        if (!std::holds_alternative<LiteralSegment>(segment)) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> Expression::references() const {
    std::vector<std::string> names;
    collectReferences(*this, names);
    return names;
}

std::string Expression::toString() const {
    std::string out;
    for (const auto& segment : segments) {
        if (const auto* literal = std::get_if<LiteralSegment>(&segment)) {
            for (char c : literal->text) {
                if (c == '$') out += '$';
                out += c;
            }
        } else if (const auto* ref = std::get_if<ReferenceSegment>(&segment)) {
            out += "$(" + ref->name + ")";
        } else if (const auto* extraction = std::get_if<ExtractionSegment>(&segment)) {
            out += "$(shell " + extraction->command->toString() + ")";
        }
    }
    return out;
}

Expression parseExpression(const std::string& text) {
    Expression expr;
    std::string pending;
    size_t i = 0;

    while (i < text.size()) {
        if (text[i] != '$' || i + 1 >= text.size()) {
            pending += text[i++];
            continue;
        }

        const char next = text[i + 1];
        if (next == '$') {
            pending += '$';
            i += 2;
            continue;
        }
        if (next != '(' && next != '{') {
            pending += '$';
            ++i;
            continue;
        }

        const size_t close = findClosing(text, i + 1);
        if (close == std::string::npos) {
            throw TaskfileSyntaxError(kExpressionSource, 0,
                                      "unterminated variable reference in '" + text + "'");
        }

        appendLiteral(expr, pending);
        pending.clear();

        const std::string inner = text.substr(i + 2, close - i - 2);
        const std::string trimmed = trim(inner);

        if (trimmed.compare(0, 5, "shell") == 0 && trimmed.size() > 5 && isSpace(trimmed[5])) {
            auto command = std::make_shared<Expression>(parseExpression(trim(trimmed.substr(6))));
            expr.segments.push_back(ExtractionSegment{command});
        } else {
            if (trimmed.empty()) {
                throw TaskfileSyntaxError(kExpressionSource, 0,
                                          "empty variable reference in '" + text + "'");
            }
            if (trimmed.find('$') != std::string::npos) {
                throw TaskfileSyntaxError(kExpressionSource, 0,
                                          "computed variable names are not supported: '" + trimmed + "'");
            }
            for (char c : trimmed) {
                if (isSpace(c)) {
                    throw TaskfileSyntaxError(kExpressionSource, 0,
                                              "unsupported function in '$(" + trimmed + ")'");
                }
            }
            expr.segments.push_back(ReferenceSegment{trimmed});
        }

        i = close + 1;
    }

    appendLiteral(expr, pending);
    return expr;
}

} // namespace TaskGraph
} // namespace PHR
