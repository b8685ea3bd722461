#include "regex_parse.hpp"
#include <cctype>
#include <fmt/format.h>

namespace regexcc {
    namespace {
        // Byte length of the character unit starting at i; the reserved empty-string symbol counts as one unit
        size_t unitLength(std::string_view sv, size_t i) {
            return sv.substr(i, EMPTY_WORD.size()) == EMPTY_WORD ? EMPTY_WORD.size() : 1;
        }

        // A backslash before pos is live only when the run of backslashes is odd
        bool isEscaped(std::string_view sv, size_t pos) {
            size_t count = 0;
            while (pos > 0 && sv[pos - 1] == '\\') {
                count++;
                pos--;
            }
            return count % 2 == 1;
        }

        size_t tokenLength(std::string_view sv, size_t i) {
            if (sv[i] == '\\' && i + 1 < sv.size()) {
                return 1 + unitLength(sv, i + 1);
            }
            return unitLength(sv, i);
        }
    }

    RegexToken::type RegexToken::getType() const {
        if (_content.empty()) return UNKNOWN;
        if (_content[0] == '\\' || _content == EMPTY_WORD) return OPERAND;
        if (_content.size() != 1) return UNKNOWN;

        char c = _content[0];
        if (c == '(') return LEFT_BRACKET;
        if (c == ')') return RIGHT_BRACKET;
        if (Operator::isOperator(c)) return OPERATOR;
        if (std::isalnum(static_cast<unsigned char>(c))) return OPERAND;
        switch (c) {
        case '_':
        case '[':
        case ']':
        case '{':
        case '}':
            return OPERAND;
        default:
            return UNKNOWN;
        }
    }

    Symbol RegexToken::symbol() const {
        std::string_view sv = _content;
        if (sv.size() > 1 && sv[0] == '\\') {
            sv.remove_prefix(1);
        }
        if (sv == EMPTY_WORD) return EPS;
        return static_cast<unsigned char>(sv[0]);
    }

    std::string RegexToken::serialize() const {
        switch (getType()) {
        case OPERAND:       return "OPERAND'" + _content + "'";
        case OPERATOR:      return "OPERATOR'" + _content + "'";
        case LEFT_BRACKET:  return "LEFT_BRACKET";
        case RIGHT_BRACKET: return "RIGHT_BRACKET";
        default:            return "UNKNOWN'" + _content + "'";
        }
    }

    std::string desugar(std::string_view sv) {
        std::string out;

        size_t i = 0;
        while (i < sv.size()) {
            std::string unit;
            if (sv[i] == '(' && !isEscaped(sv, i)) {
                size_t start = i;
                int depth = 1;
                i++;
                while (i < sv.size() && depth > 0) {
                    if (sv[i] == '(' && !isEscaped(sv, i)) depth++;
                    else if (sv[i] == ')' && !isEscaped(sv, i)) depth--;
                    i++;
                }
                if (depth > 0) {
                    throw MalformedExpression(fmt::format("unbalanced parentheses: '(' at offset {} is never closed", start));
                }
                unit = "(" + desugar(sv.substr(start + 1, i - start - 2)) + ")";
            } else {
                size_t len = tokenLength(sv, i);
                unit = sv.substr(i, len);
                i += len;
            }

            if (i < sv.size() && !isEscaped(sv, i) && (sv[i] == '+' || sv[i] == '?')) {
                if (sv[i] == '+') {
                    out += unit + unit + '*';
                } else {
                    out += "(" + unit + "|" + std::string(EMPTY_WORD) + ")";
                }
                i++;
            } else {
                out += unit;
            }
        }

        return out;
    }

    std::vector<RegexToken> regexTokenize(std::string_view sv) {
        std::vector<std::string> units;
        for (size_t i = 0; i < sv.size(); ) {
            size_t len = tokenLength(sv, i);
            units.emplace_back(sv.substr(i, len));
            i += len;
        }

        std::vector<RegexToken> tokens;
        for (size_t j = 0; j < units.size(); j++) {
            if (j > 0) {
                const std::string& prev = units[j - 1];
                const std::string& cur = units[j];
                bool prevOpens = prev == "|" || prev == "(";
                bool curCloses = cur == "|" || cur == ")" || cur == "*" || cur == "+" || cur == "?";
                if (!prevOpens && !curCloses) {
                    tokens.emplace_back(std::string(1, Operator::CONCATENATE));
                }
            }
            tokens.emplace_back(units[j]);
        }

        return tokens;
    }

    std::vector<RegexToken> toPostfix(const std::vector<RegexToken>& tokens, bool strict, std::vector<ConversionStep>* steps) {
        std::vector<RegexToken> output;
        std::vector<RegexToken> opers;

        auto record = [&](std::string action) {
            if (steps != nullptr) {
                steps->push_back({std::move(action), output, opers});
            }
        };

        for (const RegexToken& tk : tokens) {
            switch (tk.getType()) {
            case RegexToken::OPERAND:
                output.push_back(tk);
                record("operand " + tk.content());
                break;
            case RegexToken::LEFT_BRACKET:
                opers.push_back(tk);
                record("push (");
                break;
            case RegexToken::RIGHT_BRACKET:
                while (!opers.empty() && opers.back() != "(") {
                    output.push_back(opers.back());
                    opers.pop_back();
                    record("pop for )");
                }
                if (!opers.empty()) {
                    opers.pop_back();
                    record("pop (");
                } else {
                    if (strict) throw MalformedExpression("unbalanced parentheses: unmatched ')'");
                    record("ignore unmatched )");
                }
                break;
            case RegexToken::OPERATOR:
                {
                    int priority = Operator::priority(tk.content()[0]);
                    while (
                            !opers.empty() &&
                            opers.back() != "(" &&
                            Operator::priority(opers.back().content()[0]) >= priority
                    ) {
                        output.push_back(opers.back());
                        opers.pop_back();
                        record("pop op " + output.back().content());
                    }
                    opers.push_back(tk);
                    record("push op " + tk.content());
                }
                break;
            case RegexToken::UNKNOWN:
                if (strict) throw MalformedExpression(fmt::format("unrecognized token '{}'", tk.content()));
                record("ignore " + tk.content());
                break;
            }
        }

        while (!opers.empty()) {
            if (opers.back() == "(") {
                throw MalformedExpression("unbalanced parentheses: unclosed '('");
            }
            output.push_back(opers.back());
            opers.pop_back();
            record("pop end " + output.back().content());
        }

        return output;
    }

    std::string joinTokens(const std::vector<RegexToken>& tokens, std::string_view separator) {
        std::string joined;
        for (size_t i = 0; i < tokens.size(); i++) {
            if (i > 0) joined += separator;
            joined += tokens[i].content();
        }
        return joined;
    }
}
