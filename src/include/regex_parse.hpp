#ifndef REGEXCC_REGEX_PARSE_HPP
#define REGEXCC_REGEX_PARSE_HPP

#include <string>
#include <string_view>
#include <vector>

#include "deterministic_automaton.hpp"
#include "errors.hpp"

namespace regexcc {
    class RegexToken {
    public:
        enum type {
            OPERAND, OPERATOR, LEFT_BRACKET, RIGHT_BRACKET, UNKNOWN
        };

        explicit RegexToken(std::string content) : _content(std::move(content)) {}

        [[nodiscard]] const std::string& content() const { return _content; }

        [[nodiscard]] type getType() const;

        // Transition symbol carried by an operand leaf
        [[nodiscard]] Symbol symbol() const;

        [[nodiscard]] std::string serialize() const;

        bool operator==(const RegexToken& t2) const { return _content == t2._content; }
        bool operator!=(const RegexToken& t2) const { return _content != t2._content; }
        bool operator==(std::string_view sv) const { return _content == sv; }
        bool operator!=(std::string_view sv) const { return _content != sv; }
    private:
        std::string _content;
    };

    class Operator {
    public:
        static constexpr char CONCATENATE = '.';

        static constexpr inline bool isOperator(char c) {
            switch (c) {
            case '*':
            case '+':
            case '?':
            case '.':
            case '|':
                return true;
            default:
                return false;
            }
        }

        static constexpr inline int priority(char op) {
            switch (op) {
            case '*':
            case '+':
            case '?':
                return 3;
            case '.':
                return 2;
            case '|':
                return 1;
            default:
                return 0;
            }
        }

        static constexpr inline int operandCount(char op) {
            return (op == '.' || op == '|') ? 2 : 1;
        }
    };

    // One action of the infix to postfix conversion, with snapshots taken after it
    struct ConversionStep {
        std::string action;
        std::vector<RegexToken> output;
        std::vector<RegexToken> stack;
    };

    std::string desugar(std::string_view sv);
    std::vector<RegexToken> regexTokenize(std::string_view sv);
    std::vector<RegexToken> toPostfix(const std::vector<RegexToken>& tokens, bool strict = false,
                                      std::vector<ConversionStep>* steps = nullptr);

    std::string joinTokens(const std::vector<RegexToken>& tokens, std::string_view separator = "");
} // regexcc

#endif // REGEXCC_REGEX_PARSE_HPP
