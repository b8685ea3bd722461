#ifndef REGEXCC_ERRORS_HPP
#define REGEXCC_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace regexcc {
    class RegexError : public std::runtime_error {
    public:
        enum class Kind {
            MALFORMED_EXPRESSION, UNSUPPORTED_OPERATOR, STACK_UNDERFLOW
        };

        RegexError(Kind kind, const std::string& reason) :
                std::runtime_error(reason), _kind(kind), _reason(reason), _message(reason) {}

        [[nodiscard]] Kind kind() const { return _kind; }
        [[nodiscard]] const std::string& reason() const { return _reason; }
        [[nodiscard]] const std::string& expression() const { return _expression; }

        void attachExpression(std::string_view expression) {
            _expression = expression;
            _message = "'" + _expression + "': " + _reason;
        }

        [[nodiscard]] const char* what() const noexcept override { return _message.c_str(); }
    private:
        Kind _kind;
        std::string _reason;
        std::string _expression;
        std::string _message;
    };

    class MalformedExpression : public RegexError {
    public:
        explicit MalformedExpression(const std::string& reason) : RegexError(Kind::MALFORMED_EXPRESSION, reason) {}
    };

    class UnsupportedOperator : public RegexError {
    public:
        explicit UnsupportedOperator(const std::string& reason) : RegexError(Kind::UNSUPPORTED_OPERATOR, reason) {}
    };

    class StackUnderflow : public RegexError {
    public:
        explicit StackUnderflow(const std::string& reason) : RegexError(Kind::STACK_UNDERFLOW, reason) {}
    };

    constexpr std::string_view errorKindName(RegexError::Kind kind) {
        switch (kind) {
        case RegexError::Kind::MALFORMED_EXPRESSION: return "MalformedExpression";
        case RegexError::Kind::UNSUPPORTED_OPERATOR: return "UnsupportedOperator";
        case RegexError::Kind::STACK_UNDERFLOW:      return "StackUnderflow";
        }
        return "";
    }
}

#endif // REGEXCC_ERRORS_HPP
