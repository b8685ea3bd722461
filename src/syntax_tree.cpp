#include "syntax_tree.hpp"
#include <fmt/format.h>
#include <stack>

using namespace regexcc;

SyntaxTree::SyntaxTree(Kind kind, RegexToken token, Ptr left, Ptr right) :
        _kind(kind), tokenData(std::move(token)), leftChild(std::move(left)), rightChild(std::move(right)) {}

SyntaxTree::Ptr SyntaxTree::leaf(RegexToken token) {
    return Ptr(new SyntaxTree(Kind::LEAF, std::move(token), nullptr, nullptr));
}

SyntaxTree::Ptr SyntaxTree::unary(char op, Ptr child) {
    return Ptr(new SyntaxTree(Kind::OPERATOR, RegexToken(std::string(1, op)), std::move(child), nullptr));
}

SyntaxTree::Ptr SyntaxTree::binary(char op, Ptr left, Ptr right) {
    return Ptr(new SyntaxTree(Kind::OPERATOR, RegexToken(std::string(1, op)), std::move(left), std::move(right)));
}

size_t SyntaxTree::nodeCount() const {
    size_t count = 1;
    if (leftChild != nullptr) count += leftChild->nodeCount();
    if (rightChild != nullptr) count += rightChild->nodeCount();
    return count;
}

std::string SyntaxTree::postfix() const {
    std::string s;
    if (leftChild != nullptr) s += leftChild->postfix();
    if (rightChild != nullptr) s += rightChild->postfix();
    return s + tokenData.content();
}

void SyntaxTree::serializeTo(std::ostream& os, int tabCount) const {
    for (int i=0; i<tabCount; i++) {
        os << "|";
    }
    os << (isLeaf() ? "LEAF " : "OPERATOR ") << tokenData.content() << '\n';

    for (const Ptr& ch : {leftChild, rightChild}) {
        if (ch == nullptr) continue;
        ch->serializeTo(os, tabCount+1);
    }
}

SyntaxTree::Ptr regexcc::buildSyntaxTree(const std::vector<RegexToken>& postfix) {
    std::stack<SyntaxTree::Ptr> operands;

    auto popOperand = [&](const RegexToken& tk) {
        if (operands.empty()) {
            throw StackUnderflow(fmt::format("operator '{}' is missing an operand", tk.content()));
        }
        SyntaxTree::Ptr top = operands.top();
        operands.pop();
        return top;
    };

    for (const RegexToken& tk : postfix) {
        if (tk.getType() != RegexToken::OPERATOR) {
            operands.push(SyntaxTree::leaf(tk));
            continue;
        }

        char op = tk.content()[0];
        if (Operator::operandCount(op) == 1) {
            SyntaxTree::Ptr child = popOperand(tk);
            operands.push(SyntaxTree::unary(op, std::move(child)));
        } else {
            SyntaxTree::Ptr right = popOperand(tk);
            SyntaxTree::Ptr left = popOperand(tk);
            operands.push(SyntaxTree::binary(op, std::move(left), std::move(right)));
        }
    }

    if (operands.empty()) {
        throw MalformedExpression("empty expression");
    }
    if (operands.size() > 1) {
        throw MalformedExpression(fmt::format("{} operands left without an operator", operands.size()));
    }

    return operands.top();
}
