#ifndef REGEXCC_SYNTAX_TREE_HPP
#define REGEXCC_SYNTAX_TREE_HPP

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "regex_parse.hpp"

namespace regexcc {
    class SyntaxTree {
    public:
        using Ptr = std::shared_ptr<const SyntaxTree>;

        enum class Kind {
            LEAF, OPERATOR
        };

        static Ptr leaf(RegexToken token);
        static Ptr unary(char op, Ptr child);
        static Ptr binary(char op, Ptr left, Ptr right);

        [[nodiscard]] Kind kind() const { return _kind; }
        [[nodiscard]] bool isLeaf() const { return _kind == Kind::LEAF; }
        [[nodiscard]] const RegexToken& token() const { return tokenData; }
        [[nodiscard]] char op() const { return tokenData.content()[0]; }

        // Unary operators keep their operand on the left
        [[nodiscard]] const Ptr& left() const { return leftChild; }
        [[nodiscard]] const Ptr& right() const { return rightChild; }

        [[nodiscard]] size_t nodeCount() const;
        [[nodiscard]] std::string postfix() const;

        void serializeTo(std::ostream& os, int tabCount = 0) const;
    private:
        SyntaxTree(Kind kind, RegexToken token, Ptr left, Ptr right);

        Kind _kind;
        RegexToken tokenData;
        Ptr leftChild, rightChild;
    };

    SyntaxTree::Ptr buildSyntaxTree(const std::vector<RegexToken>& postfix);
}

#endif // REGEXCC_SYNTAX_TREE_HPP
