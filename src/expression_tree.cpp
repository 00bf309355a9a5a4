#include "expression_tree.hpp"

#include <stdexcept>

#include "parser.hpp"
#include "renderer.hpp"
#include "tokenizer.hpp"

namespace binexp {

ExpressionTree::ExpressionTree(std::unique_ptr<AstNode> root) : rootNode(std::move(root)) {
    if (!rootNode) {
        throw std::invalid_argument("Дерево выражения не может быть пустым");
    }
}

ExpressionTree::ExpressionTree(const ExpressionTree& other) : rootNode(other.rootNode->clone()) {}

ExpressionTree& ExpressionTree::operator=(const ExpressionTree& other) {
    if (this != &other) {
        rootNode = other.rootNode->clone();
    }
    return *this;
}

ExpressionTree ExpressionTree::fromTokens(const std::vector<std::string>& tokens) {
    Parser parser(tokens);
    return ExpressionTree(parser.parse());
}

// Полный цикл: токенизация (Tokenizer) и построение дерева (Parser)
ExpressionTree ExpressionTree::fromString(const std::string& expression) {
    Tokenizer tokenizer(expression);
    Parser parser(tokenizer.tokenize());
    return ExpressionTree(parser.parse());
}

std::string ExpressionTree::prefix() const {
    return toPrefix(*rootNode);
}

std::string ExpressionTree::infix() const {
    return toInfix(*rootNode);
}

std::string ExpressionTree::postfix() const {
    return toPostfix(*rootNode);
}

std::string ExpressionTree::dump() const {
    return renderTree(*rootNode);
}

ExpressionTree ExpressionTree::simplified(SimplifyOptions options) const {
    return ExpressionTree(Simplifier(options).simplified(*rootNode));
}

// Работает с копией, чтобы при FoldingError дерево осталось прежним
void ExpressionTree::simplify(SimplifyOptions options) {
    rootNode = Simplifier(options).simplified(*rootNode);
}

bool operator==(const ExpressionTree& lhs, const ExpressionTree& rhs) {
    return lhs.root() == rhs.root();
}

} // namespace binexp
