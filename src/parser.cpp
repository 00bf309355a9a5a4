#include "parser.hpp"

#include "errors.hpp"

namespace binexp {

namespace {
std::vector<Token> classify(const std::vector<std::string>& tokenTexts) {
    std::vector<Token> tokens;
    tokens.reserve(tokenTexts.size());
    for (std::size_t i = 0; i < tokenTexts.size(); ++i) {
        const auto& text = tokenTexts[i];
        tokens.push_back({isNumericLiteral(text) ? TokenType::Number : TokenType::Operator, text, i});
    }
    return tokens;
}
}

Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

Parser::Parser(const std::vector<std::string>& tokenTexts) : tokens(classify(tokenTexts)) {}

// Всё выражение должно быть разобрано полностью
std::unique_ptr<AstNode> Parser::parse() {
    auto root = parseExpression();
    if (!isAtEnd()) {
        const Token& extra = tokens[current];
        throw MalformedInputError("Лишние токены после конца выражения, начиная с '" +
                                      extra.text + "' (токен " +
                                      std::to_string(extra.position) + ")",
                                  extra.position);
    }
    return root;
}

std::unique_ptr<AstNode> Parser::parseExpression() {
    return parseNode("Пустое выражение");
}

bool Parser::isAtEnd() const {
    return current >= tokens.size();
}

std::size_t Parser::endPosition() const {
    return tokens.empty() ? 0 : tokens.back().position + 1;
}

const Token& Parser::advance(const std::string& errorMessage) {
    if (isAtEnd()) {
        throw MalformedInputError(errorMessage, endPosition());
    }
    return tokens[current++];
}

// Грамматика: Node -> Number | Operator Node Node
std::unique_ptr<AstNode> Parser::parseNode(const std::string& errorMessage) {
    const Token& token = advance(errorMessage);
    const std::size_t position = token.position;

    if (token.type == TokenType::Number) {
        return std::make_unique<NumberNode>(token.text);
    }

    auto op = parseOperator(token.text);
    if (!op) {
        throw InvalidOperatorError(token.text, position);
    }

    std::string symbol(1, operatorSymbol(*op));
    auto left = parseNode("Не хватает левого операнда для '" + symbol + "' (токен " +
                          std::to_string(position) + ")");
    auto right = parseNode("Не хватает правого операнда для '" + symbol + "' (токен " +
                           std::to_string(position) + ")");
    return std::make_unique<BinaryNode>(*op, std::move(left), std::move(right));
}

} // namespace binexp
