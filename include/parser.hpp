#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace binexp {

// Построитель дерева из токенов в префиксной записи.
// Рекурсивный спуск с явным курсором: токены читаются слева направо
// в порядке прямого обхода дерева, без заглядывания вперёд.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    // Удобный конструктор для уже разделённых текстов токенов
    explicit Parser(const std::vector<std::string>& tokenTexts);

    // Разбирает одно выражение и требует, чтобы токенов не осталось.
    // MalformedInputError при нехватке операндов или лишних токенах,
    // InvalidOperatorError при неподдерживаемой операции.
    std::unique_ptr<AstNode> parse();

    // Разбирает одно выражение с текущей позиции, хвост не проверяется
    std::unique_ptr<AstNode> parseExpression();

    // Сколько токенов уже прочитано
    std::size_t consumed() const { return current; }

    // Сколько токенов осталось
    std::size_t remaining() const { return tokens.size() - current; }

private:
    const std::vector<Token> tokens; // Список токенов
    std::size_t current = 0;         // Индекс текущего токена

    bool isAtEnd() const;

    // Позиция сразу за последним токеном
    std::size_t endPosition() const;

    // Возвращает текущий токен и сдвигает курсор.
    // Если токены закончились — MalformedInputError с текстом errorMessage.
    const Token& advance(const std::string& errorMessage);

    std::unique_ptr<AstNode> parseNode(const std::string& errorMessage);
};

} // namespace binexp
