#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "simplifier.hpp"

namespace binexp {

// Класс-фасад над деревом выражения.
// Объединяет построение из токенов, вывод в трёх нотациях и упрощение.
// Владеет корнем; копирование делает глубокую копию дерева.
class ExpressionTree {
public:
    explicit ExpressionTree(std::unique_ptr<AstNode> root);

    ExpressionTree(const ExpressionTree& other);
    ExpressionTree& operator=(const ExpressionTree& other);
    ExpressionTree(ExpressionTree&&) noexcept = default;
    ExpressionTree& operator=(ExpressionTree&&) noexcept = default;

    // Построение из готовых токенов в префиксной записи.
    // Пример: {"+", "1", "2"} -> (1 + 2)
    static ExpressionTree fromTokens(const std::vector<std::string>& tokens);

    // Построение из строки с токенами через пробел: "+ 1 * 2 3"
    static ExpressionTree fromString(const std::string& expression);

    std::string prefix() const;
    std::string infix() const;
    std::string postfix() const;

    // Отладочный вывод с отступами
    std::string dump() const;

    // Упрощённая копия дерева
    ExpressionTree simplified(SimplifyOptions options = {}) const;

    // Упрощение на месте
    void simplify(SimplifyOptions options = {});

    const AstNode& root() const { return *rootNode; }
    std::size_t size() const { return countNodes(*rootNode); }

private:
    std::unique_ptr<AstNode> rootNode;
};

bool operator==(const ExpressionTree& lhs, const ExpressionTree& rhs);

} // namespace binexp
