#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace binexp {

// Вид узла дерева выражения
enum class NodeKind {
    Leaf,     // Числовой литерал
    BinaryOp  // Бинарная операция с двумя потомками
};

// Поддерживаемые бинарные операции.
// Правила упрощения определены только для + и *, остальные проходят без изменений.
enum class BinaryOperator {
    Add,
    Subtract,
    Multiply,
    Divide
};

// Символ операции ('+', '-', '*', '/')
char operatorSymbol(BinaryOperator op);

// Разбор символа операции; std::nullopt для неподдерживаемого токена
std::optional<BinaryOperator> parseOperator(const std::string& text);

// Проверяет, что строка является непустой последовательностью десятичных цифр
bool isNumericLiteral(const std::string& text);

// Базовый класс для узла дерева выражения.
// Каждый узел монопольно владеет своими потомками, общих поддеревьев нет.
class AstNode {
public:
    virtual ~AstNode() = default;

    virtual NodeKind kind() const = 0;

    // Текстовое значение узла: литерал для листа, символ операции для бинарного узла
    virtual std::string text() const = 0;

    // Глубокая копия поддерева
    virtual std::unique_ptr<AstNode> clone() const = 0;

    // Структурное сравнение поддеревьев
    virtual bool equals(const AstNode& other) const = 0;
};

// Лист дерева: числовая константа, хранимая в десятичной записи
class NumberNode final : public AstNode {
public:
    // Выбрасывает MalformedInputError, если литерал не числовой
    explicit NumberNode(std::string literal);
    explicit NumberNode(std::uint64_t value);

    NodeKind kind() const override { return NodeKind::Leaf; }
    std::string text() const override { return literal; }
    std::unique_ptr<AstNode> clone() const override;
    bool equals(const AstNode& other) const override;

    // Сравнение по числовому значению, поэтому "00" тоже ноль
    bool isZero() const;
    bool isOne() const;

    // Значение литерала; std::nullopt, если оно не помещается в 64 бита
    std::optional<std::uint64_t> value() const;

private:
    std::string literal;
};

// Узел бинарной операции (+, -, *, /)
class BinaryNode final : public AstNode {
public:
    // Оба потомка обязательны, иначе MalformedInputError
    BinaryNode(BinaryOperator op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right);

    NodeKind kind() const override { return NodeKind::BinaryOp; }
    std::string text() const override { return std::string(1, operatorSymbol(op)); }
    std::unique_ptr<AstNode> clone() const override;
    bool equals(const AstNode& other) const override;

    BinaryOperator operation() const { return op; }
    const AstNode& left() const { return *leftChild; }
    const AstNode& right() const { return *rightChild; }

    // Забирает потомка из узла. До вызова setLeft/setRight узел неполон,
    // поэтому пара take/set используется только при перестройке дерева.
    std::unique_ptr<AstNode> takeLeft();
    std::unique_ptr<AstNode> takeRight();
    void setLeft(std::unique_ptr<AstNode> child);
    void setRight(std::unique_ptr<AstNode> child);

private:
    BinaryOperator op;
    std::unique_ptr<AstNode> leftChild;
    std::unique_ptr<AstNode> rightChild;
};

bool operator==(const AstNode& lhs, const AstNode& rhs);

// Печать дерева в префиксной записи (реализация в renderer.cpp)
std::ostream& operator<<(std::ostream& os, const AstNode& node);

// Число узлов в поддереве
std::size_t countNodes(const AstNode& node);

// Лист, если узел является NumberNode, иначе nullptr
const NumberNode* asNumber(const AstNode& node);

} // namespace binexp
