#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace binexp {

// Базовый класс для всех ошибок разбора и упрощения выражений.
// Ни одна из ошибок не является фатальной: вызывающий код может
// зафиксировать её и перейти к следующему выражению.
class ExpressionError : public std::runtime_error {
public:
    explicit ExpressionError(const std::string& message) : std::runtime_error(message) {}
};

// Последовательность токенов не раскладывается в корректное дерево:
// операнды закончились раньше времени или остались лишние токены.
class MalformedInputError final : public ExpressionError {
public:
    // Позиция ошибки, обнаруженной вне потока токенов (прямое создание узлов)
    static constexpr std::size_t NO_POSITION = static_cast<std::size_t>(-1);

    MalformedInputError(const std::string& message, std::size_t position)
        : ExpressionError(message), tokenPosition(position) {}

    // Индекс токена, на котором обнаружена ошибка, или NO_POSITION
    std::size_t position() const { return tokenPosition; }

private:
    std::size_t tokenPosition;
};

// Нечисловой токен, не являющийся поддерживаемым оператором
class InvalidOperatorError final : public ExpressionError {
public:
    InvalidOperatorError(std::string symbol, std::size_t position);

    const std::string& symbol() const { return operatorSymbol; }
    std::size_t position() const { return tokenPosition; }

private:
    std::string operatorSymbol;
    std::size_t tokenPosition;
};

// Свёртка констант встретила неопределённую операцию (деление на ноль)
class FoldingError final : public ExpressionError {
public:
    explicit FoldingError(const std::string& message) : ExpressionError(message) {}
};

} // namespace binexp
