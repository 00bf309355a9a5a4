#pragma once

#include <cstddef>
#include <string>

namespace binexp {

// Тип токена префиксного выражения
enum class TokenType {
    Number,   // Последовательность десятичных цифр
    Operator  // Любой другой токен; допустимость проверяет парсер
};

struct Token {
    TokenType type;
    std::string text;      // Исходный текст токена
    std::size_t position;  // Порядковый номер токена в выражении
};

} // namespace binexp
