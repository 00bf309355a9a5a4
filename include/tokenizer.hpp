#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace binexp {

// Класс лексического анализатора (лексера)
// Делит строку префиксного выражения на токены по пробельным символам.
// Число — токен только из десятичных цифр, всё остальное считается операцией.
class Tokenizer {
public:
    explicit Tokenizer(std::string sourceText);

    // Возвращает токены в порядке следования; для пустой строки — пустой вектор
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    bool isAtEnd() const;
    char peek() const;
    void skipWhitespace();

    // Считывает токен до ближайшего пробельного символа;
    // position — порядковый номер токена
    Token makeToken(std::size_t position);
};

// Разбивает строку на тексты токенов без позиций
std::vector<std::string> splitTokens(const std::string& text);

} // namespace binexp
