#include "tokenizer.hpp"

#include <cctype>

#include "ast.hpp"

namespace binexp {

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }
        tokens.push_back(makeToken(tokens.size()));
    }
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

// Пропуск пробелов, табуляций и переводов строк (включая \r из CRLF-файлов)
void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        ++index;
    }
}

Token Tokenizer::makeToken(std::size_t position) {
    std::size_t start = index;
    while (!isAtEnd() && !std::isspace(static_cast<unsigned char>(peek()))) {
        ++index;
    }

    std::string text = source.substr(start, index - start);
    TokenType type = isNumericLiteral(text) ? TokenType::Number : TokenType::Operator;
    return {type, std::move(text), position};
}

std::vector<std::string> splitTokens(const std::string& text) {
    std::vector<std::string> result;
    for (auto& token : Tokenizer(text).tokenize()) {
        result.push_back(std::move(token.text));
    }
    return result;
}

} // namespace binexp
