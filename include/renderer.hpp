#pragma once

#include <string>

#include "ast.hpp"

namespace binexp {

// Нотация строкового представления дерева
enum class Notation {
    Prefix,  // + 1 2
    Infix,   // (1 + 2)
    Postfix  // 1 2 +
};

// Строковое представление дерева в выбранной нотации.
// Токены разделяются одним пробелом, в инфиксной записи каждая
// бинарная операция заключается в скобки независимо от приоритета.
std::string render(const AstNode& node, Notation notation);

inline std::string toPrefix(const AstNode& node) { return render(node, Notation::Prefix); }
inline std::string toInfix(const AstNode& node) { return render(node, Notation::Infix); }
inline std::string toPostfix(const AstNode& node) { return render(node, Notation::Postfix); }

// Многострочный отладочный вывод: по узлу на строку,
// потомок сдвинут на два пробела относительно родителя
std::string renderTree(const AstNode& node);

} // namespace binexp
