#pragma once

#include <memory>

#include "ast.hpp"

namespace binexp {

// Набор правил упрощения
struct SimplifyOptions {
    // true — правила 1-4 (со свёрткой констант), false — только тождества 1-3
    bool constantFolding = true;
};

// Упрощение дерева выражения снизу вверх.
// Сначала полностью упрощаются потомки, затем к самому узлу применяется
// первое подходящее правило:
//   1. x + 0 = x, 0 + x = x
//   2. x * 1 = x, 1 * x = x
//   3. x * 0 = 0, 0 * x = 0
//   4. свёртка констант (если включена)
// Одного прохода достаточно, повторять до неподвижной точки не нужно.
class Simplifier {
public:
    explicit Simplifier(SimplifyOptions options = {}) : options(options) {}

    // Забирает дерево и возвращает упрощённое. Узлы переиспользуются,
    // новые листья создаются только для правил 3 и 4.
    // FoldingError при делении на ноль во время свёртки.
    std::unique_ptr<AstNode> simplify(std::unique_ptr<AstNode> node) const;

    // Упрощённая копия, исходное дерево не меняется
    std::unique_ptr<AstNode> simplified(const AstNode& node) const;

private:
    SimplifyOptions options;

    std::unique_ptr<AstNode> applyRules(std::unique_ptr<AstNode> node) const;
};

// Локальные правила. Смотрят только на непосредственных потомков узла
// и НЕ спускаются рекурсивно вглубь — рекурсию обеспечивает Simplifier::simplify.
// Возвращают замену узла или nullptr, если правило неприменимо.
// При срабатывании правила 1 или 2 оставшийся потомок забирается из узла.
std::unique_ptr<AstNode> additiveIdentity(BinaryNode& node);
std::unique_ptr<AstNode> multiplicativeIdentity(BinaryNode& node);
std::unique_ptr<AstNode> multiplyByZero(const BinaryNode& node);
std::unique_ptr<AstNode> foldConstants(const BinaryNode& node);

} // namespace binexp
