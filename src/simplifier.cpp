#include "simplifier.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>

#include "errors.hpp"

namespace binexp {

namespace {
bool isZeroLeaf(const AstNode& node) {
    const NumberNode* number = asNumber(node);
    return number != nullptr && number->isZero();
}

bool isOneLeaf(const AstNode& node) {
    const NumberNode* number = asNumber(node);
    return number != nullptr && number->isOne();
}

// Вычисление в беззнаковых 64-битных целых.
// std::nullopt, если результат не является допустимым литералом:
// отрицательный, дробный или вышедший за 64 бита.
std::optional<std::uint64_t> compute(BinaryOperator op, std::uint64_t lhs, std::uint64_t rhs) {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    switch (op) {
    case BinaryOperator::Add:
        if (lhs > kMax - rhs) {
            return std::nullopt;
        }
        return lhs + rhs;
    case BinaryOperator::Subtract:
        if (lhs < rhs) {
            return std::nullopt;
        }
        return lhs - rhs;
    case BinaryOperator::Multiply:
        if (lhs != 0 && rhs > kMax / lhs) {
            return std::nullopt;
        }
        return lhs * rhs;
    case BinaryOperator::Divide:
        if (rhs == 0) {
            throw FoldingError("Деление на ноль при свёртке констант: " + std::to_string(lhs) +
                               " / 0");
        }
        if (lhs % rhs != 0) {
            return std::nullopt;
        }
        return lhs / rhs;
    }
    return std::nullopt;
}
}

std::unique_ptr<AstNode> additiveIdentity(BinaryNode& node) {
    if (node.operation() != BinaryOperator::Add) {
        return nullptr;
    }
    if (isZeroLeaf(node.left())) {
        return node.takeRight();
    }
    if (isZeroLeaf(node.right())) {
        return node.takeLeft();
    }
    return nullptr;
}

std::unique_ptr<AstNode> multiplicativeIdentity(BinaryNode& node) {
    if (node.operation() != BinaryOperator::Multiply) {
        return nullptr;
    }
    if (isOneLeaf(node.left())) {
        return node.takeRight();
    }
    if (isOneLeaf(node.right())) {
        return node.takeLeft();
    }
    return nullptr;
}

std::unique_ptr<AstNode> multiplyByZero(const BinaryNode& node) {
    if (node.operation() != BinaryOperator::Multiply) {
        return nullptr;
    }
    if (isZeroLeaf(node.left()) || isZeroLeaf(node.right())) {
        return std::make_unique<NumberNode>("0");
    }
    return nullptr;
}

std::unique_ptr<AstNode> foldConstants(const BinaryNode& node) {
    const NumberNode* left = asNumber(node.left());
    const NumberNode* right = asNumber(node.right());
    if (left == nullptr || right == nullptr) {
        return nullptr;
    }

    // Слишком большие литералы остаются как есть
    auto lhs = left->value();
    auto rhs = right->value();
    if (!lhs || !rhs) {
        return nullptr;
    }

    auto result = compute(node.operation(), *lhs, *rhs);
    if (!result) {
        return nullptr;
    }
    return std::make_unique<NumberNode>(*result);
}

std::unique_ptr<AstNode> Simplifier::simplify(std::unique_ptr<AstNode> node) const {
    if (!node) {
        throw std::invalid_argument("Нельзя упростить пустое дерево");
    }

    // Лист упрощается сам в себя
    if (node->kind() == NodeKind::Leaf) {
        return node;
    }

    // Потомки упрощаются до того, как правила применяются к самому узлу
    auto& binary = static_cast<BinaryNode&>(*node);
    binary.setLeft(simplify(binary.takeLeft()));
    binary.setRight(simplify(binary.takeRight()));

    return applyRules(std::move(node));
}

std::unique_ptr<AstNode> Simplifier::simplified(const AstNode& node) const {
    return simplify(node.clone());
}

// Первое сработавшее правило определяет результат
std::unique_ptr<AstNode> Simplifier::applyRules(std::unique_ptr<AstNode> node) const {
    auto& binary = static_cast<BinaryNode&>(*node);

    if (auto replacement = additiveIdentity(binary)) {
        return replacement;
    }
    if (auto replacement = multiplicativeIdentity(binary)) {
        return replacement;
    }
    if (auto replacement = multiplyByZero(binary)) {
        return replacement;
    }
    if (options.constantFolding) {
        if (auto replacement = foldConstants(binary)) {
            return replacement;
        }
    }
    return node;
}

} // namespace binexp
