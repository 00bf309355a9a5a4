#include "ast.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string_view>

#include "errors.hpp"

namespace binexp {

namespace {
// Литерал без ведущих нулей; для "000" остаётся "0"
std::string_view stripLeadingZeros(const std::string& literal) {
    std::string_view view(literal);
    std::size_t first = view.find_first_not_of('0');
    if (first == std::string_view::npos) {
        return view.substr(view.size() - 1);
    }
    return view.substr(first);
}
}

char operatorSymbol(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Add:
        return '+';
    case BinaryOperator::Subtract:
        return '-';
    case BinaryOperator::Multiply:
        return '*';
    case BinaryOperator::Divide:
        return '/';
    }
    throw std::logic_error("Неизвестная бинарная операция");
}

std::optional<BinaryOperator> parseOperator(const std::string& text) {
    if (text == "+") {
        return BinaryOperator::Add;
    }
    if (text == "-") {
        return BinaryOperator::Subtract;
    }
    if (text == "*") {
        return BinaryOperator::Multiply;
    }
    if (text == "/") {
        return BinaryOperator::Divide;
    }
    return std::nullopt;
}

bool isNumericLiteral(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return ch >= '0' && ch <= '9';
    });
}

// --- NumberNode ---

NumberNode::NumberNode(std::string literal) : literal(std::move(literal)) {
    if (!isNumericLiteral(this->literal)) {
        throw MalformedInputError("Лист должен содержать числовой литерал, получено '" +
                                      this->literal + "'",
                                  MalformedInputError::NO_POSITION);
    }
}

NumberNode::NumberNode(std::uint64_t value) : literal(std::to_string(value)) {}

std::unique_ptr<AstNode> NumberNode::clone() const {
    return std::make_unique<NumberNode>(literal);
}

bool NumberNode::equals(const AstNode& other) const {
    return other.kind() == NodeKind::Leaf && other.text() == literal;
}

bool NumberNode::isZero() const {
    return stripLeadingZeros(literal) == "0";
}

bool NumberNode::isOne() const {
    return stripLeadingZeros(literal) == "1";
}

std::optional<std::uint64_t> NumberNode::value() const {
    std::uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), result);
    if (ec != std::errc() || ptr != literal.data() + literal.size()) {
        return std::nullopt; // Переполнение 64 бит
    }
    return result;
}

// --- BinaryNode ---

BinaryNode::BinaryNode(BinaryOperator op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right)
    : op(op), leftChild(std::move(left)), rightChild(std::move(right)) {
    if (!leftChild || !rightChild) {
        throw MalformedInputError(std::string("Операция '") + operatorSymbol(op) +
                                      "' требует двух операндов",
                                  MalformedInputError::NO_POSITION);
    }
}

std::unique_ptr<AstNode> BinaryNode::clone() const {
    return std::make_unique<BinaryNode>(op, leftChild->clone(), rightChild->clone());
}

bool BinaryNode::equals(const AstNode& other) const {
    if (other.kind() != NodeKind::BinaryOp) {
        return false;
    }
    const auto& binary = static_cast<const BinaryNode&>(other);
    return op == binary.op && leftChild->equals(*binary.leftChild) &&
           rightChild->equals(*binary.rightChild);
}

std::unique_ptr<AstNode> BinaryNode::takeLeft() {
    return std::move(leftChild);
}

std::unique_ptr<AstNode> BinaryNode::takeRight() {
    return std::move(rightChild);
}

void BinaryNode::setLeft(std::unique_ptr<AstNode> child) {
    if (!child) {
        throw std::invalid_argument("Левый операнд не может быть пустым");
    }
    leftChild = std::move(child);
}

void BinaryNode::setRight(std::unique_ptr<AstNode> child) {
    if (!child) {
        throw std::invalid_argument("Правый операнд не может быть пустым");
    }
    rightChild = std::move(child);
}

// --- Свободные функции ---

bool operator==(const AstNode& lhs, const AstNode& rhs) {
    return lhs.equals(rhs);
}

std::size_t countNodes(const AstNode& node) {
    if (node.kind() == NodeKind::Leaf) {
        return 1;
    }
    const auto& binary = static_cast<const BinaryNode&>(node);
    return 1 + countNodes(binary.left()) + countNodes(binary.right());
}

const NumberNode* asNumber(const AstNode& node) {
    if (node.kind() != NodeKind::Leaf) {
        return nullptr;
    }
    return static_cast<const NumberNode*>(&node);
}

} // namespace binexp
