#include "renderer.hpp"

namespace binexp {

namespace {
void renderInto(const AstNode& node, Notation notation, std::string& out) {
    if (node.kind() == NodeKind::Leaf) {
        out += node.text();
        return;
    }

    const auto& binary = static_cast<const BinaryNode&>(node);
    const char symbol = operatorSymbol(binary.operation());
    switch (notation) {
    case Notation::Prefix:
        out += symbol;
        out += ' ';
        renderInto(binary.left(), notation, out);
        out += ' ';
        renderInto(binary.right(), notation, out);
        break;
    case Notation::Infix:
        out += '(';
        renderInto(binary.left(), notation, out);
        out += ' ';
        out += symbol;
        out += ' ';
        renderInto(binary.right(), notation, out);
        out += ')';
        break;
    case Notation::Postfix:
        renderInto(binary.left(), notation, out);
        out += ' ';
        renderInto(binary.right(), notation, out);
        out += ' ';
        out += symbol;
        break;
    }
}

void renderTreeInto(const AstNode& node, std::size_t indent, std::string& out) {
    out.append(indent * 2, ' ');
    out += node.text();
    if (node.kind() == NodeKind::BinaryOp) {
        const auto& binary = static_cast<const BinaryNode&>(node);
        out += '\n';
        renderTreeInto(binary.left(), indent + 1, out);
        out += '\n';
        renderTreeInto(binary.right(), indent + 1, out);
    }
}
}

std::string render(const AstNode& node, Notation notation) {
    std::string out;
    renderInto(node, notation, out);
    return out;
}

std::string renderTree(const AstNode& node) {
    std::string out;
    renderTreeInto(node, 0, out);
    return out;
}

std::ostream& operator<<(std::ostream& os, const AstNode& node) {
    return os << toPrefix(node);
}

} // namespace binexp
