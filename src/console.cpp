#include "console.hpp"

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Упрощение префиксных выражений binexp v1.0             ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::string& message) {
    std::cerr << "\n" << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n\n";
}

void printWarning(const std::string& message) {
    std::cout << Color::YELLOW << "Внимание: " << Color::RESET << message << "\n";
}

void printSuccess(const std::string& message) {
    std::cout << Color::GREEN << message << Color::RESET << "\n\n";
}
