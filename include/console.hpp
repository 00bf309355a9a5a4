#pragma once

#include <iostream>
#include <string>

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Сообщение об ошибке в std::cerr: красным, с маркером ✗
void printError(const std::string& message);

// Предупреждение в std::cout
void printWarning(const std::string& message);

// Сообщение об успешном завершении шага в std::cout
void printSuccess(const std::string& message);
