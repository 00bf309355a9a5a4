#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "simplifier.hpp"

// Режим работы программы
enum class RunMode {
    Interactive, // Без аргументов: всё спрашивается у пользователя
    Run,         // binexp run <input.txt> [-o <out.csv>] [-j <threads>] [--no-fold]
    Generate,    // binexp generate [<count>] [-o <file.txt>]
    Help         // binexp --help
};

// Конфигурация запуска, собранная из аргументов командной строки
struct RunConfig {
    RunMode mode = RunMode::Interactive;
    std::filesystem::path inputPath;                 // Только для Run
    std::optional<std::filesystem::path> outputPath; // Если не задан — имя по умолчанию
    std::size_t threadCount = 0;                     // 0 — по числу ядер
    binexp::SimplifyOptions simplify;
    std::optional<std::size_t> expressionCount;      // Только для Generate
};

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Число потоков по умолчанию: hardware_concurrency или 2, если оно неизвестно
std::size_t defaultThreadCount();

// Разбор аргументов (без имени программы).
// Выбрасывает std::runtime_error с понятным текстом при ошибке.
RunConfig parseArguments(const std::vector<std::string>& args);

// Текст справки
std::string usage();
