#pragma once

#include <filesystem>
#include <cstddef>
#include <string>

// Интерактивный выбор входного файла (номер из папки tests или путь)
std::filesystem::path selectInputFile();

// Интерактивный выбор выходного CSV файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Интерактивный ввод количества потоков
std::size_t selectThreadCount();

// Интерактивный выбор набора правил: true — со сверткой констант
bool askConstantFolding();

// Запрос продолжения работы с другим файлом
bool askContinue();

// Интерактивный ввод количества выражений для генерации
std::size_t askExpressionCount();

// Интерактивный выбор имени файла для генерации
std::filesystem::path selectGeneratedFileName(std::size_t expressionCount);
