#pragma once

#include <cstddef>
#include <filesystem>

#include "config.hpp"
#include "expression_generator.hpp"

// Записывает count сгенерированных выражений в файл, по одному на строку.
// Глубина выражений циклически меняется от 3 до 7.
void writeGeneratedExpressions(const std::filesystem::path& outputPath,
                               std::size_t count,
                               binexp::ExpressionGenerator& generator);

// Режим генерации выражений. Недостающие параметры спрашиваются у пользователя;
// без -o файл создается в папке tests проекта.
void runGenerateMode(const RunConfig& config);
