#include "generate_mode.hpp"
#include "console.hpp"
#include "file_utils.hpp"
#include "user_input.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

void writeGeneratedExpressions(const std::filesystem::path& outputPath,
                               std::size_t count,
                               binexp::ExpressionGenerator& generator) {
    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    for (std::size_t i = 0; i < count; ++i) {
        int depth = 3 + static_cast<int>(i % 5);
        output << generator.generate(depth) << "\n";

        // Показываем прогресс для больших файлов
        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << count
                << " выражений сгенерировано..." << Color::RESET << std::flush;
        }
    }

    output.flush();
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }
}

void runGenerateMode(const RunConfig& config) {
    printHeader();

    std::cout << Color::BOLD << Color::CYAN << "Режим генерации выражений\n" << Color::RESET << "\n";

    std::size_t expressionCount = config.expressionCount ? *config.expressionCount : askExpressionCount();

    std::filesystem::path outputPath;
    if (config.outputPath) {
        outputPath = withExtension(*config.outputPath, ".txt");
    } else {
        std::filesystem::path testsDir = findProjectRoot() / "tests";
        std::filesystem::create_directories(testsDir);
        outputPath = testsDir / selectGeneratedFileName(expressionCount);
    }

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество выражений: " << Color::CYAN << expressionCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:        " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    std::cout << Color::BOLD << "Генерация выражений..." << Color::RESET << std::flush;
    auto startGen = std::chrono::high_resolution_clock::now();

    binexp::ExpressionGenerator generator;
    writeGeneratedExpressions(outputPath, expressionCount, generator);

    auto endGen = std::chrono::high_resolution_clock::now();
    auto genDuration = std::chrono::duration_cast<std::chrono::milliseconds>(endGen - startGen);

    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " ("
        << expressionCount << " выражений, "
        << genDuration.count() << " мс)\n\n";

    printSuccess("Файл успешно создан: " + outputPath.string());
}
