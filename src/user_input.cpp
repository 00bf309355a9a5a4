#include "user_input.hpp"
#include "config.hpp"
#include "console.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {
// Чтение строки из std::cin с удалением пробелов по краям
std::string readTrimmedLine() {
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод закрыт");
    }
    input.erase(0, input.find_first_not_of(" \t\r"));
    input.erase(input.find_last_not_of(" \t\r") + 1);
    return input;
}

// Меню из двух пунктов; возвращает true для варианта 1
bool askChoice(const std::string& title, const std::string& first, const std::string& second) {
    std::cout << Color::BOLD << title << "\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". " << first << "\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". " << second << "\n\n";
    std::cout << Color::BOLD << "Ваш выбор (1 или 2): " << Color::RESET;

    std::string choice = readTrimmedLine();
    if (choice == "1") {
        return true;
    }
    if (choice == "2") {
        return false;
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}

bool isAllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}
}

std::filesystem::path selectInputFile() {
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    auto txtFiles = findFilesWithExtension(testsDir, ".txt");

    if (txtFiles.empty()) {
        printWarning("не найдено .txt файлов в папке tests.");
        std::cout << "Директория: " << Color::CYAN << testsDir << Color::RESET << "\n\n";
    }
    else {
        std::cout << Color::BOLD << "Найденные .txt файлы в папке tests:\n" << Color::RESET;
        for (std::size_t i = 0; i < txtFiles.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << txtFiles[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::cout << Color::BOLD << "Введите номер файла или путь до входного файла: " << Color::RESET;
    std::string input = readTrimmedLine();
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    if (isAllDigits(input) && !txtFiles.empty()) {
        std::size_t index = parseNumber(input);
        if (index > txtFiles.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return txtFiles[index - 1];
    }

    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    bool useDefault = askChoice("Выберите способ задания выходного файла:",
                                "Название по умолчанию (имя входного файла + _results_ + время)",
                                "Кастомное название");
    if (useDefault) {
        return defaultOutputPath(inputPath);
    }

    std::cout << Color::BOLD
        << "Введите название выходного файла (можно с путем, расширение .csv добавится автоматически): "
        << Color::RESET;
    std::string customName = readTrimmedLine();
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }

    // Относительный путь считается от директории входного файла
    std::filesystem::path customPath(customName);
    if (!customPath.is_absolute()) {
        customPath = inputPath.parent_path() / customPath;
    }
    return withExtension(customPath, ".csv");
}

std::size_t selectThreadCount() {
    std::size_t defaultThreads = defaultThreadCount();

    std::cout << Color::BOLD << "Введите количество потоков" << Color::RESET
        << " (по умолчанию: " << Color::CYAN << defaultThreads << Color::RESET << "): ";

    std::string input = readTrimmedLine();
    if (input.empty()) {
        return defaultThreads;
    }
    return parseNumber(input);
}

bool askConstantFolding() {
    return askChoice("Выберите набор правил упрощения:",
                     "Тождества и свертка констант (1 + 1 -> 2)",
                     "Только тождества (x + 0, x * 1, x * 0)");
}

bool askContinue() {
    std::cout << Color::BOLD << "Обработать еще один файл? (y/n): " << Color::RESET;
    std::string input;
    try {
        input = readTrimmedLine();
    }
    catch (const std::runtime_error&) {
        return false; // Конец ввода означает отказ
    }
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return (input == "y" || input == "yes" || input == "д" || input == "да");
}

std::size_t askExpressionCount() {
    std::cout << Color::BOLD << "Введите количество выражений для генерации: " << Color::RESET;
    std::string input = readTrimmedLine();
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return parseNumber(input);
}

std::filesystem::path selectGeneratedFileName(std::size_t expressionCount) {
    std::string automaticName = "generate_" + std::to_string(expressionCount) + ".txt";
    bool useDefault = askChoice("Выберите способ задания имени файла:",
                                "Автоматическое название (" + automaticName + ")",
                                "Кастомное название");
    if (useDefault) {
        return std::filesystem::path(automaticName);
    }

    std::cout << Color::BOLD << "Введите название файла (расширение .txt добавится автоматически): "
        << Color::RESET;
    std::string customName = readTrimmedLine();
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }
    return withExtension(customName, ".txt");
}
