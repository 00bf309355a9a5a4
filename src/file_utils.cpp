#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

// Сравнение расширений без учета регистра
bool hasExtension(const std::filesystem::path& path, const std::string& ext) {
    std::string pathExt = path.extension().string();
    if (pathExt.empty()) {
        return false;
    }
    return toLower(pathExt) == toLower(ext);
}
}

std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для подсчета строк: " + path.string());
    }

    constexpr std::size_t bufferSize = 1024 * 1024;
    std::vector<char> readBuffer(bufferSize);

    std::size_t lineCount = 0;
    char lastChar = '\n';

    while (input.read(readBuffer.data(), bufferSize) || input.gcount() > 0) {
        std::size_t bytesRead = static_cast<std::size_t>(input.gcount());
        lineCount += static_cast<std::size_t>(
            std::count(readBuffer.begin(), readBuffer.begin() + bytesRead, '\n'));
        lastChar = readBuffer[bytesRead - 1];
    }

    // Последняя строка без \n тоже считается
    if (lastChar != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::filesystem::path findProjectRoot() {
    try {
        std::filesystem::path current = std::filesystem::current_path();

        // Поднимаемся вверх, пока не найдем папку tests или CMakeLists.txt
        while (!current.empty()) {
            std::error_code ec;
            if (std::filesystem::is_directory(current / "tests", ec) ||
                std::filesystem::is_regular_file(current / "CMakeLists.txt", ec)) {
                return current;
            }

            std::filesystem::path parent = current.parent_path();
            if (parent == current) {
                break; // Корень файловой системы
            }
            current = parent;
        }
    }
    catch (const std::filesystem::filesystem_error&) {
        // Нет доступа к текущей директории — возвращаем ее как есть ниже
    }

    return std::filesystem::current_path();
}

std::vector<std::filesystem::path> findFilesWithExtension(const std::filesystem::path& directory,
                                                          const std::string& extension) {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return files;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file(ec) && hasExtension(entry.path(), extension)) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::filesystem::path defaultOutputPath(const std::filesystem::path& inputPath) {
    std::string inputStem = inputPath.stem().string();
    return inputPath.parent_path() / (inputStem + "_results_" + getCurrentTimeString() + ".csv");
}

std::filesystem::path withExtension(std::filesystem::path path, const std::string& extension) {
    if (!hasExtension(path, extension)) {
        path.replace_extension(extension);
    }
    return path;
}
