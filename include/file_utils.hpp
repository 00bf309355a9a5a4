#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Быстрый подсчет количества строк в файле
// Читает файл блоками и считает символы новой строки
std::size_t countLinesInFile(const std::filesystem::path& path);

// Поиск корневой директории проекта (ищет папку tests или файл CMakeLists.txt)
std::filesystem::path findProjectRoot();

// Поиск всех файлов с расширением extension в директории (без учета регистра, без рекурсии)
std::vector<std::filesystem::path> findFilesWithExtension(const std::filesystem::path& directory,
                                                          const std::string& extension);

// Получение текущего времени в формате для имени файла
std::string getCurrentTimeString();

// Имя отчета по умолчанию: <имя входного файла>_results_<время>.csv рядом с входным
std::filesystem::path defaultOutputPath(const std::filesystem::path& inputPath);

// Добавляет расширение, если у пути его нет или оно другое
std::filesystem::path withExtension(std::filesystem::path path, const std::string& extension);
