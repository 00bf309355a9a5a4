#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace binexp {

// Представления успешно разобранного выражения
struct RenderedExpression {
    std::string prefix;     // Исходное дерево в префиксной записи
    std::string infix;      // Исходное дерево в инфиксной записи
    std::string postfix;    // Исходное дерево в постфиксной записи
    std::string simplified; // Упрощённое дерево в префиксной записи
};

// Результат обработки одной строки входного файла
struct SimplificationRecord {
    std::size_t lineNumber = 0;               // Номер строки в исходном файле
    std::string expression;                   // Исходный текст выражения
    std::optional<RenderedExpression> result; // Есть только при успехе
    std::string status;                       // success или error
    std::string message;                      // Сообщение об ошибке
};

// Запись результатов в формате CSV.
// Формат: line,expression,status,prefix,infix,postfix,simplified,message
// Текстовые поля заключаются в двойные кавычки, кавычки внутри заменяются на одинарные.
class CsvWriter {
public:
    // Открывает файл с перезаписью и сразу пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    void writeRecord(const SimplificationRecord& record);
    void write(const std::vector<SimplificationRecord>& records);

    // Сбрасывает буфер на диск
    void flush();

private:
    std::filesystem::path path;
    std::ofstream stream;
};

} // namespace binexp
