#include "csv_writer.hpp"

#include <stdexcept>

namespace binexp {

namespace {
// Экранирование: замена двойных кавычек на одинарные и оборачивание в кавычки
std::string quoted(const std::string& text) {
    std::string sanitized = text;
    for (char& ch : sanitized) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + sanitized + '"';
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : path(std::move(targetPath)), stream(path, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,expression,status,prefix,infix,postfix,simplified,message\n";
}

void CsvWriter::writeRecord(const SimplificationRecord& record) {
    stream << record.lineNumber << ',' << quoted(record.expression) << ',' << record.status << ',';

    if (record.result.has_value()) {
        const auto& rendered = record.result.value();
        stream << quoted(rendered.prefix) << ',' << quoted(rendered.infix) << ','
               << quoted(rendered.postfix) << ',' << quoted(rendered.simplified) << ',';
    } else {
        stream << ",,,,";
    }

    stream << quoted(record.message) << '\n';
    if (!stream) {
        throw std::runtime_error("Ошибка записи в файл CSV: " + path.string());
    }
}

void CsvWriter::write(const std::vector<SimplificationRecord>& records) {
    for (const auto& record : records) {
        writeRecord(record);
    }
}

void CsvWriter::flush() {
    stream.flush();
}

} // namespace binexp
