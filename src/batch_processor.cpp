#include "batch_processor.hpp"

#include "errors.hpp"
#include "expression_tree.hpp"

namespace binexp {

SimplificationRecord processLine(const ExpressionLine& line, SimplifyOptions options) {
    SimplificationRecord record;
    record.lineNumber = line.number;
    record.expression = line.text;
    try {
        if (line.text.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw MalformedInputError("Пустая строка", 0);
        }
        auto tree = ExpressionTree::fromString(line.text);
        RenderedExpression rendered;
        rendered.prefix = tree.prefix();
        rendered.infix = tree.infix();
        rendered.postfix = tree.postfix();
        rendered.simplified = tree.simplified(options).prefix();
        record.result = std::move(rendered);
        record.status = "success";
    } catch (const std::exception& ex) {
        record.result.reset();
        record.status = "error";
        record.message = ex.what();
    }
    return record;
}

void OrderedRecordWriter::accept(const std::vector<SimplificationRecord>& batch) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& record : batch) {
        ++counters.total;
        if (record.status == "success") {
            ++counters.succeeded;
        } else {
            ++counters.failed;
        }
        pending[record.lineNumber] = record;
    }

    // Пишем все последовательные результаты, которые уже готовы
    auto it = pending.find(nextLineToWrite);
    while (it != pending.end()) {
        writer.writeRecord(it->second);
        pending.erase(it);
        ++nextLineToWrite;
        it = pending.find(nextLineToWrite);
    }
}

void OrderedRecordWriter::finish() {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& [lineNumber, record] : pending) {
        writer.writeRecord(record);
    }
    pending.clear();
    writer.flush();
}

BatchSummary OrderedRecordWriter::summary() const {
    std::lock_guard<std::mutex> lock(mutex);
    return counters;
}

BatchSummary processFile(const std::filesystem::path& inputPath,
                         const std::filesystem::path& outputPath,
                         ThreadPool& pool,
                         SimplifyOptions options,
                         std::atomic<std::size_t>& completed) {
    // Проверяем вход до того, как перезаписать выходной файл
    if (!std::filesystem::is_regular_file(inputPath)) {
        throw std::runtime_error("Входной файл не найден: " + inputPath.string());
    }

    CsvWriter writer(outputPath);
    OrderedRecordWriter ordered(writer);

    processExpressionsStreaming(inputPath, pool, options, completed,
                                [&ordered](const std::vector<SimplificationRecord>& batch) {
                                    ordered.accept(batch);
                                });

    ordered.finish();
    return ordered.summary();
}

} // namespace binexp
