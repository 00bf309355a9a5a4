#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "csv_writer.hpp"
#include "simplifier.hpp"
#include "thread_pool.hpp"

namespace binexp {

// Исходная строка выражения с её номером
struct ExpressionLine {
    std::size_t number;
    std::string text;
};

// Итоги обработки файла
struct BatchSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
};

// Разбор, вывод в трёх нотациях и упрощение одной строки.
// Ошибки не выбрасываются, а записываются в поле message.
SimplificationRecord processLine(const ExpressionLine& line, SimplifyOptions options);

// Собирает результаты, приходящие из пула в произвольном порядке,
// и пишет их в CSV строго по возрастанию номеров строк.
// Потокобезопасен.
class OrderedRecordWriter {
public:
    explicit OrderedRecordWriter(CsvWriter& writer) : writer(writer) {}

    void accept(const std::vector<SimplificationRecord>& batch);

    // Дописывает всё, что осталось в буфере (при пропусках в нумерации)
    void finish();

    BatchSummary summary() const;

private:
    CsvWriter& writer;
    std::map<std::size_t, SimplificationRecord> pending; // Ключ — номер строки
    std::size_t nextLineToWrite = 1;
    BatchSummary counters;
    mutable std::mutex mutex;
};

// Потоковое чтение и обработка файла по частям (chunks) для экономии памяти.
// Строки порциями отправляются в пул, futures собираются батчами,
// каждый готовый батч передаётся в processBatch.
template <typename ProcessCallback>
void processExpressionsStreaming(const std::filesystem::path& path,
                                 ThreadPool& pool,
                                 SimplifyOptions options,
                                 std::atomic<std::size_t>& completed,
                                 ProcessCallback&& processBatch,
                                 std::size_t chunkSize = 10000,
                                 std::size_t batchSize = 1000) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }

    std::vector<ExpressionLine> chunk;
    chunk.reserve(chunkSize);
    std::vector<std::future<SimplificationRecord>> futures;
    futures.reserve(batchSize);

    auto processFuturesBatch = [&]() {
        if (futures.empty()) {
            return;
        }
        std::vector<SimplificationRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
        }
        processBatch(batch);
        futures.clear();
    };

    auto submitChunk = [&]() {
        for (auto& expressionLine : chunk) {
            futures.emplace_back(pool.enqueue(
                [line = std::move(expressionLine), options, &completed]() {
                    SimplificationRecord record = processLine(line, options);
                    completed.fetch_add(1);
                    return record;
                }));
            if (futures.size() >= batchSize) {
                processFuturesBatch();
            }
        }
        chunk.clear();
    };

    std::string buffer;
    std::size_t lineNumber = 1;
    while (std::getline(input, buffer)) {
        chunk.push_back({lineNumber++, std::move(buffer)});
        if (chunk.size() >= chunkSize) {
            submitChunk();
        }
    }

    // Остаток, меньший chunkSize
    submitChunk();
    processFuturesBatch();
}

// Обрабатывает весь файл в pool и пишет отчёт в outputPath.
// completed увеличивается по мере готовности строк (для прогресс-бара).
BatchSummary processFile(const std::filesystem::path& inputPath,
                         const std::filesystem::path& outputPath,
                         ThreadPool& pool,
                         SimplifyOptions options,
                         std::atomic<std::size_t>& completed);

} // namespace binexp
