#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "batch_processor.hpp"
#include "config.hpp"
#include "console.hpp"
#include "file_utils.hpp"
#include "generate_mode.hpp"
#include "progress_bar.hpp"
#include "thread_pool.hpp"
#include "user_input.hpp"

namespace {

    // Обработка одного файла: подсчет строк, параллельное упрощение, запись CSV и статистика
    void processInputFile(const std::filesystem::path& inputPath,
                          const std::filesystem::path& outputPath,
                          std::size_t threadCount,
                          binexp::SimplifyOptions options) {
        std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
        std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
        std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n";
        std::cout << "  Потоков:       " << Color::CYAN << threadCount << Color::RESET << "\n";
        std::cout << "  Правила:       " << Color::CYAN
            << (options.constantFolding ? "тождества + свертка констант" : "только тождества")
            << Color::RESET << "\n\n";

        // 0. Быстрый подсчет количества строк в файле
        std::cout << Color::BOLD << "Подсчет строк в файле..." << Color::RESET << std::flush;
        auto startCount = std::chrono::high_resolution_clock::now();
        std::size_t totalLines = countLinesInFile(inputPath);
        auto endCount = std::chrono::high_resolution_clock::now();
        auto countDuration = std::chrono::duration_cast<std::chrono::milliseconds>(endCount - startCount);
        std::cout << " " << Color::GREEN << "✓" << Color::RESET << " ("
            << totalLines << " строк, " << countDuration.count() << " мс)\n\n";

        // 1. Потоковое чтение и обработка файла по частям
        std::cout << Color::BOLD << "Обработка выражений:\n" << Color::RESET;
        auto startProcess = std::chrono::high_resolution_clock::now();

        binexp::ThreadPool pool(threadCount);
        std::atomic<std::size_t> completed{ 0 };
        std::atomic<bool> finished{ false };
        std::thread progressThread(displayProgress, std::cref(completed), totalLines, std::cref(finished));

        binexp::BatchSummary summary;
        try {
            summary = binexp::processFile(inputPath, outputPath, pool, options, completed);
        }
        catch (...) {
            finished = true;
            progressThread.join();
            throw;
        }
        finished = true;
        progressThread.join();

        auto endProcess = std::chrono::high_resolution_clock::now();
        auto processDuration = std::chrono::duration_cast<std::chrono::milliseconds>(endProcess - startProcess);

        // 2. Вывод итоговой статистики
        std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
        std::cout << "  Всего выражений:  " << Color::CYAN << summary.total << Color::RESET << "\n";
        std::cout << "  Успешно:          " << Color::GREEN << summary.succeeded << Color::RESET << "\n";
        if (summary.failed > 0) {
            std::cout << "  Ошибок:           " << Color::RED << summary.failed << Color::RESET << "\n";
        }
        std::cout << "  Время обработки:  " << Color::MAGENTA << processDuration.count()
            << " мс" << Color::RESET << "\n";

        // Расчет производительности (выражений в секунду)
        if (processDuration.count() > 0) {
            std::cout << "  Производительность: " << Color::YELLOW
                << static_cast<int>(summary.total * 1000.0 / processDuration.count())
                << " выр/сек" << Color::RESET << "\n";
        }
        std::cout << "\n";

        printSuccess("Результаты сохранены в: " + outputPath.string());
    }

    // Неинтерактивный режим: все параметры заданы аргументами
    void runBatchMode(const RunConfig& config) {
        printHeader();
        std::filesystem::path outputPath = config.outputPath
            ? withExtension(*config.outputPath, ".csv")
            : defaultOutputPath(config.inputPath);
        processInputFile(config.inputPath, outputPath, config.threadCount, config.simplify);
    }

    // Интерактивный режим: параметры спрашиваются, файлы обрабатываются в цикле
    void runInteractiveMode() {
        printHeader();

        bool continueProcessing = true;
        while (continueProcessing) {
            try {
                std::filesystem::path inputPath = selectInputFile();
                std::filesystem::path outputPath = selectOutputFile(inputPath);
                std::size_t threadCount = selectThreadCount();
                binexp::SimplifyOptions options;
                options.constantFolding = askConstantFolding();
                std::cout << "\n";

                processInputFile(inputPath, outputPath, threadCount, options);
            }
            catch (const std::exception& ex) {
                printError(ex.what());
            }

            continueProcessing = askContinue();
            if (continueProcessing) {
                std::cout << "\n";
            }
        }

        std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    try {
        RunConfig config = parseArguments(std::vector<std::string>(argv + 1, argv + argc));

        switch (config.mode) {
        case RunMode::Help:
            std::cout << usage();
            return 0;
        case RunMode::Generate:
            runGenerateMode(config);
            return 0;
        case RunMode::Run:
            runBatchMode(config);
            return 0;
        case RunMode::Interactive:
            runInteractiveMode();
            return 0;
        }
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
    return 0;
}
