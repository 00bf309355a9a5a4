#include "config.hpp"

#include <stdexcept>
#include <thread>

std::size_t parseNumber(const std::string& value) {
    std::size_t result = 0;
    std::size_t parsed = 0;
    try {
        result = std::stoul(value, &parsed);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение: '" + value + "'");
    }
    if (parsed != value.size() || value.front() == '-' || value.front() == '+') {
        throw std::runtime_error("Некорректное числовое значение: '" + value + "'");
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::size_t defaultThreadCount() {
    std::size_t threads = std::thread::hardware_concurrency();
    return threads == 0 ? 2 : threads;
}

namespace {
// Значение опции, идущее следующим аргументом
const std::string& optionValue(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::runtime_error("Опция " + args[i] + " требует значения");
    }
    return args[++i];
}
}

RunConfig parseArguments(const std::vector<std::string>& args) {
    RunConfig config;
    config.threadCount = defaultThreadCount();

    if (args.empty()) {
        return config;
    }

    const std::string& command = args[0];
    if (command == "--help" || command == "-h" || command == "help") {
        config.mode = RunMode::Help;
        return config;
    }
    if (command == "run") {
        config.mode = RunMode::Run;
    } else if (command == "generate") {
        config.mode = RunMode::Generate;
    } else {
        throw std::runtime_error("Неизвестная команда '" + command + "'. Используйте --help");
    }

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-o" || arg == "--output") {
            config.outputPath = std::filesystem::path(optionValue(args, i));
        } else if (config.mode == RunMode::Run && (arg == "-j" || arg == "--threads")) {
            config.threadCount = parseNumber(optionValue(args, i));
        } else if (config.mode == RunMode::Run && arg == "--no-fold") {
            config.simplify.constantFolding = false;
        } else if (!arg.empty() && arg.front() == '-') {
            throw std::runtime_error("Неизвестная опция '" + arg + "'");
        } else if (config.mode == RunMode::Run && config.inputPath.empty()) {
            config.inputPath = arg;
        } else if (config.mode == RunMode::Generate && !config.expressionCount) {
            config.expressionCount = parseNumber(arg);
        } else {
            throw std::runtime_error("Лишний аргумент '" + arg + "'");
        }
    }

    if (config.mode == RunMode::Run && config.inputPath.empty()) {
        throw std::runtime_error("Не указан входной файл");
    }
    return config;
}

std::string usage() {
    return "Использование:\n"
           "  binexp                                     интерактивный режим\n"
           "  binexp run <input.txt> [-o <out.csv>] [-j <потоки>] [--no-fold]\n"
           "  binexp generate [<количество>] [-o <file.txt>]\n"
           "  binexp --help\n"
           "\n"
           "  --no-fold  только тождества (x+0, x*1, x*0), без свертки констант\n";
}
