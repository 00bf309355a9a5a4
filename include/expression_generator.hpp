// Генератор префиксных выражений для нагрузочного тестирования.
// Чаще обычного выдает 0 и 1, чтобы срабатывали правила упрощения.
// С малой вероятностью вносит ошибки: пропущенный операнд, лишний токен,
// неподдерживаемую операцию или деление на ноль.
//

#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace binexp {

// Вероятность генерации ошибки (5%)
constexpr double ERROR_PROBABILITY = 0.05;

class ExpressionGenerator {
public:
    ExpressionGenerator() : ExpressionGenerator(std::random_device{}()) {}

    // Детерминированный генератор для воспроизводимых файлов и тестов
    explicit ExpressionGenerator(std::mt19937::result_type seed)
        : gen(seed),
          num_dist(2, 99),
          op_dist(0, 3),
          leaf_roll_dist(0, 9),
          branch_roll_dist(0, 9),
          error_dist(0.0, 1.0),
          error_type_dist(0, 3) {}

    // Выражение глубины не более depth, токены через пробел
    std::string generate(int depth) {
        std::vector<std::string> tokens;
        generateInto(depth, tokens);
        return introduceError(tokens);
    }

private:
    std::mt19937 gen;
    std::uniform_int_distribution<> num_dist;
    std::uniform_int_distribution<> op_dist;
    std::uniform_int_distribution<> leaf_roll_dist;
    std::uniform_int_distribution<> branch_roll_dist;
    std::uniform_real_distribution<> error_dist;
    std::uniform_int_distribution<> error_type_dist;

    const std::vector<std::string> operations = {"+", "-", "*", "/"};

    void generateInto(int depth, std::vector<std::string>& tokens) {
        // При нулевой глубине или в 20% случаев — лист
        if (depth <= 0 || branch_roll_dist(gen) < 2) {
            tokens.push_back(generateNumber());
            return;
        }

        const std::string& op = operations[op_dist(gen)];
        tokens.push_back(op);
        generateInto(depth - 1, tokens);

        // Делитель всегда ненулевой литерал, ноль появляется только как ошибка
        if (op == "/") {
            tokens.push_back(std::to_string(num_dist(gen)));
        } else {
            generateInto(depth - 1, tokens);
        }
    }

    // 0 и 1 — по 20%, остальные числа равномерно
    std::string generateNumber() {
        int roll = leaf_roll_dist(gen);
        if (roll < 2) {
            return "0";
        }
        if (roll < 4) {
            return "1";
        }
        return std::to_string(num_dist(gen));
    }

    static std::string join(const std::vector<std::string>& tokens) {
        std::string result;
        for (const auto& token : tokens) {
            if (!result.empty()) {
                result.push_back(' ');
            }
            result.append(token);
        }
        return result;
    }

    // Вносит ошибки в выражение с малой вероятностью
    std::string introduceError(std::vector<std::string>& tokens) {
        if (error_dist(gen) >= ERROR_PROBABILITY) {
            return join(tokens);
        }

        switch (error_type_dist(gen)) {
        case 0: // Пропущенный операнд
            if (tokens.size() > 1) {
                tokens.pop_back();
            } else {
                tokens.insert(tokens.begin(), "+");
            }
            break;
        case 1: // Лишний токен после выражения
            tokens.push_back(generateNumber());
            break;
        case 2: // Неподдерживаемая операция
            tokens.insert(tokens.begin(), {"%", "7"});
            break;
        case 3: // Деление на ноль
            tokens.insert(tokens.begin(), "/");
            tokens.push_back("0");
            break;
        default:
            break;
        }
        return join(tokens);
    }
};

} // namespace binexp
