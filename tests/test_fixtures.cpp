#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "expression_tree.hpp"

using namespace binexp;

namespace {
struct FixtureCase {
    std::size_t line;
    std::string input;
    std::string expected;
};

std::string trim(const std::string& text) {
    std::size_t first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

// Строки вида "<вход> => <ожидание>", пустые строки и # комментарии пропускаются
std::vector<FixtureCase> loadCases(const std::string& fileName) {
    std::filesystem::path path = std::filesystem::path(BINEXP_TEST_DATA_DIR) / fileName;
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть " + path.string());
    }

    std::vector<FixtureCase> cases;
    std::string line;
    std::size_t number = 0;
    while (std::getline(input, line)) {
        ++number;
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        std::size_t arrow = line.find("=>");
        if (arrow == std::string::npos) {
            throw std::runtime_error("Нет '=>' в строке " + std::to_string(number) + " файла " + fileName);
        }
        cases.push_back({number, trim(line.substr(0, arrow)), trim(line.substr(arrow + 2))});
    }
    return cases;
}

void runCases(const std::string& fileName, SimplifyOptions options) {
    auto cases = loadCases(fileName);
    ASSERT_FALSE(cases.empty()) << fileName;

    for (const auto& testCase : cases) {
        SCOPED_TRACE(fileName + ":" + std::to_string(testCase.line) + " " + testCase.input);
        auto tree = ExpressionTree::fromString(testCase.input);
        if (testCase.expected == "error") {
            EXPECT_THROW(tree.simplified(options), ExpressionError);
        } else {
            EXPECT_EQ(tree.simplified(options).prefix(), testCase.expected);
        }
    }
}
}

TEST(FixtureFilesTest, IdentitiesOnly) {
    runCases("identities_only.txt", SimplifyOptions{false});
}

TEST(FixtureFilesTest, WithFolding) {
    runCases("with_folding.txt", SimplifyOptions{true});
}
