#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "csv_writer.hpp"

using namespace binexp;

namespace {
std::string readFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

class CsvWriterTest : public ::testing::Test {
protected:
    std::filesystem::path path = std::filesystem::temp_directory_path() / "binexp_csv_writer_test.csv";

    void TearDown() override { std::filesystem::remove(path); }
};
}

TEST_F(CsvWriterTest, WritesHeaderOnOpen) {
    {
        CsvWriter writer(path);
    }
    EXPECT_EQ(readFile(path), "line,expression,status,prefix,infix,postfix,simplified,message\n");
}

TEST_F(CsvWriterTest, WritesSuccessAndErrorRows) {
    SimplificationRecord ok;
    ok.lineNumber = 1;
    ok.expression = "+ 1 0";
    ok.result = RenderedExpression{"+ 1 0", "(1 + 0)", "1 0 +", "1"};
    ok.status = "success";

    SimplificationRecord failed;
    failed.lineNumber = 2;
    failed.expression = "+ \"1\"";
    failed.status = "error";
    failed.message = "Неподдерживаемая операция '\"1\"'";

    {
        CsvWriter writer(path);
        writer.write({ok, failed});
    }

    std::string expected =
        "line,expression,status,prefix,infix,postfix,simplified,message\n"
        "1,\"+ 1 0\",success,\"+ 1 0\",\"(1 + 0)\",\"1 0 +\",\"1\",\"\"\n"
        "2,\"+ '1'\",error,,,,,\"Неподдерживаемая операция ''1''\"\n";
    EXPECT_EQ(readFile(path), expected);
}

TEST_F(CsvWriterTest, UnwritableTargetThrows) {
    auto missingDir = std::filesystem::temp_directory_path() / "binexp_no_such_dir" / "out.csv";
    EXPECT_THROW(CsvWriter writer(missingDir), std::runtime_error);
}
