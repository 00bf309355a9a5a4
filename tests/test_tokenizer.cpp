#include <gtest/gtest.h>

#include "tokenizer.hpp"

using namespace binexp;

TEST(TokenizerTest, SplitsOnSpacesAndNumbersTokens) {
    auto tokens = Tokenizer("+ 12 * 3 4").tokenize();

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].type, TokenType::Operator);
    EXPECT_EQ(tokens[0].text, "+");
    EXPECT_EQ(tokens[0].position, 0u);
    EXPECT_EQ(tokens[1].type, TokenType::Number);
    EXPECT_EQ(tokens[1].text, "12");
    EXPECT_EQ(tokens[1].position, 1u);
    EXPECT_EQ(tokens[2].text, "*");
    EXPECT_EQ(tokens[4].text, "4");
    EXPECT_EQ(tokens[4].position, 4u);
}

TEST(TokenizerTest, TreatsAnyWhitespaceAsSeparator) {
    auto tokens = splitTokens("  *\t1\r\n  0 \r");
    EXPECT_EQ(tokens, (std::vector<std::string>{"*", "1", "0"}));
}

TEST(TokenizerTest, BlankInputGivesNoTokens) {
    EXPECT_TRUE(Tokenizer("").tokenize().empty());
    EXPECT_TRUE(Tokenizer("   \t ").tokenize().empty());
}

TEST(TokenizerTest, NonDigitTokensAreOperators) {
    auto tokens = Tokenizer("x 1.5 -3 %").tokenize();
    ASSERT_EQ(tokens.size(), 4u);
    for (const auto& token : tokens) {
        EXPECT_EQ(token.type, TokenType::Operator) << token.text;
    }
}
