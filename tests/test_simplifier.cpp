#include <gtest/gtest.h>

#include "errors.hpp"
#include "parser.hpp"
#include "renderer.hpp"
#include "simplifier.hpp"
#include "tokenizer.hpp"

using namespace binexp;

namespace {
std::unique_ptr<AstNode> build(const std::string& expression) {
    return Parser(Tokenizer(expression).tokenize()).parse();
}

std::string simplifyPrefix(const std::string& expression, bool folding) {
    SimplifyOptions options;
    options.constantFolding = folding;
    return toPrefix(*Simplifier(options).simplify(build(expression)));
}

// Подвыражения X, на которых проверяются алгебраические законы
const std::vector<std::string> kSubjects = {
    "5",
    "0",
    "1",
    "+ 2 3",
    "* 4 + 1 0",
    "- 9 * 1 2",
    "/ 8 + 4 0",
    "* + 1 2 - 7 3",
    "- 2 5",
    "/ 7 2",
};
}

// --- Общие законы для обеих политик ---

class SimplifierPolicyTest : public ::testing::TestWithParam<bool> {
protected:
    Simplifier simplifier() const {
        SimplifyOptions options;
        options.constantFolding = GetParam();
        return Simplifier(options);
    }
};

TEST_P(SimplifierPolicyTest, LeafSimplifiesToItself) {
    auto result = simplifier().simplify(build("42"));
    EXPECT_EQ(toPrefix(*result), "42");
}

TEST_P(SimplifierPolicyTest, IdentityLaws) {
    for (const auto& x : kSubjects) {
        auto expected = simplifier().simplify(build(x));
        EXPECT_EQ(*simplifier().simplify(build("+ " + x + " 0")), *expected) << x;
        EXPECT_EQ(*simplifier().simplify(build("+ 0 " + x)), *expected) << x;
        EXPECT_EQ(*simplifier().simplify(build("* " + x + " 1")), *expected) << x;
        EXPECT_EQ(*simplifier().simplify(build("* 1 " + x)), *expected) << x;
    }
}

TEST_P(SimplifierPolicyTest, AnnihilationLaw) {
    for (const auto& x : kSubjects) {
        EXPECT_EQ(toPrefix(*simplifier().simplify(build("* " + x + " 0"))), "0") << x;
        EXPECT_EQ(toPrefix(*simplifier().simplify(build("* 0 " + x))), "0") << x;
    }
}

TEST_P(SimplifierPolicyTest, IsIdempotent) {
    for (const auto& x : kSubjects) {
        auto once = simplifier().simplify(build(x));
        auto twice = simplifier().simplified(*once);
        EXPECT_EQ(*twice, *once) << x;
    }
}

TEST_P(SimplifierPolicyTest, NeverGrowsTheTree) {
    for (const auto& x : kSubjects) {
        auto original = build(x);
        std::size_t before = countNodes(*original);
        auto result = simplifier().simplify(std::move(original));
        EXPECT_LE(countNodes(*result), before) << x;
    }
}

TEST_P(SimplifierPolicyTest, SimplifiedLeavesSourceUntouched) {
    auto source = build("+ 1 * 2 1");
    auto result = simplifier().simplified(*source);
    EXPECT_EQ(toPrefix(*source), "+ 1 * 2 1");
    EXPECT_NE(toPrefix(*result), "+ 1 * 2 1");
}

TEST_P(SimplifierPolicyTest, SubtractAndDividePassThroughIdentities) {
    // x - 0 и x / 1 не входят в набор правил
    EXPECT_EQ(toPrefix(*simplifier().simplify(build("- + 2 3 0"))),
              GetParam() ? "5" : "- + 2 3 0");
    EXPECT_EQ(toPrefix(*simplifier().simplify(build("/ * 2 1 1"))),
              GetParam() ? "2" : "/ 2 1");
}

TEST_P(SimplifierPolicyTest, IdentityLeavesCompareByValue) {
    EXPECT_EQ(toPrefix(*simplifier().simplify(build("+ 00 - 4 3"))), GetParam() ? "1" : "- 4 3");
    EXPECT_EQ(toPrefix(*simplifier().simplify(build("* 01 - 4 3"))), GetParam() ? "1" : "- 4 3");
}

INSTANTIATE_TEST_SUITE_P(FoldingPolicies, SimplifierPolicyTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("WithFolding")
                                               : std::string("IdentitiesOnly");
                         });

// --- Сценарии с ожидаемым результатом для каждой политики ---

struct Scenario {
    std::string input;
    std::string identitiesOnly;
    std::string withFolding;
};

class SimplifierScenarioTest : public ::testing::TestWithParam<Scenario> {};

TEST_P(SimplifierScenarioTest, MatchesExpectedPrefix) {
    const auto& scenario = GetParam();
    EXPECT_EQ(simplifyPrefix(scenario.input, false), scenario.identitiesOnly);
    EXPECT_EQ(simplifyPrefix(scenario.input, true), scenario.withFolding);
}

INSTANTIATE_TEST_SUITE_P(
    Scenarios, SimplifierScenarioTest,
    ::testing::Values(Scenario{"+ 1 + 2 0", "+ 1 2", "3"},
                      Scenario{"+ 1 * 2 1", "+ 1 2", "3"},
                      Scenario{"* 1 * 3 1", "3", "3"},
                      Scenario{"* 1 0", "0", "0"},
                      Scenario{"+ 1 * 0 1", "1", "1"},
                      Scenario{"* + 1 1 0", "0", "0"},
                      Scenario{"* 0 + 5 7", "0", "0"},
                      Scenario{"+ 0 0", "0", "0"},
                      Scenario{"* * 2 3 + 0 * 1 4", "* * 2 3 4", "24"}));

// --- Восходящий обход и локальные правила ---

TEST(SimplifierTest, BottomUpExposesRulesOneLevelUp) {
    // + 1 1 сворачивается в 2, после чего * 2 0 обнуляется уже по правилу 3
    EXPECT_EQ(simplifyPrefix("* + 1 1 0", true), "0");
    // Внутреннее x * 0 превращается в 0, и снаружи срабатывает x + 0
    EXPECT_EQ(simplifyPrefix("+ - 9 4 * 3 0", false), "- 9 4");
}

TEST(SimplifierTest, LocalRulesDoNotRecurse) {
    auto root = build("+ 1 + 2 0");
    auto& binary = static_cast<BinaryNode&>(*root);

    // Правый потомок — не лист 0, поэтому локальное правило неприменимо
    EXPECT_TRUE(additiveIdentity(binary) == nullptr);
    EXPECT_EQ(toPrefix(*root), "+ 1 + 2 0");

    // Упрощение через точку входа спускается к потомкам
    EXPECT_EQ(toPrefix(*Simplifier(SimplifyOptions{false}).simplify(std::move(root))), "+ 1 2");
}

TEST(SimplifierTest, LocalRulesReturnReplacement) {
    auto add = build("+ 0 * 2 3");
    auto replacement = additiveIdentity(static_cast<BinaryNode&>(*add));
    ASSERT_TRUE(replacement != nullptr);
    EXPECT_EQ(toPrefix(*replacement), "* 2 3");

    auto mul = build("* - 5 2 1");
    replacement = multiplicativeIdentity(static_cast<BinaryNode&>(*mul));
    ASSERT_TRUE(replacement != nullptr);
    EXPECT_EQ(toPrefix(*replacement), "- 5 2");

    auto zero = build("* - 5 2 0");
    replacement = multiplyByZero(static_cast<const BinaryNode&>(*zero));
    ASSERT_TRUE(replacement != nullptr);
    EXPECT_EQ(toPrefix(*replacement), "0");

    auto constants = build("* 6 7");
    replacement = foldConstants(static_cast<const BinaryNode&>(*constants));
    ASSERT_TRUE(replacement != nullptr);
    EXPECT_EQ(toPrefix(*replacement), "42");
}

TEST(SimplifierTest, RulesIgnoreOtherOperators) {
    auto sum = build("+ 1 5");
    auto product = build("* 0 5");
    EXPECT_TRUE(multiplicativeIdentity(static_cast<BinaryNode&>(*sum)) == nullptr);
    EXPECT_TRUE(multiplyByZero(static_cast<const BinaryNode&>(*sum)) == nullptr);
    EXPECT_TRUE(additiveIdentity(static_cast<BinaryNode&>(*product)) == nullptr);
}

// --- Свертка констант ---

TEST(ConstantFoldingTest, FoldsAllSupportedOperators) {
    EXPECT_EQ(simplifyPrefix("+ 1 1", true), "2");
    EXPECT_EQ(simplifyPrefix("- 9 4", true), "5");
    EXPECT_EQ(simplifyPrefix("* 6 7", true), "42");
    EXPECT_EQ(simplifyPrefix("/ 8 2", true), "4");
    EXPECT_EQ(simplifyPrefix("- 3 3", true), "0");
}

TEST(ConstantFoldingTest, DisabledPolicyKeepsArithmetic) {
    EXPECT_EQ(simplifyPrefix("+ 1 1", false), "+ 1 1");
    EXPECT_EQ(simplifyPrefix("/ 5 0", false), "/ 5 0");
}

TEST(ConstantFoldingTest, NotAppliedWhenOperandIsNotLeaf) {
    // - 2 5 не сворачивается, поэтому и внешний узел остается операцией
    EXPECT_EQ(simplifyPrefix("+ - 2 5 1", true), "+ - 2 5 1");
}

TEST(ConstantFoldingTest, LeavesResultsOutsideLiteralDomainUnfolded) {
    EXPECT_EQ(simplifyPrefix("- 2 5", true), "- 2 5");
    EXPECT_EQ(simplifyPrefix("/ 7 2", true), "/ 7 2");
    EXPECT_EQ(simplifyPrefix("+ 18446744073709551615 1", true), "+ 18446744073709551615 1");
    EXPECT_EQ(simplifyPrefix("* 4294967296 4294967296", true), "* 4294967296 4294967296");
    EXPECT_EQ(simplifyPrefix("+ 99999999999999999999 1", true), "+ 99999999999999999999 1");
}

TEST(ConstantFoldingTest, LargeLiteralStillObeysIdentities) {
    EXPECT_EQ(simplifyPrefix("* 99999999999999999999 1", true), "99999999999999999999");
    EXPECT_EQ(simplifyPrefix("* 99999999999999999999 0", true), "0");
}

TEST(ConstantFoldingTest, DivisionByZeroIsFoldingError) {
    EXPECT_THROW(simplifyPrefix("/ 5 0", true), FoldingError);
    EXPECT_THROW(simplifyPrefix("+ 1 / 5 - 3 3", true), FoldingError);
}

// Потомки упрощаются раньше правил родителя, поэтому умножение на ноль
// не скрывает деление на ноль внутри операнда
TEST(ConstantFoldingTest, FoldingErrorInsideOperandPropagates) {
    EXPECT_THROW(simplifyPrefix("* / 5 0 0", true), FoldingError);
    EXPECT_THROW(simplifyPrefix("* 0 / 5 - 3 3", true), FoldingError);
    EXPECT_THROW(simplifyPrefix("+ / 5 0 0", true), FoldingError);
    EXPECT_EQ(simplifyPrefix("* / 5 0 0", false), "0");
    EXPECT_EQ(simplifyPrefix("* 0 / 5 - 3 3", false), "0");
}

TEST(ConstantFoldingTest, MultiplicationByZeroWinsOverFolding) {
    auto root = build("* 0 5");
    EXPECT_TRUE(multiplyByZero(static_cast<const BinaryNode&>(*root)) != nullptr);
    EXPECT_EQ(simplifyPrefix("* 0 5", true), "0");
}
