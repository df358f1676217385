#include "syntax/SyntaxHelper.h"
#include "syntax/Parser.h"
#include "syntax/SyntaxFactory.h"
#include <gtest/gtest.h>

namespace TCE {
namespace Tests {

class SyntaxHelperTest : public ::testing::Test {
protected:
    static NodePtr expr(const std::string &text) {
        return SyntaxFactory::parseExpression(text);
    }
};

TEST_F(SyntaxHelperTest, OperandTextParenthesizesLooserExpressions) {
    using namespace SyntaxHelper;
    EXPECT_EQ(operandText(expr("a + b"), PRECEDENCE_BIT_OR), "a + b");
    EXPECT_EQ(operandText(expr("a if b else c"), PRECEDENCE_BIT_OR), "(a if b else c)");
    EXPECT_EQ(operandText(expr("a == b"), PRECEDENCE_BIT_OR), "(a == b)");
    EXPECT_EQ(operandText(expr("not a"), PRECEDENCE_NOT), "not a");
    EXPECT_EQ(operandText(expr("a or b"), PRECEDENCE_NOT), "(a or b)");
    EXPECT_EQ(operandText(expr("lambda: 1"), PRECEDENCE_LAMBDA), "lambda: 1");
}

TEST_F(SyntaxHelperTest, BareTuplesAlwaysNeedParentheses) {
    NodePtr module = Parser::parse("x = 1, 2\n");
    NodePtr assign = module->getChild(0)->getChild(0);
    NodePtr tuple = assign->getChild(2);

    EXPECT_EQ(SyntaxHelper::precedenceOf(tuple), SyntaxHelper::PRECEDENCE_LOWEST);
    EXPECT_EQ(SyntaxHelper::operandText(tuple, SyntaxHelper::PRECEDENCE_LAMBDA), "(1, 2)");
    EXPECT_EQ(SyntaxHelper::precedenceOf(expr("(1, 2)")), SyntaxHelper::PRECEDENCE_ATOM);
}

TEST_F(SyntaxHelperTest, DottedNameOfAttributeChains) {
    EXPECT_EQ(SyntaxHelper::dottedName(expr("unittest.TestCase")), "unittest.TestCase");
    EXPECT_EQ(SyntaxHelper::dottedName(expr("name")), "name");
    EXPECT_EQ(SyntaxHelper::dottedName(expr("f().x")), "");
}

TEST_F(SyntaxHelperTest, SelfMethodNameOfCalls) {
    EXPECT_EQ(SyntaxHelper::selfMethodName(expr("self.assertEqual(a, b)")), "assertEqual");
    EXPECT_FALSE(SyntaxHelper::selfMethodName(expr("other.assertEqual(a, b)")).has_value());
    EXPECT_FALSE(SyntaxHelper::selfMethodName(expr("self.helper.check()")).has_value());
}

TEST_F(SyntaxHelperTest, LiteralDetection) {
    EXPECT_TRUE(SyntaxHelper::isLiteral(expr("[1, 'a', (2, -3.5), None, True]")));
    EXPECT_TRUE(SyntaxHelper::isLiteral(expr("{'k': [1]}")));
    EXPECT_FALSE(SyntaxHelper::isLiteral(expr("[1, x]")));
    EXPECT_FALSE(SyntaxHelper::isLiteral(expr("[f()]")));
}

TEST_F(SyntaxHelperTest, FunctionShapeAccessors) {
    NodePtr module = Parser::parse("@dec\n"
                                   "async def f(self, a, *args, b=1, **kw):\n"
                                   "    pass\n");
    NodePtr function = module->getChild(0);

    EXPECT_EQ(SyntaxHelper::definitionName(function), "f");
    EXPECT_TRUE(SyntaxHelper::isAsync(function));
    EXPECT_EQ(SyntaxHelper::decoratorsOf(function).size(), 1u);
    EXPECT_EQ(SyntaxHelper::parameterNames(function),
              (std::vector<std::string>{"self", "a", "args", "b", "kw"}));
    EXPECT_EQ(SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(function)).size(), 1u);
}

TEST_F(SyntaxHelperTest, TargetNamesAndReferences) {
    NodePtr module = Parser::parse("(a, [b, *c]) = value\n");
    NodePtr assign = module->getChild(0)->getChild(0);

    std::set<std::string> names;
    SyntaxHelper::collectTargetNames(assign->getChild(0), names);
    EXPECT_EQ(names, (std::set<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(SyntaxHelper::referencesName(assign, "value"));
    EXPECT_FALSE(SyntaxHelper::referencesName(assign, "missing"));
}

TEST_F(SyntaxHelperTest, ContainsSelfCallMatchesPrefixes) {
    NodePtr module = Parser::parse("def t(self):\n"
                                   "    if x:\n"
                                   "        self.assertTrue(x)\n");
    EXPECT_TRUE(SyntaxHelper::containsSelfCall(module, {"assert"}));
    EXPECT_FALSE(SyntaxHelper::containsSelfCall(module, {"fail"}));
}

}  // namespace Tests
}  // namespace TCE
