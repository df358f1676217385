#include "syntax/Parser.h"
#include "common/Exceptions.h"
#include "syntax/SyntaxHelper.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace TCE {
namespace Tests {

class ParserTest : public ::testing::Test {
protected:
    static void expectRoundTrip(const std::string &source) {
        NodePtr module = Parser::parse(source);
        EXPECT_EQ(module->render(), source);
    }
};

TEST_F(ParserTest, RenderReproducesInputExactly) {
    const std::vector<std::string> sources = {
        "",
        "x = 1",
        "\n\n# only a comment\n",
        "import unittest\n\n\nclass TestA(unittest.TestCase):\n    def test_a(self):\n        self.assertEqual(1, 1)\n",
        "@decorator(arg)\n@other\ndef f(a, b=2, *args, c, **kwargs) -> int:\n    return a  # trailing\n",
        "x = [\n    1,  # one\n    2,\n]\n",
        "if a:\n    pass\nelif b:\n    pass\nelse:\n    pass\n",
        "for i, (a, b) in enumerate(pairs):\n    print(i)\nelse:\n    done()\n",
        "while x: x -= 1\n",
        "try:\n    f()\nexcept (A, B) as e:\n    raise\nexcept Exception:\n    pass\nelse:\n    g()\nfinally:\n    h()\n",
        "with open(p) as f, lock:\n    data = f.read()\n",
        "async def f():\n    async with a as b:\n        await b\n    async for x in y:\n        yield x\n",
        "y = lambda a, *b: a if b else None\n",
        "z = {k: v for k, v in items if v} | {1, 2}\n",
        "s = x[1:2, ::3]\n",
        "a = b = c\nd += 1\ne: int = 2\n",
        "print(*args, sep='', **kw)\n",
        "value = (yield)\n",
        "match = 1\n",
        "x = 1; y = 2;\n",
        "class A(B, metaclass=M): pass\n",
        "if (n := len(a)) > 10:\n    pass\n",
        "x = not a and b or c\n",
        "if y:\n\tif x:\n\t\tpass\n",
        "x = '''\nmulti\n'''  # doc\n",
        "def f():\r\n    return 1\r\n",
        "a = 1 \\\n    + 2\n",
        "from . import a\nfrom ..b.c import (d as e,\n    f)\nimport a.b as c, d\n",
        "global a\nnonlocal_ = 1\ndel a[0], b\nassert x, 'msg'\n",
    };
    for (const auto &source : sources) {
        SCOPED_TRACE(source);
        expectRoundTrip(source);
    }
}

TEST_F(ParserTest, ModuleChildrenAreStatementsFollowedByEndOfFile) {
    NodePtr module = Parser::parse("import os\n\nclass A:\n    pass\n");

    ASSERT_EQ(module->getChildCount(), 3u);
    EXPECT_TRUE(module->getChild(0)->is(SyntaxKind::SimpleStatement));
    EXPECT_TRUE(module->getChild(0)->getChild(0)->is(SyntaxKind::Import));
    EXPECT_TRUE(module->getChild(1)->is(SyntaxKind::ClassDef));
    EXPECT_TRUE(module->getChild(2)->isToken());
    EXPECT_EQ(module->getChild(2)->getToken().kind, TokenKind::EndOfFile);
}

TEST_F(ParserTest, ClassBasesAreAnArgumentList) {
    NodePtr module = Parser::parse("class TestA(unittest.TestCase):\n    x = 1\n");
    NodePtr classDef = module->getChild(0);

    NodePtr bases = classDef->findChild(SyntaxKind::ArgumentList);
    ASSERT_NE(bases, nullptr);
    EXPECT_EQ(bases->getSourceText(), "(unittest.TestCase)");
    EXPECT_EQ(SyntaxHelper::definitionName(classDef), "TestA");
}

TEST_F(ParserTest, NodeRangesCoverTheirTokens) {
    NodePtr module = Parser::parse("x = 1\n\ndef f():\n    return x\n");
    NodePtr function = module->getChild(1);

    ASSERT_TRUE(function->is(SyntaxKind::FunctionDef));
    EXPECT_EQ(function->getRange().start.line, 3);
    EXPECT_EQ(function->getRange().start.column, 1);
    EXPECT_EQ(function->getLeadingTrivia(), "\n");
    EXPECT_EQ(function->getSourceText(), "def f():\n    return x\n");
}

TEST_F(ParserTest, SyntaxErrorReportsLocation) {
    try {
        Parser::parse("x = 1\ndef f(:\n    pass\n");
        FAIL() << "expected ParseError";
    } catch (const ParseError &e) {
        EXPECT_EQ(e.getPosition().line, 2);
        EXPECT_GT(e.getPosition().column, 0);
        EXPECT_NE(std::string(e.what()).find(e.getDetail()), std::string::npos);
    }
}

TEST_F(ParserTest, MissingBlockIsParseError) {
    EXPECT_THROW(Parser::parse("def f():\nx = 1\n"), ParseError);
}

TEST_F(ParserTest, ExpressionOnlyRejectsTrailingTokens) {
    Parser good("a.b(c) == d");
    NodePtr expression = good.parseExpressionOnly();
    EXPECT_TRUE(expression->is(SyntaxKind::Comparison));

    Parser bad("a b");
    EXPECT_THROW(bad.parseExpressionOnly(), ParseError);
}

TEST_F(ParserTest, CallArgumentsAreClassified) {
    Parser parser("f(a, key=b, *c, **d)");
    NodePtr call = parser.parseExpressionOnly();
    auto arguments = SyntaxHelper::argumentsOf(call);

    using Kind = SyntaxHelper::CallArgument::Kind;
    ASSERT_EQ(arguments.size(), 4u);
    EXPECT_EQ(arguments[0].kind, Kind::Positional);
    EXPECT_EQ(arguments[1].kind, Kind::Keyword);
    EXPECT_EQ(arguments[1].keyword, "key");
    EXPECT_EQ(arguments[2].kind, Kind::Star);
    EXPECT_EQ(arguments[3].kind, Kind::DoubleStar);
}

}  // namespace Tests
}  // namespace TCE
