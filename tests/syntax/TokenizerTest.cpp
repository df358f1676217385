#include "syntax/Tokenizer.h"
#include "common/Exceptions.h"
#include <gtest/gtest.h>
#include <string>

namespace TCE {
namespace Tests {

class TokenizerTest : public ::testing::Test {
protected:
    static std::string concatenate(const std::vector<Token> &tokens) {
        std::string text;
        for (const auto &token : tokens) {
            text += token.leadingTrivia + token.text;
        }
        return text;
    }

    static size_t countKind(const std::vector<Token> &tokens, TokenKind kind) {
        size_t count = 0;
        for (const auto &token : tokens) {
            if (token.kind == kind) {
                ++count;
            }
        }
        return count;
    }
};

TEST_F(TokenizerTest, TriviaAndTextReproduceInput) {
    const std::string source = "# header\n"
                               "import os  # trailing\n"
                               "\n"
                               "def f(a,\n"
                               "      b):\n"
                               "    x = a + \\\n"
                               "        b\n"
                               "    return x\n";

    Tokenizer tokenizer(source);
    auto tokens = tokenizer.tokenize();
    EXPECT_EQ(concatenate(tokens), source);
    EXPECT_EQ(tokens.back().kind, TokenKind::EndOfFile);
}

TEST_F(TokenizerTest, IndentAndDedentAreBalanced) {
    const std::string source = "class A:\n"
                               "    def f(self):\n"
                               "        pass\n"
                               "x = 1\n";

    Tokenizer tokenizer(source);
    auto tokens = tokenizer.tokenize();
    EXPECT_EQ(countKind(tokens, TokenKind::Indent), 2u);
    EXPECT_EQ(countKind(tokens, TokenKind::Dedent), 2u);
}

TEST_F(TokenizerTest, CommentLinesProduceNoTokens) {
    const std::string source = "x = 1\n"
                               "    # indented comment\n"
                               "y = 2\n";

    Tokenizer tokenizer(source);
    auto tokens = tokenizer.tokenize();
    EXPECT_EQ(countKind(tokens, TokenKind::Indent), 0u);
    EXPECT_EQ(countKind(tokens, TokenKind::Newline), 2u);
    EXPECT_EQ(concatenate(tokens), source);
}

TEST_F(TokenizerTest, StringPrefixesAndTripleQuotes) {
    const std::string source = "a = rb'\\d'\n"
                               "b = f\"{a}\"\n"
                               "c = '''one\n"
                               "two'''\n";

    Tokenizer tokenizer(source);
    auto tokens = tokenizer.tokenize();
    EXPECT_EQ(countKind(tokens, TokenKind::String), 3u);
    EXPECT_EQ(concatenate(tokens), source);
}

TEST_F(TokenizerTest, CrLfLineBreaksArePreserved) {
    const std::string source = "x = 1\r\nif x:\r\n    y = 2\r\n";

    Tokenizer tokenizer(source);
    auto tokens = tokenizer.tokenize();
    EXPECT_EQ(concatenate(tokens), source);
    EXPECT_EQ(tokens.front().range.start.line, 1);
}

TEST_F(TokenizerTest, TokenPositionsAreOneBased) {
    Tokenizer tokenizer("x = 1\n  \ny = 2\n");
    auto tokens = tokenizer.tokenize();

    const Token *y = nullptr;
    for (const auto &token : tokens) {
        if (token.isName("y")) {
            y = &token;
        }
    }
    ASSERT_NE(y, nullptr);
    EXPECT_EQ(y->range.start.line, 3);
    EXPECT_EQ(y->range.start.column, 1);
}

TEST_F(TokenizerTest, UnterminatedStringIsParseError) {
    Tokenizer tokenizer("x = 'abc\n");
    try {
        tokenizer.tokenize();
        FAIL() << "expected ParseError";
    } catch (const ParseError &e) {
        EXPECT_EQ(e.getPosition().line, 1);
    }
}

TEST_F(TokenizerTest, UnbalancedBracketIsParseError) {
    Tokenizer tokenizer("x = [1, 2\ny = 3\n");
    EXPECT_THROW(tokenizer.tokenize(), ParseError);
}

TEST_F(TokenizerTest, InconsistentDedentIsParseError) {
    Tokenizer tokenizer("if x:\n"
                        "        y = 1\n"
                        "    z = 2\n");
    EXPECT_THROW(tokenizer.tokenize(), ParseError);
}

}  // namespace Tests
}  // namespace TCE
