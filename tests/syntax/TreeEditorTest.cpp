#include "syntax/TreeEditor.h"
#include "syntax/Parser.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/SyntaxHelper.h"
#include <gtest/gtest.h>

namespace TCE {
namespace Tests {

class TreeEditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        module_ = Parser::parse(SOURCE);
    }

    static constexpr const char *SOURCE = "def f():\n"
                                          "    # first\n"
                                          "    x = 1\n"
                                          "    return x  # result\n"
                                          "\n"
                                          "y = 2\n";

    NodePtr module_;
};

TEST_F(TreeEditorTest, ReplaceChildSharesUntouchedSubtrees) {
    NodePtr replacement = SyntaxFactory::parseStatement("y = 3\n", "");
    replacement = TreeEditor::withLeadingTrivia(replacement, "\n");

    NodePtr updated = TreeEditor::replaceChild(module_, 1, replacement);

    EXPECT_NE(updated, module_);
    EXPECT_EQ(updated->getChild(0), module_->getChild(0));
    EXPECT_EQ(module_->render(), SOURCE);
    EXPECT_EQ(updated->render(), "def f():\n    # first\n    x = 1\n    return x  # result\n\ny = 3\n");
}

TEST_F(TreeEditorTest, ReplaceNodeRebuildsAncestors) {
    NodePtr function = module_->getChild(0);
    NodePtr returnStatement = SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(function)).back();
    NodePtr replacement = SyntaxFactory::parseStatement("return None  # result\n", "    ");

    NodePtr updated = TreeEditor::replaceNode(module_, returnStatement.get(), replacement);

    EXPECT_EQ(updated->render(), "def f():\n    # first\n    x = 1\n    return None  # result\n\ny = 2\n");
    EXPECT_EQ(updated->getChild(1), module_->getChild(1));
}

TEST_F(TreeEditorTest, FindPathLocatesNodesByIdentity) {
    NodePtr function = module_->getChild(0);
    auto path = TreeEditor::findPath(module_, function.get());
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, NodePath{0});

    NodePtr detached = SyntaxFactory::parseStatement("y = 2\n", "");
    EXPECT_FALSE(TreeEditor::findPath(module_, detached.get()).has_value());
}

TEST_F(TreeEditorTest, CommentsAreCountedInTrivia) {
    EXPECT_EQ(TreeEditor::countComments(module_), 2u);
    auto comments = TreeEditor::collectComments(module_);
    ASSERT_EQ(comments.size(), 2u);
    EXPECT_EQ(comments[0], "# first");
    EXPECT_EQ(comments[1], "# result");
}

TEST_F(TreeEditorTest, IndentationAndLeadingLines) {
    NodePtr function = module_->getChild(0);
    NodeList statements = SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(function));

    EXPECT_EQ(TreeEditor::indentationOf(statements[0]), "    ");
    EXPECT_EQ(TreeEditor::leadingLinesOf(statements[0]), "    # first\n");
}

TEST_F(TreeEditorTest, ReindentShiftsEveryLineButStrings) {
    NodePtr module = Parser::parse("if a:\n"
                                   "    b = '''\n"
                                   "    keep\n"
                                   "    '''\n"
                                   "    c(\n"
                                   "        d)\n");
    NodePtr ifStatement = module->getChild(0);

    NodePtr shifted = TreeEditor::reindent(ifStatement, "", "  ");

    EXPECT_EQ(shifted->render(), "  if a:\n"
                                 "      b = '''\n"
                                 "    keep\n"
                                 "    '''\n"
                                 "      c(\n"
                                 "          d)\n");
}

TEST_F(TreeEditorTest, DetachedNodesHaveNoRange) {
    NodePtr expression = SyntaxFactory::parseExpression("a + b");
    EXPECT_FALSE(expression->getRange().isValid());
    EXPECT_EQ(expression->render(), "a + b");
}

TEST_F(TreeEditorTest, WithTokenTextKeepsTrivia) {
    NodePtr function = module_->getChild(0);
    size_t index = function->findTokenIndex("f");
    ASSERT_NE(index, std::string::npos);

    NodePtr renamed = TreeEditor::replaceChild(function, index,
                                               TreeEditor::withTokenText(function->getChild(index), "g"));

    EXPECT_EQ(SyntaxHelper::definitionName(renamed), "g");
    EXPECT_TRUE(renamed->render().starts_with("def g():\n"));
}

}  // namespace Tests
}  // namespace TCE
