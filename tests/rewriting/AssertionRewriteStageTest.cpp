#include "rewriting/AssertionRewriteStage.h"
#include "common/TestUtils.h"
#include <gtest/gtest.h>

namespace TCE {
namespace Tests {

using Test::Utils::entriesOf;
using Test::Utils::hasEntry;
using Test::Utils::transform;

class AssertionRewriteStageTest : public ::testing::Test {
protected:
    static std::string unit(const std::string &body) {
        return "import unittest\n"
               "\n"
               "\n"
               "class TestUnit(unittest.TestCase):\n"
               "    def test_case(self):\n" +
               body;
    }

    static bool contains(const UnitResult &result, const std::string &fragment) {
        return result.outputText && result.outputText->find(fragment) != std::string::npos;
    }
};

TEST_F(AssertionRewriteStageTest, RegexAssertionImportsRe) {
    UnitResult result = transform(unit("        self.assertRegex(\"abc123\", r\"\\d+\")\n"));

    ASSERT_EQ(result.status, UnitStatus::Complete);
    EXPECT_EQ(*result.outputText, "import re\n"
                                  "\n"
                                  "\n"
                                  "class TestUnit:\n"
                                  "    def test_case(self):\n"
                                  "        assert re.search(r\"\\d+\", \"abc123\")\n");
}

TEST_F(AssertionRewriteStageTest, SemicolonSeparatedCallsAreRewrittenInPlace) {
    UnitResult result = transform(unit("        self.assertTrue(a); self.assertFalse(b)\n"));

    EXPECT_TRUE(contains(result, "        assert a; assert not b\n"));
    EXPECT_EQ(entriesOf(result.ledger, AssertionRewriteStage::FAMILY).size(), 2u);
}

TEST_F(AssertionRewriteStageTest, TrailingCommentSurvives) {
    UnitResult result = transform(unit("        self.assertEqual(a, b)  # both sides\n"));

    EXPECT_TRUE(contains(result, "        assert a == b  # both sides\n"));
}

TEST_F(AssertionRewriteStageTest, MultiLineCallCollapses) {
    UnitResult result = transform(unit("        self.assertEqual(\n"
                                       "            compute(),\n"
                                       "            42,\n"
                                       "        )\n"));

    EXPECT_TRUE(contains(result, "        assert compute() == 42\n"));
}

TEST_F(AssertionRewriteStageTest, InteriorCommentBlocksCollapseUntilExperimental) {
    const std::string source = unit("        self.assertEqual(\n"
                                    "            compute(),  # slow\n"
                                    "            42,\n"
                                    "        )\n");

    UnitResult advanced = transform(source, DegradationTier::Advanced);
    EXPECT_TRUE(contains(advanced, "            compute(),  # slow\n"));
    EXPECT_TRUE(hasEntry(advanced.ledger, AssertionRewriteStage::FAMILY, LedgerOutcome::FellBackError,
                         "rewrite would drop 1 comment(s)"));

    UnitResult experimental = transform(source, DegradationTier::Experimental);
    EXPECT_TRUE(contains(experimental, "        # slow\n"
                                       "        assert compute() == 42\n"));
    EXPECT_TRUE(hasEntry(experimental.ledger, AssertionRewriteStage::FAMILY, LedgerOutcome::Applied,
                         "(textual repair)"));
}

TEST_F(AssertionRewriteStageTest, ClassOwnMethodIsNotAnAssertion) {
    UnitResult result = transform(unit("        self.assertEqual(1, 1)\n"
                                       "\n"
                                       "    def assertEqual(self, a, b):\n"
                                       "        return a == b\n"));

    EXPECT_TRUE(contains(result, "        self.assertEqual(1, 1)\n"));
    EXPECT_TRUE(entriesOf(result.ledger, AssertionRewriteStage::FAMILY).empty());
}

TEST_F(AssertionRewriteStageTest, MessageNeedsAdvancedTier) {
    UnitResult result = transform(unit("        self.assertEqual(a, b, 'differ')\n"
                                       "        self.assertEqual(a, b)\n"),
                                  DegradationTier::Essential);

    EXPECT_EQ(result.status, UnitStatus::Partial);
    EXPECT_TRUE(contains(result, "        self.assertEqual(a, b, 'differ')\n        assert a == b\n"));
    EXPECT_TRUE(hasEntry(result.ledger, AssertionRewriteStage::FAMILY, LedgerOutcome::SkippedAmbiguous,
                         "requires advanced tier: assertEqual -> assert"));
}

TEST_F(AssertionRewriteStageTest, FailingCallFallsBackAlone) {
    UnitResult result = transform(unit("        self.assertEqual(*pair)\n"
                                       "        self.assertEqual(a, b)\n"));

    EXPECT_EQ(result.status, UnitStatus::Partial);
    EXPECT_TRUE(contains(result, "        self.assertEqual(*pair)\n        assert a == b\n"));
    EXPECT_TRUE(hasEntry(result.ledger, AssertionRewriteStage::FAMILY, LedgerOutcome::FellBackError,
                         "rewrite: star or generator arguments cannot be rewritten"));
    EXPECT_TRUE(hasEntry(result.ledger, AssertionRewriteStage::FAMILY, LedgerOutcome::Applied));
}

TEST_F(AssertionRewriteStageTest, FailAndSkipUsePytestHelpers) {
    UnitResult result = transform(unit("        if broken:\n"
                                       "            self.skipTest('broken')\n"
                                       "        self.fail('unreachable')\n"));

    EXPECT_TRUE(contains(result, "            pytest.skip('broken')\n        pytest.fail('unreachable')\n"));
    EXPECT_TRUE(result.outputText->starts_with("import pytest\n"));
}

TEST_F(AssertionRewriteStageTest, ExperimentalShapeNeedsExperimentalTier) {
    const std::string source = unit("        self.assertDictContainsSubset({'a': 1}, data)\n");

    UnitResult advanced = transform(source, DegradationTier::Advanced);
    EXPECT_TRUE(hasEntry(advanced.ledger, AssertionRewriteStage::FAMILY, LedgerOutcome::SkippedAmbiguous,
                         "requires experimental tier"));

    UnitResult experimental = transform(source, DegradationTier::Experimental);
    EXPECT_TRUE(contains(experimental, "        assert {**data, **{'a': 1}} == data\n"));
}

}  // namespace Tests
}  // namespace TCE
