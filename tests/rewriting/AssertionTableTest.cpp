#include "rewriting/AssertionTable.h"
#include "common/Exceptions.h"
#include "syntax/SyntaxFactory.h"
#include <gtest/gtest.h>
#include <stdexcept>

namespace TCE {
namespace Tests {

class AssertionTableTest : public ::testing::Test {
protected:
    // Render "self.<method>(<args>)" the way the assertion stage does
    std::string render(const std::string &method, const std::string &arguments) {
        NodePtr call = SyntaxFactory::parseExpression("self." + method + "(" + arguments + ")");
        const AssertionShape *shape = AssertionTable::find(method);
        if (!shape) {
            throw std::invalid_argument("not a table method: " + method);
        }
        BoundAssertion bound = AssertionTable::bind(*shape, SyntaxHelper::argumentsOf(call));
        return AssertionTable::render(bound, config_);
    }

    DegradationTier tierOf(const std::string &method, const std::string &arguments) {
        NodePtr call = SyntaxFactory::parseExpression("self." + method + "(" + arguments + ")");
        return AssertionTable::requiredTier(*AssertionTable::find(method), SyntaxHelper::argumentsOf(call));
    }

    TransformConfig config_;
};

TEST_F(AssertionTableTest, ComparisonFamily) {
    EXPECT_EQ(render("assertEqual", "1 + 1, 2"), "assert 1 + 1 == 2");
    EXPECT_EQ(render("assertNotEqual", "a, b"), "assert a != b");
    EXPECT_EQ(render("assertIs", "a, None"), "assert a is None");
    EXPECT_EQ(render("assertIsNot", "a, b"), "assert a is not b");
    EXPECT_EQ(render("assertIn", "x, items"), "assert x in items");
    EXPECT_EQ(render("assertNotIn", "x, items"), "assert x not in items");
    EXPECT_EQ(render("assertGreater", "a, b"), "assert a > b");
    EXPECT_EQ(render("assertLessEqual", "a, b"), "assert a <= b");
    EXPECT_EQ(render("assertDictEqual", "d1, d2"), "assert d1 == d2");
}

TEST_F(AssertionTableTest, ComparandsKeepTheirMeaning) {
    EXPECT_EQ(render("assertEqual", "a == b, c"), "assert (a == b) == c");
    EXPECT_EQ(render("assertEqual", "x if y else z, 1"), "assert (x if y else z) == 1");
    EXPECT_EQ(render("assertEqual", "not a, b"), "assert (not a) == b");
    EXPECT_EQ(render("assertEqual", "a | b, c"), "assert a | b == c");
    EXPECT_EQ(render("assertTrue", "a or b"), "assert a or b");
    EXPECT_EQ(render("assertFalse", "a or b"), "assert not (a or b)");
    EXPECT_EQ(render("assertFalse", "done"), "assert not done");
}

TEST_F(AssertionTableTest, NoneAndInstanceChecks) {
    EXPECT_EQ(render("assertIsNone", "result"), "assert result is None");
    EXPECT_EQ(render("assertIsNotNone", "f(x)"), "assert f(x) is not None");
    EXPECT_EQ(render("assertIsInstance", "obj, (int, float)"), "assert isinstance(obj, (int, float))");
    EXPECT_EQ(render("assertNotIsInstance", "obj, str"), "assert not isinstance(obj, str)");
}

TEST_F(AssertionTableTest, MessageBecomesAssertMessage) {
    EXPECT_EQ(render("assertEqual", "a, b, 'values differ'"), "assert a == b, 'values differ'");
    EXPECT_EQ(render("assertTrue", "ok, msg=reason"), "assert ok, reason");
}

TEST_F(AssertionTableTest, AdvancedShapes) {
    EXPECT_EQ(render("assertCountEqual", "a, b"), "assert sorted(a) == sorted(b)");
    EXPECT_EQ(render("assertRegex", "text, r'\\d+'"), "assert re.search(r'\\d+', text)");
    EXPECT_EQ(render("assertNotRegex", "text, 'x'"), "assert not re.search('x', text)");
    EXPECT_EQ(render("fail", "'boom'"), "pytest.fail('boom')");
    EXPECT_EQ(render("fail", ""), "pytest.fail()");
    EXPECT_EQ(render("skipTest", "'later'"), "pytest.skip('later')");
    EXPECT_EQ(render("assertDictContainsSubset", "sub, d"), "assert {**d, **sub} == d");
}

TEST_F(AssertionTableTest, AlmostEqualUsesPlacesOrDelta) {
    EXPECT_EQ(render("assertAlmostEqual", "x, 0.3"), "assert round(x - 0.3, 7) == 0");
    EXPECT_EQ(render("assertAlmostEqual", "x, y + 1, 2"), "assert round(x - (y + 1), 2) == 0");
    EXPECT_EQ(render("assertAlmostEqual", "x, y, delta=0.5"), "assert abs(x - y) <= 0.5");
    EXPECT_EQ(render("assertNotAlmostEqual", "x, y"), "assert round(x - y, 7) != 0");
    EXPECT_EQ(render("assertNotAlmostEqual", "x, y, delta=d"), "assert abs(x - y) > d");
    EXPECT_THROW(render("assertAlmostEqual", "x, y, 3, delta=0.1"), RewriteError);
}

TEST_F(AssertionTableTest, DecimalPlacesFollowConfiguration) {
    config_ = TransformConfig::Builder().setDefaultDecimalPlaces(3).build();
    EXPECT_EQ(render("assertAlmostEqual", "a, b"), "assert round(a - b, 3) == 0");
}

TEST_F(AssertionTableTest, MultiLineConditionIsBracketed) {
    EXPECT_EQ(render("assertTrue", "[\n    1,\n]"), "assert ([\n    1,\n])");
}

TEST_F(AssertionTableTest, BindRejectsUnexpressibleCalls) {
    EXPECT_THROW(render("assertEqual", "a"), RewriteError);
    EXPECT_THROW(render("assertEqual", "a, b, c, d"), RewriteError);
    EXPECT_THROW(render("assertEqual", "a, b, note='x'"), RewriteError);
    EXPECT_THROW(render("assertEqual", "*pair"), RewriteError);
    EXPECT_THROW(render("assertEqual", "a, b, first=c"), RewriteError);
    EXPECT_THROW(render("assertSequenceEqual", "a, b, seq_type=list"), RewriteError);
}

TEST_F(AssertionTableTest, KeywordsBindByName) {
    EXPECT_EQ(render("assertEqual", "second=b, first=a"), "assert a == b");
    EXPECT_EQ(render("assertIn", "member=x, container=y"), "assert x in y");
}

TEST_F(AssertionTableTest, RequiredTierDependsOnCallShape) {
    EXPECT_EQ(tierOf("assertEqual", "a, b"), DegradationTier::Essential);
    EXPECT_EQ(tierOf("assertEqual", "a, b, 'msg'"), DegradationTier::Advanced);
    EXPECT_EQ(tierOf("assertEqual", "first=a, second=b"), DegradationTier::Advanced);
    EXPECT_EQ(tierOf("assertTrue", "x"), DegradationTier::Essential);
    EXPECT_EQ(tierOf("assertCountEqual", "a, b"), DegradationTier::Advanced);
    EXPECT_EQ(tierOf("assertDictContainsSubset", "a, b"), DegradationTier::Experimental);
}

TEST_F(AssertionTableTest, ContextFamiliesAreNotTableMethods) {
    EXPECT_EQ(AssertionTable::find("assertRaises"), nullptr);
    EXPECT_EQ(AssertionTable::find("assertLogs"), nullptr);
    EXPECT_EQ(AssertionTable::find("helper"), nullptr);
    ASSERT_NE(AssertionTable::find("assertEquals"), nullptr);
    EXPECT_EQ(AssertionTable::find("assertEquals")->op, "==");
}

}  // namespace Tests
}  // namespace TCE
