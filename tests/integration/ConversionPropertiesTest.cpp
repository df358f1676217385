#include "common/TestUtils.h"
#include "mocks/MockRewriteInterceptor.h"
#include "runtime/PipelineDriver.h"
#include <gtest/gtest.h>
#include <memory>

namespace TCE {
namespace Tests {

using Test::Utils::transform;

namespace {

const std::string CALCULATOR = "\"\"\"Tests for the calculator.\"\"\"\n"
                               "import unittest\n"
                               "\n"
                               "from calc import Calculator\n"
                               "\n"
                               "\n"
                               "class TestCalculator(unittest.TestCase):\n"
                               "    def setUp(self):\n"
                               "        self.calc = Calculator()\n"
                               "\n"
                               "    def test_add(self):\n"
                               "        self.assertEqual(self.calc.add(1, 2), 3)\n"
                               "\n"
                               "    def test_divide_by_zero(self):\n"
                               "        with self.assertRaises(ZeroDivisionError):\n"
                               "            self.calc.divide(1, 0)\n"
                               "\n"
                               "    @unittest.skipIf(SLOW, \"slow\")\n"
                               "    def test_many(self):\n"
                               "        for value in [1, 2]:\n"
                               "            self.assertGreater(self.calc.add(value, 1), value)\n"
                               "\n"
                               "\n"
                               "if __name__ == \"__main__\":\n"
                               "    unittest.main()\n";

const std::vector<std::string> CORPUS = {
    CALCULATOR,
    "import unittest\n"
    "\n"
    "\n"
    "class TestLogs(unittest.TestCase):\n"
    "    def test_warns(self):\n"
    "        with self.assertLogs(\"app\", level=\"WARNING\") as cm:\n"
    "            emit()\n"
    "        self.assertEqual(len(cm.records), 1, \"one record\")\n"
    "\n"
    "    def test_quiet(self):\n"
    "        with self.assertNoLogs(\"app\"):\n"
    "            emit()\n",
    "import unittest\n"
    "\n"
    "\n"
    "class TestSums(unittest.TestCase):\n"
    "    def test_sum(self):\n"
    "        total = 0\n"
    "        for value in [1, 2, 3]:\n"
    "            total += value\n"
    "            self.assertLessEqual(value, total)\n"
    "\n"
    "    def test_regex(self):\n"
    "        self.assertRaisesRegex(ValueError, \"bad\", parse, \"x\")\n"
    "        self.assertAlmostEqual(0.1 + 0.2, 0.3)\n",
    "import unittest\n"
    "\n"
    "\n"
    "class Helpers(unittest.TestCase):\n"
    "    def test_shape(self):\n"
    "        self.assertIsInstance(make(), dict)\n"
    "        self.assertDictContainsSubset({'a': 1}, make())\n",
};

}  // namespace

class ConversionPropertiesTest : public ::testing::Test {
protected:
    static size_t applied(const UnitResult &result) {
        return result.ledger.count(LedgerOutcome::Applied);
    }
};

TEST_F(ConversionPropertiesTest, RealisticUnitConvertsCompletely) {
    UnitResult result = transform(CALCULATOR);

    ASSERT_EQ(result.status, UnitStatus::Complete);
    EXPECT_EQ(*result.outputText, "\"\"\"Tests for the calculator.\"\"\"\n"
                                  "\n"
                                  "from calc import Calculator\n"
                                  "import pytest\n"
                                  "\n"
                                  "\n"
                                  "class TestCalculator:\n"
                                  "    @pytest.fixture(autouse=True)\n"
                                  "    def setup_method(self):\n"
                                  "        self.calc = Calculator()\n"
                                  "        yield\n"
                                  "\n"
                                  "    def test_add(self):\n"
                                  "        assert self.calc.add(1, 2) == 3\n"
                                  "\n"
                                  "    def test_divide_by_zero(self):\n"
                                  "        with pytest.raises(ZeroDivisionError):\n"
                                  "            self.calc.divide(1, 0)\n"
                                  "\n"
                                  "    @pytest.mark.skipif(SLOW, reason=\"slow\")\n"
                                  "    @pytest.mark.parametrize(\"value\", [1, 2], ids=[\"1\", \"2\"])\n"
                                  "    def test_many(self, value):\n"
                                  "        assert self.calc.add(value, 1) > value\n"
                                  "\n"
                                  "\n"
                                  "if __name__ == \"__main__\":\n"
                                  "    pytest.main()\n");
}

TEST_F(ConversionPropertiesTest, EveryOutputParsesAndIsAFixedPoint) {
    for (auto tier : {DegradationTier::Essential, DegradationTier::Advanced, DegradationTier::Experimental}) {
        for (const auto &source : CORPUS) {
            SCOPED_TRACE(tierToString(tier) + "\n" + source);
            UnitResult first = transform(source, tier);
            ASSERT_TRUE(first.isSuccess());
            EXPECT_NO_THROW(Parser::parse(*first.outputText));

            UnitResult second = transform(*first.outputText, tier);
            ASSERT_TRUE(second.isSuccess());
            EXPECT_EQ(*second.outputText, *first.outputText);
            EXPECT_EQ(applied(second), 0u);
        }
    }
}

TEST_F(ConversionPropertiesTest, HigherTiersNeverApplyLess) {
    for (const auto &source : CORPUS) {
        SCOPED_TRACE(source);
        size_t essential = applied(transform(source, DegradationTier::Essential));
        size_t advanced = applied(transform(source, DegradationTier::Advanced));
        size_t experimental = applied(transform(source, DegradationTier::Experimental));
        EXPECT_LE(essential, advanced);
        EXPECT_LE(advanced, experimental);
    }
}

TEST_F(ConversionPropertiesTest, UnrelatedSourcesAreUntouched) {
    const std::vector<std::string> sources = {
        "",
        "# just a comment\n",
        "import os\n\n\ndef main():\n    print(os.getcwd())  # cwd\n",
        "class Config:\n    def assertValid(self):\n        return True\n",
        "def test_plain():\n    assert 1 + 1 == 2\n",
    };
    for (const auto &source : sources) {
        SCOPED_TRACE(source);
        UnitResult result = transform(source, DegradationTier::Experimental);
        EXPECT_EQ(result.status, UnitStatus::Complete);
        EXPECT_EQ(*result.outputText, source);
        EXPECT_TRUE(result.ledger.empty());
    }
}

TEST_F(ConversionPropertiesTest, AccumulatingLoopsAreNeverParametrized) {
    UnitResult result = transform(CORPUS[2], DegradationTier::Experimental);

    ASSERT_TRUE(result.outputText.has_value());
    EXPECT_EQ(result.outputText->find("parametrize"), std::string::npos);
    EXPECT_NE(result.outputText->find("        for value in [1, 2, 3]:\n"
                                      "            total += value\n"),
              std::string::npos);
}

TEST_F(ConversionPropertiesTest, InjectedFailureOnlyAffectsItsLine) {
    const std::string source = "import unittest\n"
                               "\n"
                               "\n"
                               "class TestA(unittest.TestCase):\n"
                               "    def test_a(self):\n"
                               "        self.assertEqual(a, 1)\n"
                               "        self.assertTrue(b)\n"
                               "        self.assertIn(c, d)\n";
    auto config = TransformConfig::Builder().setKeepLegacyClassStructure(true).build();
    PipelineDriver driver;
    driver.setInterceptor(
        std::make_shared<::TCE::Test::MockRewriteInterceptor>(::TCE::Test::MockRewriteInterceptor::failAtLine("assertion", 7)));

    UnitResult result = driver.transformUnit(source, config, DegradationTier::Advanced);

    EXPECT_EQ(result.status, UnitStatus::Partial);
    EXPECT_EQ(*result.outputText, "import unittest\n"
                                  "\n"
                                  "\n"
                                  "class TestA(unittest.TestCase):\n"
                                  "    def test_a(self):\n"
                                  "        assert a == 1\n"
                                  "        self.assertTrue(b)\n"
                                  "        assert c in d\n");
    EXPECT_EQ(result.ledger.count(LedgerOutcome::FellBackError), 1u);
    EXPECT_EQ(result.ledger.count(LedgerOutcome::Applied), 2u);
}

TEST_F(ConversionPropertiesTest, MalformedInputFails) {
    for (const std::string source : {"class TestA(unittest.TestCase:\n    pass\n", "def f():\nreturn 1\n",
                                     "x = '''unterminated\n"}) {
        SCOPED_TRACE(source);
        UnitResult result = transform(source);
        EXPECT_EQ(result.status, UnitStatus::Failed);
        EXPECT_FALSE(result.outputText.has_value());
        ASSERT_TRUE(result.error.has_value());
        EXPECT_EQ(result.error->kind, UnitError::Kind::Parse);
    }
}

}  // namespace Tests
}  // namespace TCE
