#include "stages/FixtureStateStage.h"
#include "common/TestUtils.h"
#include <gtest/gtest.h>

namespace TCE {
namespace Tests {

using Test::Utils::entriesOf;
using Test::Utils::hasEntry;
using Test::Utils::transform;

class FixtureStateStageTest : public ::testing::Test {
protected:
    static const json *scope(const UnitResult &result, const std::string &name) {
        for (const auto &entry : result.fixtures) {
            if (entry["name"] == name) {
                return &entry;
            }
        }
        return nullptr;
    }
};

TEST_F(FixtureStateStageTest, HooksBecomeFixtures) {
    UnitResult result = transform("import unittest\n"
                                  "\n"
                                  "\n"
                                  "class TestStore(unittest.TestCase):\n"
                                  "    def setUp(self):\n"
                                  "        self.store = {}\n"
                                  "\n"
                                  "    def tearDown(self):\n"
                                  "        self.store.clear()\n"
                                  "\n"
                                  "    def test_put(self):\n"
                                  "        self.store['a'] = 1\n"
                                  "        self.assertIn('a', self.store)\n");

    ASSERT_EQ(result.status, UnitStatus::Complete);
    EXPECT_EQ(*result.outputText, "import pytest\n"
                                  "\n"
                                  "\n"
                                  "class TestStore:\n"
                                  "    @pytest.fixture(autouse=True)\n"
                                  "    def setup_method(self):\n"
                                  "        self.store = {}\n"
                                  "        yield\n"
                                  "        self.store.clear()\n"
                                  "\n"
                                  "    def test_put(self):\n"
                                  "        self.store['a'] = 1\n"
                                  "        assert 'a' in self.store\n");

    const json *store = scope(result, "TestStore");
    ASSERT_NE(store, nullptr);
    EXPECT_EQ((*store)["kind"], "class");
    EXPECT_EQ((*store)["hookAttributes"], json::array({"store"}));
}

TEST_F(FixtureStateStageTest, ModuleHooksAreRenamed) {
    UnitResult result = transform("import unittest\n"
                                  "\n"
                                  "\n"
                                  "def setUpModule():\n"
                                  "    start()\n"
                                  "\n"
                                  "\n"
                                  "def tearDownModule():\n"
                                  "    stop()\n");

    ASSERT_EQ(result.status, UnitStatus::Complete);
    EXPECT_EQ(*result.outputText, "def setup_module():\n"
                                  "    start()\n"
                                  "\n"
                                  "\n"
                                  "def teardown_module():\n"
                                  "    stop()\n");
    EXPECT_TRUE(hasEntry(result.ledger, FixtureStateStage::FAMILY, LedgerOutcome::Applied,
                         "setUpModule -> setup_module"));
}

TEST_F(FixtureStateStageTest, KeepReasonsAreRecorded) {
    struct Case {
        std::string source;
        std::string reason;
    };
    const std::vector<Case> cases = {
        {"class TestA(Base, unittest.TestCase):\n    def test_a(self):\n        pass\n", "custom base list"},
        {"class MathTests(unittest.TestCase):\n    def test_a(self):\n        pass\n",
         "pytest only collects plain classes named Test*"},
        {"class TestA(unittest.TestCase):\n    def __init__(self, name):\n        super().__init__(name)\n",
         "class defines __init__"},
        {"class TestA(unittest.TestCase):\n    def test_a(self):\n        self.addCleanup(close)\n",
         "uses unittest.TestCase API: addCleanup"},
        {"class TestBase(unittest.TestCase):\n    pass\n\n\nclass TestChild(TestBase):\n    pass\n",
         "class is subclassed in this module"},
    };
    for (const auto &c : cases) {
        SCOPED_TRACE(c.source);
        UnitResult result = transform("import unittest\n\n\n" + c.source);
        EXPECT_EQ(result.status, UnitStatus::Partial);
        EXPECT_TRUE(hasEntry(result.ledger, FixtureStateStage::FAMILY, LedgerOutcome::SkippedAmbiguous, c.reason));
        EXPECT_NE(result.outputText->find("import unittest\n"), std::string::npos);
    }
}

TEST_F(FixtureStateStageTest, EssentialTierKeepsClasses) {
    UnitResult result = transform("import unittest\n"
                                  "\n"
                                  "\n"
                                  "class TestA(unittest.TestCase):\n"
                                  "    def test_a(self):\n"
                                  "        self.assertTrue(ok)\n",
                                  DegradationTier::Essential);

    EXPECT_EQ(result.status, UnitStatus::Partial);
    EXPECT_TRUE(hasEntry(result.ledger, FixtureStateStage::FAMILY, LedgerOutcome::SkippedAmbiguous,
                         "requires advanced tier"));
    EXPECT_EQ(*result.outputText, "import unittest\n"
                                  "\n"
                                  "\n"
                                  "class TestA(unittest.TestCase):\n"
                                  "    def test_a(self):\n"
                                  "        assert ok\n");
}

TEST_F(FixtureStateStageTest, LegacyStructureIsNotReportedAsSkipped) {
    auto config = TransformConfig::Builder().setKeepLegacyClassStructure(true).build();
    UnitResult result = transform("import unittest\n"
                                  "\n"
                                  "\n"
                                  "class TestA(unittest.TestCase):\n"
                                  "    def test_a(self):\n"
                                  "        self.assertTrue(ok)\n",
                                  DegradationTier::Advanced, config);

    EXPECT_EQ(result.status, UnitStatus::Complete);
    EXPECT_TRUE(entriesOf(result.ledger, FixtureStateStage::FAMILY).empty());
    EXPECT_NE(result.outputText->find("class TestA(unittest.TestCase):"), std::string::npos);
}

TEST_F(FixtureStateStageTest, FailedConversionFallsBack) {
    UnitResult result = transform("import unittest\n"
                                  "\n"
                                  "\n"
                                  "class TestA(unittest.TestCase):\n"
                                  "    def setUp(self, extra=None):\n"
                                  "        self.value = extra\n"
                                  "\n"
                                  "    def test_a(self):\n"
                                  "        self.assertIsNone(self.value)\n");

    EXPECT_EQ(result.status, UnitStatus::Partial);
    EXPECT_TRUE(hasEntry(result.ledger, FixtureStateStage::FAMILY, LedgerOutcome::FellBackError,
                         "setUp takes extra parameters"));
    EXPECT_NE(result.outputText->find("        assert self.value is None\n"), std::string::npos);
}

}  // namespace Tests
}  // namespace TCE
