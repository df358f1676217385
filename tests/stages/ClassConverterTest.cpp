#include "stages/ClassConverter.h"
#include "common/Exceptions.h"
#include "syntax/Parser.h"
#include <gtest/gtest.h>

namespace TCE {
namespace Tests {

class ClassConverterTest : public ::testing::Test {
protected:
    static std::string convert(const std::string &source) {
        NodePtr module = Parser::parse(source);
        return ClassConverter::convert(module->getChild(0))->render();
    }

    static std::string failure(const std::string &source) {
        try {
            convert(source);
        } catch (const RewriteError &e) {
            return e.what();
        }
        return "";
    }
};

TEST_F(ClassConverterTest, SetUpAndTearDownMergeIntoYieldFixture) {
    EXPECT_EQ(convert("class TestDb(unittest.TestCase):\n"
                      "    def setUp(self):\n"
                      "        super().setUp()\n"
                      "        self.db = connect()\n"
                      "\n"
                      "    def tearDown(self):\n"
                      "        self.db.close()\n"
                      "\n"
                      "    def test_query(self):\n"
                      "        assert self.db.query()\n"),
              "class TestDb:\n"
              "    @pytest.fixture(autouse=True)\n"
              "    def setup_method(self):\n"
              "        self.db = connect()\n"
              "        yield\n"
              "        self.db.close()\n"
              "\n"
              "    def test_query(self):\n"
              "        assert self.db.query()\n");
}

TEST_F(ClassConverterTest, TearDownAloneYieldsFirst) {
    EXPECT_EQ(convert("class TestFiles(unittest.TestCase):\n"
                      "    def tearDown(self):\n"
                      "        cleanup()\n"),
              "class TestFiles:\n"
              "    @pytest.fixture(autouse=True)\n"
              "    def setup_method(self):\n"
              "        yield\n"
              "        cleanup()\n");
}

TEST_F(ClassConverterTest, SuperOnlySetUpKeepsYield) {
    EXPECT_EQ(convert("class TestA(unittest.TestCase):\n"
                      "    def setUp(self):\n"
                      "        super().setUp()\n"),
              "class TestA:\n"
              "    @pytest.fixture(autouse=True)\n"
              "    def setup_method(self):\n"
              "        yield\n");
}

TEST_F(ClassConverterTest, ClassHooksAreRenamed) {
    EXPECT_EQ(convert("class TestShared(unittest.TestCase):\n"
                      "    @classmethod\n"
                      "    def setUpClass(cls):\n"
                      "        cls.shared = build()\n"
                      "\n"
                      "    @classmethod\n"
                      "    def tearDownClass(cls):\n"
                      "        super().tearDownClass()\n"
                      "        cls.shared.close()\n"),
              "class TestShared:\n"
              "    @classmethod\n"
              "    def setup_class(cls):\n"
              "        cls.shared = build()\n"
              "\n"
              "    @classmethod\n"
              "    def teardown_class(cls):\n"
              "        cls.shared.close()\n");
}

TEST_F(ClassConverterTest, ResidualTestCaseMembersBlockConversion) {
    EXPECT_EQ(failure("class TestA(unittest.TestCase):\n"
                      "    def test_a(self):\n"
                      "        self.assertEqual(1, 1)\n"
                      "        self.addCleanup(close)\n"),
              "class still uses TestCase members: addCleanup, assertEqual");
}

TEST_F(ClassConverterTest, HookShapesThatCannotBecomeFixtures) {
    EXPECT_EQ(failure("class TestA(unittest.TestCase):\n"
                      "    async def setUp(self):\n"
                      "        pass\n"),
              "setUp is async");
    EXPECT_EQ(failure("class TestA(unittest.TestCase):\n"
                      "    @classmethod\n"
                      "    async def setUpClass(cls):\n"
                      "        pass\n"),
              "setUpClass is async");
    EXPECT_EQ(failure("class TestA(unittest.TestCase):\n"
                      "    def setUp(self, extra=None):\n"
                      "        pass\n"),
              "setUp takes extra parameters");
    EXPECT_EQ(failure("class TestA(unittest.TestCase):\n"
                      "    def setUp(self):\n"
                      "        if ready:\n"
                      "            return\n"
                      "        prepare()\n"),
              "setUp returns early");
    EXPECT_EQ(failure("class TestA(unittest.TestCase):\n"
                      "    def setUpClass(cls):\n"
                      "        pass\n"),
              "setUpClass is not a plain classmethod");
}

TEST_F(ClassConverterTest, ExistingPytestHooksBlockConversion) {
    EXPECT_EQ(failure("class TestA(unittest.TestCase):\n"
                      "    def setup_method(self):\n"
                      "        pass\n"),
              "class already defines setup_method");
}

TEST_F(ClassConverterTest, ClassWithoutHooksOnlyLosesItsBase) {
    EXPECT_EQ(convert("class TestA(unittest.TestCase):  # cases\n"
                      "    value = 1\n"),
              "class TestA:  # cases\n"
              "    value = 1\n");
}

TEST_F(ClassConverterTest, PytestHookNames) {
    EXPECT_EQ(ClassConverter::pytestHookName("setUpClass"), "setup_class");
    EXPECT_EQ(ClassConverter::pytestHookName("tearDownModule"), "teardown_module");
    EXPECT_EQ(ClassConverter::pytestHookName("tearDown"), ClassConverter::SETUP_METHOD);
    EXPECT_EQ(ClassConverter::pytestHookName("helper"), "");
}

}  // namespace Tests
}  // namespace TCE
