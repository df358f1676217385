#include "analysis/TestCaseApi.h"
#include "common/StringUtils.h"
#include <set>

namespace TCE::TestCaseApi {

namespace {

const std::set<std::string> CLASS_HOOKS = {"setUp", "tearDown", "setUpClass", "tearDownClass", "asyncSetUp",
                                           "asyncTearDown"};

const std::set<std::string> MODULE_HOOKS = {"setUpModule", "tearDownModule"};

const std::set<std::string> CONTEXT_METHODS = {"assertRaises", "assertRaisesRegex", "assertRaisesRegexp",
                                               "assertWarns",  "assertWarnsRegex",  "assertLogs",
                                               "assertNoLogs"};

const std::set<std::string> CONVERTED_ASSERTIONS = {
    "assertEqual",        "assertEquals",        "failUnlessEqual",     "assertNotEqual",   "assertNotEquals",
    "failIfEqual",        "assertTrue",          "failUnless",          "assert_",          "assertFalse",
    "failIf",             "assertIs",            "assertIsNot",         "assertIsNone",     "assertIsNotNone",
    "assertIn",           "assertNotIn",         "assertIsInstance",    "assertNotIsInstance",
    "assertGreater",      "assertGreaterEqual",  "assertLess",          "assertLessEqual",  "assertListEqual",
    "assertTupleEqual",   "assertSetEqual",      "assertDictEqual",     "assertSequenceEqual",
    "assertMultiLineEqual", "assertCountEqual",  "assertItemsEqual",    "assertRegex",      "assertRegexpMatches",
    "assertNotRegex",     "assertNotRegexpMatches", "assertAlmostEqual", "assertAlmostEquals",
    "assertNotAlmostEqual", "assertNotAlmostEquals", "assertDictContainsSubset", "fail"};

const std::set<std::string> OTHER_MEMBERS = {"skipTest",
                                             "subTest",
                                             "addCleanup",
                                             "doCleanups",
                                             "addClassCleanup",
                                             "doClassCleanups",
                                             "enterContext",
                                             "enterClassContext",
                                             "maxDiff",
                                             "longMessage",
                                             "failureException",
                                             "id",
                                             "shortDescription",
                                             "addTypeEqualityFunc",
                                             "run",
                                             "debug",
                                             "countTestCases",
                                             "defaultTestResult",
                                             "_testMethodName",
                                             "_outcome"};

}  // namespace

bool isClassHookName(const std::string &name) {
    return CLASS_HOOKS.count(name) > 0;
}

bool isModuleHookName(const std::string &name) {
    return MODULE_HOOKS.count(name) > 0;
}

bool isContextMethod(const std::string &name) {
    return CONTEXT_METHODS.count(name) > 0;
}

bool isAssertionMethod(const std::string &name) {
    return (startsWith(name, "assert") || startsWith(name, "fail")) && name != "failureException";
}

bool isTestCaseMember(const std::string &name) {
    return isAssertionMethod(name) || OTHER_MEMBERS.count(name) > 0 || CLASS_HOOKS.count(name) > 0;
}

bool isConvertedMember(const std::string &name) {
    return CONVERTED_ASSERTIONS.count(name) > 0 || CONTEXT_METHODS.count(name) > 0 || name == "skipTest" ||
           name == "subTest" || CLASS_HOOKS.count(name) > 0;
}

std::string unittestMember(const std::string &dotted, const ImportFact &imports) {
    size_t dot = dotted.rfind('.');
    if (dot == std::string::npos) {
        auto it = imports.fromUnittestNames.find(dotted);
        return it == imports.fromUnittestNames.end() ? "" : it->second;
    }
    return imports.unittestAliases.count(dotted.substr(0, dot)) > 0 ? dotted.substr(dot + 1) : "";
}

bool isTestCaseBase(const std::string &dottedBase, const ImportFact &imports) {
    return dottedBase == "unittest.TestCase" || unittestMember(dottedBase, imports) == "TestCase";
}

}  // namespace TCE::TestCaseApi
