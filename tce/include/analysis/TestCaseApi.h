#pragma once

#include "analysis/Facts.h"
#include <string>

namespace TCE::TestCaseApi {

/**
 * @brief setUp/tearDown family names at class scope
 */
bool isClassHookName(const std::string &name);

bool isModuleHookName(const std::string &name);

/**
 * @brief assertRaises/assertWarns/assertLogs family (usable as context managers)
 */
bool isContextMethod(const std::string &name);

/**
 * @brief Assertion-style methods: assert*, fail*, and their deprecated aliases
 */
bool isAssertionMethod(const std::string &name);

/**
 * @brief Any attribute unittest.TestCase provides to instances
 */
bool isTestCaseMember(const std::string &name);

/**
 * @brief Members some rewrite family knows how to replace
 */
bool isConvertedMember(const std::string &name);

/**
 * @brief Attribute of the unittest module a dotted name refers to ("ut.skip" -> "skip"), empty if none
 */
std::string unittestMember(const std::string &dotted, const ImportFact &imports);

/**
 * @brief True for unittest.TestCase reached through the unit's unittest imports
 */
bool isTestCaseBase(const std::string &dottedBase, const ImportFact &imports);

}  // namespace TCE::TestCaseApi
