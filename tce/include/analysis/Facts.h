#pragma once

#include "common/SourceLocation.h"
#include "model/DegradationTier.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace TCE {

// Scope name used for module-level functions and hooks
inline const std::string MODULE_SCOPE = "<module>";

/**
 * @brief A function at module scope or a method of a class
 */
struct FunctionFact {
    std::string name;
    std::string scope;  // owning class qualified name or MODULE_SCOPE
    bool isTest = false;
    bool hasCustomPrefix = false;  // test matched only through a non-default prefix
    bool isAsync = false;
    std::vector<std::string> parameters;
    SourceRange range;

    std::string qualifiedName() const {
        return scope == MODULE_SCOPE ? name : scope + "." + name;
    }
};

/**
 * @brief setUp/tearDown style hook at class or module scope
 */
struct HookFact {
    std::string name;
    std::string scope;
    bool isClassScope = false;
    bool callsSuper = false;
    std::set<std::string> assignedAttributes;  // self.<attr> = ... in the hook body
    SourceRange range;
};

enum class IterableKind { LiteralSequence, Range, LiteralName, Other };

/**
 * @brief A for/while loop inside a function
 */
struct LoopFact {
    SourcePosition position;
    std::string function;  // qualified name of the enclosing function
    bool isWhile = false;
    bool isAsync = false;
    bool hasAssertion = false;
    bool hasBreakOrContinue = false;
    bool hasElse = false;
    bool usesSubTest = false;
    IterableKind iterableKind = IterableKind::Other;
    std::set<std::string> accumulators;  // state carried across iterations

    bool hasAccumulator() const {
        return !accumulators.empty();
    }
};

/**
 * @brief with-block using an assertRaises/assertWarns/assertLogs family context manager
 */
struct ExceptionContextFact {
    SourcePosition position;
    std::string function;
    std::string method;  // assertRaises, assertLogs, ...
    std::string alias;   // bound name, "self.cm" for attribute targets, empty when unbound
    bool aliasIsAttribute = false;
    int nestingDepth = 0;  // number of enclosing context-manager assertions
    size_t itemCount = 1;
    bool hasMsgKeyword = false;
};

/**
 * @brief A class definition and its relation to unittest.TestCase
 */
struct ClassFact {
    std::string name;
    std::string qualifiedName;
    std::vector<std::string> bases;  // dotted base names in order
    bool hasKeywords = false;        // metaclass=... and similar
    bool derivesFromTestCase = false;
    bool isNested = false;
    bool subclassedInModule = false;
    SourceRange range;

    /**
     * @brief unittest.TestCase is the only base
     */
    bool hasSoleTestCaseBase() const {
        return derivesFromTestCase && bases.size() == 1 && !hasKeywords;
    }
};

/**
 * @brief How the unit imports the modules rewrites depend on
 */
struct ImportFact {
    bool importsUnittest = false;                // import unittest
    std::set<std::string> unittestAliases;       // names bound to the unittest module
    std::map<std::string, std::string> fromUnittestNames;  // bound name -> name imported from unittest
    bool importsPytest = false;
    bool importsRe = false;
};

struct ComplexityFact {
    int score = 0;
    DegradationTier recommendedTier = DegradationTier::Advanced;
    std::vector<std::string> reasons;
};

/**
 * @brief Shape a pass could not classify
 */
struct UnsupportedFact {
    std::string pass;
    std::string detail;
};

}  // namespace TCE
