#pragma once

#include "model/DegradationTier.h"
#include "model/TransformConfig.h"
#include "syntax/SyntaxHelper.h"
#include <string>
#include <vector>

namespace TCE {

/**
 * @brief How an assertion method maps to a pytest statement
 */
struct AssertionShape {
    enum class Kind {
        Compare,        // a <op> b
        Truth,          // x
        Falsity,        // not x
        IsNone,         // x is None
        IsNotNone,      // x is not None
        IsInstance,     // isinstance(a, b)
        NotIsInstance,  // not isinstance(a, b)
        CountEqual,     // sorted(a) == sorted(b)
        Regex,          // re.search(pattern, text)
        NotRegex,       // not re.search(pattern, text)
        AlmostEqual,    // round(a - b, places) == 0 / abs(a - b) <= delta
        NotAlmostEqual, // round(a - b, places) != 0 / abs(a - b) > delta
        DictContainsSubset,
        Fail,           // pytest.fail(msg)
        Skip            // pytest.skip(reason)
    };

    Kind kind;
    std::string op;                       // Compare only
    std::vector<std::string> parameters;  // unittest parameter names, in positional order
    DegradationTier tier;                 // tier of the plain form (no message, no keywords)
};

/**
 * @brief A call bound to the parameters of an assertion method
 */
struct BoundAssertion {
    const AssertionShape *shape = nullptr;
    std::vector<NodePtr> values;  // per parameter, nullptr when not passed
    bool usedKeywords = false;

    NodePtr value(const std::string &parameter) const;
};

/**
 * @brief unittest assertion methods and their pytest rendering
 *
 * Only methods listed here are rewritten; the context-manager family
 * (assertRaises, assertLogs, ...) is handled by the context rewriters.
 */
class AssertionTable {
public:
    /**
     * @brief Shape of a method, or nullptr when the method is not converted
     */
    static const AssertionShape *find(const std::string &method);

    /**
     * @brief Bind call arguments to the method's parameters
     * @throws RewriteError on star arguments, unknown keywords or a wrong argument count
     */
    static BoundAssertion bind(const AssertionShape &shape, const std::vector<SyntaxHelper::CallArgument> &arguments);

    /**
     * @brief Lowest tier allowed to rewrite this call
     *
     * A message, keyword or star arguments lift an essential shape to
     * advanced. Decided from the call alone, before binding.
     */
    static DegradationTier requiredTier(const AssertionShape &shape,
                                        const std::vector<SyntaxHelper::CallArgument> &arguments);

    /**
     * @brief Small statement text replacing the call
     * @throws RewriteError when the arguments cannot be expressed (delta together with places)
     */
    static std::string render(const BoundAssertion &bound, const TransformConfig &config);
};

}  // namespace TCE
