#pragma once

#include "analysis/Facts.h"
#include "runtime/DegradationController.h"
#include "runtime/ITransformStage.h"
#include "syntax/SyntaxNode.h"
#include <optional>
#include <string>

namespace TCE {

/**
 * @brief assertRaises/assertWarns family to pytest.raises/pytest.warns
 *
 * Context-manager form:
 * @code
 * with self.assertRaisesRegex(ValueError, "bad") as cm:    with pytest.raises(ValueError, match="bad") as cm:
 *     parse("x")                                       ->      parse("x")
 * self.assertIn("x", str(cm.exception))                    assert "x" in str(cm.value)
 * @endcode
 *
 * Callable form: `self.assertRaises(E, f, *args)` becomes `pytest.raises(E, f, *args)`;
 * the regex variants have no callable form in pytest and are wrapped in a
 * with-block (experimental tier only).
 */
class ExceptionContextRewriter {
public:
    static constexpr const char *FAMILY = "exception-context";

    explicit ExceptionContextRewriter(StageContext &context) : context_(context) {}

    /**
     * @brief True for the raises/warns methods handled here (assertLogs is not)
     */
    static bool handles(const std::string &method);

    /**
     * @brief Rewrite one with-block of function and the alias accesses that follow it
     * @param until Start of the next with-block rebinding the same alias, if any
     * @return Rewritten function, or function itself when the attempt did not apply
     */
    NodePtr rewriteWith(const NodePtr &function, const ExceptionContextFact &fact,
                        const std::optional<SourcePosition> &until);

    /**
     * @brief Rewrite a bare `self.assertRaises(E, f, ...)` call statement
     * @param statement SimpleStatement holding the call as its only small statement
     */
    NodePtr rewriteCallable(const NodePtr &statement, const std::string &method);

private:
    StageContext &context_;
};

}  // namespace TCE
