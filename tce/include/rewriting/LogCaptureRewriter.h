#pragma once

#include "analysis/Facts.h"
#include "runtime/DegradationController.h"
#include "syntax/SyntaxNode.h"
#include <optional>
#include <string>

namespace TCE {

/**
 * @brief assertLogs/assertNoLogs blocks to the caplog fixture
 *
 * `with self.assertLogs("app", level="WARNING") as cm:` becomes
 * `with caplog.at_level("WARNING", logger="app"):` followed by
 * `assert caplog.records`. `cm.output` becomes a list of
 * "LEVEL:logger:message" strings built from `caplog.records`, `cm.records`
 * reads `caplog.records`, and the test gains a `caplog` parameter.
 * assertNoLogs (experimental) is followed by `assert not caplog.records`.
 */
class LogCaptureRewriter {
public:
    static constexpr const char *FAMILY = "log-capture";
    static constexpr const char *FIXTURE = "caplog";

    static bool handles(const std::string &method);

    /**
     * @brief Rewrite one with-block, its alias accesses and the test signature
     * @param until Start of the next with-block rebinding the same alias, if any
     */
    static AttemptResult rewriteWith(const NodePtr &function, const ExceptionContextFact &fact,
                                     const std::optional<SourcePosition> &until, DegradationController &controller);
};

}  // namespace TCE
