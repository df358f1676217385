#pragma once

#include "analysis/Facts.h"
#include "model/TransformConfig.h"
#include "runtime/DegradationController.h"
#include "syntax/SyntaxNode.h"
#include <optional>
#include <string>
#include <vector>

namespace TCE {

/**
 * @brief Lowers a per-element assertion loop into @pytest.mark.parametrize
 *
 * @code
 * def test_positive(self):                      @pytest.mark.parametrize("item", [1, 2, 3], ids=["1", "2", "3"])
 *     for item in [1, 2, 3]:               ->   def test_positive(self, item):
 *         self.assertTrue(item > 0)                 assert item > 0
 * @endcode
 *
 * Only the last statement of a test can be lowered, and only when it is a
 * for-loop over literal data (a list or tuple display, range() of integer
 * literals, or a name bound once to such a display) that carries no state
 * between iterations. A body wrapped in `with self.subTest(...)` is
 * unwrapped.
 */
class LoopParametrizeRewriter {
public:
    static constexpr const char *FAMILY = "loop-parametrize";

    LoopParametrizeRewriter(const NodePtr &module, const TransformConfig &config) : module_(module), config_(config) {}

    /**
     * @brief For-loops whose body asserts, over literal data or carrying state between iterations
     */
    static bool matches(const LoopFact &loop);

    /**
     * @brief Why a matched loop must stay a loop, or std::nullopt when it can be lowered
     */
    std::optional<std::string> ambiguity(const NodePtr &function, const NodePtr &loop, const LoopFact &fact) const;

    /**
     * @brief Lower the loop at fact.position, which must be the function's last statement
     */
    AttemptResult lower(const NodePtr &function, const LoopFact &fact, DegradationController &controller) const;

    /**
     * @brief Names bound by a loop target (a name or a flat tuple of names), empty otherwise
     */
    static std::vector<std::string> targetNames(const NodePtr &loop);

    /**
     * @brief pytest id for one parameter value
     */
    static std::string caseId(const NodePtr &element);

private:
    struct CaseData {
        std::string argvalues;      // source of the argvalues argument
        NodeList elements;          // literal elements, empty for range()
        size_t rangeCount = 0;      // case count for range()
        bool isRange = false;
    };

    CaseData caseData(const NodePtr &function, const NodePtr &loop, const LoopFact &fact) const;
    NodePtr literalBinding(const NodePtr &function, const NodePtr &loop, const std::string &name,
                           bool &moduleLevel) const;
    std::string annotationFor(const CaseData &data, size_t position, size_t width) const;

    NodePtr module_;
    const TransformConfig &config_;
};

}  // namespace TCE
