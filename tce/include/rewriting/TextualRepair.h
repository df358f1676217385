#pragma once

#include "runtime/DegradationController.h"

namespace TCE {

/**
 * @brief Repair strategies handed to DegradationController::attempt
 *
 * Only consulted in the experimental tier, after the structural rewrite was
 * rejected.
 */
class TextualRepair {
public:
    /**
     * @brief Run rewrite, then move comments it dropped onto their own lines above the result
     */
    static RewriteFunction relocatingComments(RewriteFunction rewrite);
};

}  // namespace TCE
