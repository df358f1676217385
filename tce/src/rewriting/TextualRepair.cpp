#include "rewriting/TextualRepair.h"
#include "common/Logger.h"
#include "rewriting/RewriteHelper.h"

namespace TCE {

RewriteFunction TextualRepair::relocatingComments(RewriteFunction rewrite) {
    return [rewrite = std::move(rewrite)](const NodePtr &original) {
        NodePtr result = rewrite(original);
        std::vector<std::string> lost = RewriteHelper::lostComments(original, result);
        if (lost.empty()) {
            return result;
        }
        LOG_DEBUG("TextualRepair: relocating {} comment(s)", lost.size());
        return RewriteHelper::prependComments(result, lost);
    };
}

}  // namespace TCE
