#include "runtime/CancellationToken.h"
#include "common/Exceptions.h"

namespace TCE {

bool CancellationToken::isExpired() const {
    int64_t deadline = deadlineNanos_.load();
    return deadline != 0 && Clock::now().time_since_epoch().count() >= deadline;
}

void CancellationToken::throwIfCancelled(const std::string &where) const {
    if (isCancelled()) {
        throw UnitCancelled("unit cancelled " + where, false);
    }
    if (isExpired()) {
        throw UnitCancelled("deadline expired " + where, true);
    }
}

}  // namespace TCE
