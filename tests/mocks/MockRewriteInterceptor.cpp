#include "mocks/MockRewriteInterceptor.h"
#include <stdexcept>

namespace TCE {
namespace Test {

MockRewriteInterceptor::MockRewriteInterceptor(Predicate failWhen) : failWhen_(std::move(failWhen)) {}

void MockRewriteInterceptor::beforeAttempt(const RewriteRequest &request) {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_.push_back(request);
    if (failWhen_ && failWhen_(request)) {
        ++injectedFailures_;
        throw std::runtime_error("injected failure for " + request.family);
    }
}

void MockRewriteInterceptor::afterAttempt(const RewriteRequest &request, LedgerOutcome outcome) {
    (void)request;
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(outcome);
}

std::vector<RewriteRequest> MockRewriteInterceptor::getAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

std::vector<LedgerOutcome> MockRewriteInterceptor::getOutcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

size_t MockRewriteInterceptor::getInjectedFailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return injectedFailures_;
}

void MockRewriteInterceptor::setFailWhen(Predicate failWhen) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWhen_ = std::move(failWhen);
}

MockRewriteInterceptor::Predicate MockRewriteInterceptor::failFamily(const std::string &family) {
    return [family](const RewriteRequest &request) { return request.family == family; };
}

MockRewriteInterceptor::Predicate MockRewriteInterceptor::failAtLine(const std::string &family, int line) {
    return [family, line](const RewriteRequest &request) {
        return request.family == family && request.range.start.line == line;
    };
}

}  // namespace Test
}  // namespace TCE
