#include "runtime/DegradationController.h"
#include "common/Exceptions.h"
#include "mocks/MockRewriteInterceptor.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/TreeEditor.h"
#include <gtest/gtest.h>

namespace TCE {
namespace Tests {

class DegradationControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        original_ = SyntaxFactory::parseStatement("x = 1  # keep\n", "");
    }

    static RewriteRequest request(DegradationTier required = DegradationTier::Essential) {
        RewriteRequest req;
        req.family = "assertion";
        req.range = SourceRange{{4, 9}, {4, 30}};
        req.requiredTier = required;
        req.description = "x becomes 2";
        return req;
    }

    static NodePtr rewriteToTwo(const NodePtr &) {
        return SyntaxFactory::parseStatement("x = 2  # keep\n", "");
    }

    ChangeLedger ledger_;
    NodePtr original_;
};

TEST_F(DegradationControllerTest, AppliedRewriteIsRecorded) {
    DegradationController controller(DegradationTier::Advanced, ledger_);

    AttemptResult result = controller.attempt(request(), original_, rewriteToTwo);

    EXPECT_TRUE(result.applied());
    EXPECT_EQ(result.node->render(), "x = 2  # keep\n");
    ASSERT_EQ(ledger_.size(), 1u);
    EXPECT_EQ(ledger_.getEntries()[0].outcome, LedgerOutcome::Applied);
    EXPECT_EQ(ledger_.getEntries()[0].reason, "x becomes 2");
    EXPECT_EQ(ledger_.getEntries()[0].range.start.line, 4);
}

TEST_F(DegradationControllerTest, FamilyAboveTierIsSkippedWithoutRunning) {
    DegradationController controller(DegradationTier::Essential, ledger_);
    bool called = false;

    AttemptResult result = controller.attempt(request(DegradationTier::Advanced), original_, [&](const NodePtr &node) {
        called = true;
        return rewriteToTwo(node);
    });

    EXPECT_FALSE(called);
    EXPECT_EQ(result.outcome, LedgerOutcome::SkippedAmbiguous);
    EXPECT_EQ(result.node, original_);
    EXPECT_EQ(ledger_.getEntries()[0].reason, "requires advanced tier: x becomes 2");
}

TEST_F(DegradationControllerTest, RewriteErrorFallsBackToOriginal) {
    DegradationController controller(DegradationTier::Advanced, ledger_);

    AttemptResult result = controller.attempt(request(), original_, [](const NodePtr &) -> NodePtr {
        throw RewriteError("unsupported shape");
    });

    EXPECT_EQ(result.outcome, LedgerOutcome::FellBackError);
    EXPECT_EQ(result.node, original_);
    EXPECT_EQ(ledger_.getEntries()[0].reason, "rewrite: unsupported shape");
}

TEST_F(DegradationControllerTest, UnchangedOrMissingResultIsAFailure) {
    DegradationController controller(DegradationTier::Advanced, ledger_);

    controller.attempt(request(), original_, [](const NodePtr &node) { return node; });
    controller.attempt(request(), original_, [](const NodePtr &) { return NodePtr(); });

    ASSERT_EQ(ledger_.size(), 2u);
    EXPECT_EQ(ledger_.getEntries()[0].reason, "rewrite: rewrite made no change");
    EXPECT_EQ(ledger_.getEntries()[1].reason, "rewrite: rewrite produced no node");
}

TEST_F(DegradationControllerTest, OutputThatDoesNotParseIsRejected) {
    DegradationController controller(DegradationTier::Advanced, ledger_);
    NodePtr literal = original_->getChild(0)->getChild(2);
    ASSERT_TRUE(literal->is(SyntaxKind::Literal));

    AttemptResult result = controller.attempt(request(), original_, [&](const NodePtr &node) {
        return TreeEditor::replaceNode(node, literal->getChild(0).get(),
                                       TreeEditor::withTokenText(literal->getChild(0), "("));
    });

    EXPECT_EQ(result.outcome, LedgerOutcome::FellBackError);
    EXPECT_TRUE(ledger_.getEntries()[0].reason.starts_with("invalid-output: "));
}

TEST_F(DegradationControllerTest, DroppedCommentsAreRejectedUnlessAllowed) {
    DegradationController controller(DegradationTier::Advanced, ledger_);
    auto dropComment = [](const NodePtr &) { return SyntaxFactory::parseStatement("x = 2\n", ""); };

    AttemptResult strict = controller.attempt(request(), original_, dropComment);
    EXPECT_EQ(strict.outcome, LedgerOutcome::FellBackError);
    EXPECT_EQ(ledger_.getEntries()[0].reason, "rewrite: rewrite would drop 1 comment(s)");

    RewriteRequest lenient = request();
    lenient.preserveComments = false;
    EXPECT_TRUE(controller.attempt(lenient, original_, dropComment).applied());
}

TEST_F(DegradationControllerTest, RepairRunsOnlyInExperimentalTier) {
    auto failing = [](const NodePtr &) -> NodePtr { throw RewriteError("no structural rewrite"); };

    DegradationController advanced(DegradationTier::Advanced, ledger_);
    EXPECT_EQ(advanced.attempt(request(), original_, failing, rewriteToTwo).outcome, LedgerOutcome::FellBackError);

    DegradationController experimental(DegradationTier::Experimental, ledger_);
    AttemptResult repaired = experimental.attempt(request(), original_, failing, rewriteToTwo);
    EXPECT_TRUE(repaired.applied());
    EXPECT_EQ(ledger_.getEntries()[1].reason, "x becomes 2 (textual repair)");
}

TEST_F(DegradationControllerTest, FailedRepairReportsBothFailures) {
    DegradationController controller(DegradationTier::Experimental, ledger_);
    auto failing = [](const NodePtr &) -> NodePtr { throw RewriteError("first"); };
    auto failingRepair = [](const NodePtr &) -> NodePtr { throw RewriteError("second"); };

    controller.attempt(request(), original_, failing, failingRepair);

    EXPECT_EQ(ledger_.getEntries()[0].reason, "rewrite: first; repair failed: rewrite: second");
}

TEST_F(DegradationControllerTest, InvariantViolationPropagates) {
    DegradationController controller(DegradationTier::Advanced, ledger_);
    EXPECT_THROW(controller.attempt(request(), original_,
                                    [](const NodePtr &) -> NodePtr { throw InvariantViolation("broken tree"); }),
                 InvariantViolation);
}

TEST_F(DegradationControllerTest, InterceptorFailureIsAFallback) {
    ::TCE::Test::MockRewriteInterceptor interceptor(::TCE::Test::MockRewriteInterceptor::failFamily("assertion"));
    DegradationController controller(DegradationTier::Advanced, ledger_, &interceptor);
    bool called = false;

    AttemptResult result = controller.attempt(request(), original_, [&](const NodePtr &node) {
        called = true;
        return rewriteToTwo(node);
    });

    EXPECT_FALSE(called);
    EXPECT_EQ(result.outcome, LedgerOutcome::FellBackError);
    EXPECT_EQ(ledger_.getEntries()[0].reason, "interceptor: injected failure for assertion");
    EXPECT_EQ(interceptor.getInjectedFailureCount(), 1u);
    ASSERT_EQ(interceptor.getOutcomes().size(), 1u);
    EXPECT_EQ(interceptor.getOutcomes()[0], LedgerOutcome::FellBackError);
}

TEST_F(DegradationControllerTest, CancelledTokenStopsAttempts) {
    CancellationToken token;
    token.cancel();
    DegradationController controller(DegradationTier::Advanced, ledger_, nullptr, &token);

    EXPECT_THROW(controller.attempt(request(), original_, rewriteToTwo), UnitCancelled);
    EXPECT_TRUE(ledger_.empty());
}

TEST_F(DegradationControllerTest, ForkedLedgerIsAbsorbedOrRejected) {
    DegradationController controller(DegradationTier::Advanced, ledger_);

    ChangeLedger tentative;
    DegradationController forked = controller.fork(tentative);
    EXPECT_EQ(forked.getTier(), DegradationTier::Advanced);
    forked.attempt(request(), original_, rewriteToTwo);
    forked.skip(request(), "ambiguous");
    EXPECT_TRUE(ledger_.empty());

    controller.reject(tentative, "class conversion failed");
    ASSERT_EQ(ledger_.size(), 2u);
    EXPECT_EQ(ledger_.getEntries()[0].outcome, LedgerOutcome::SkippedAmbiguous);
    EXPECT_EQ(ledger_.getEntries()[0].reason, "class conversion failed");
    EXPECT_EQ(ledger_.getEntries()[1].reason, "ambiguous");

    controller.absorb(tentative);
    ASSERT_EQ(ledger_.size(), 4u);
    EXPECT_EQ(ledger_.getEntries()[2].outcome, LedgerOutcome::Applied);
}

class CancellationTokenTest : public ::testing::Test {};

TEST_F(CancellationTokenTest, CancelAndDeadline) {
    CancellationToken token;
    EXPECT_NO_THROW(token.throwIfCancelled("start"));

    token.setDeadline(CancellationToken::Clock::now() - std::chrono::milliseconds(1));
    EXPECT_TRUE(token.isExpired());
    try {
        token.throwIfCancelled("in stage");
        FAIL() << "expected UnitCancelled";
    } catch (const UnitCancelled &e) {
        EXPECT_TRUE(e.isDeadlineExpired());
        EXPECT_EQ(std::string(e.what()), "deadline expired in stage");
    }

    CancellationToken cancelled;
    cancelled.cancel();
    try {
        cancelled.throwIfCancelled("now");
        FAIL() << "expected UnitCancelled";
    } catch (const UnitCancelled &e) {
        EXPECT_FALSE(e.isDeadlineExpired());
    }
}

}  // namespace Tests
}  // namespace TCE
