#include "model/ChangeLedger.h"
#include "model/UnitResult.h"
#include <gtest/gtest.h>

namespace TCE {
namespace Tests {

class ChangeLedgerTest : public ::testing::Test {
protected:
    static SourceRange rangeAt(int line) {
        return SourceRange{{line, 5}, {line, 30}};
    }

    ChangeLedger ledger_;
};

TEST_F(ChangeLedgerTest, EmptyLedgerCountsAsAllApplied) {
    EXPECT_TRUE(ledger_.empty());
    EXPECT_TRUE(ledger_.allApplied());
    EXPECT_EQ(ledger_.toJson(), json::array());
}

TEST_F(ChangeLedgerTest, EntriesKeepRecordingOrder) {
    ledger_.record(rangeAt(3), "assertion", LedgerOutcome::Applied, "");
    ledger_.record(rangeAt(7), "loop-parametrize", LedgerOutcome::SkippedAmbiguous, "loop carries state");
    ledger_.record(LedgerEntry{rangeAt(9), "assertion", LedgerOutcome::FellBackError, "boom"});

    ASSERT_EQ(ledger_.size(), 3u);
    EXPECT_EQ(ledger_.getEntries()[0].range.start.line, 3);
    EXPECT_EQ(ledger_.getEntries()[1].family, "loop-parametrize");
    EXPECT_EQ(ledger_.getEntries()[2].reason, "boom");

    EXPECT_FALSE(ledger_.allApplied());
    EXPECT_EQ(ledger_.count(LedgerOutcome::Applied), 1u);
    EXPECT_EQ(ledger_.countFamily("assertion", LedgerOutcome::FellBackError), 1u);
    EXPECT_EQ(ledger_.countFamily("assertion", LedgerOutcome::SkippedAmbiguous), 0u);
}

TEST_F(ChangeLedgerTest, EntryJsonCarriesRangeOrNull) {
    json located = LedgerEntry{rangeAt(4), "import", LedgerOutcome::Applied, "add import pytest"}.toJson();
    EXPECT_EQ(located["family"], "import");
    EXPECT_EQ(located["outcome"], "applied");
    EXPECT_EQ(located["start"]["line"], 4);
    EXPECT_EQ(located["end"]["column"], 30);

    json synthesized = LedgerEntry{SourceRange{}, "import", LedgerOutcome::SkippedAmbiguous, "x"}.toJson();
    EXPECT_EQ(synthesized["outcome"], "skipped-ambiguous");
    EXPECT_TRUE(synthesized["start"].is_null());
}

TEST_F(ChangeLedgerTest, UnitResultJsonSummarizesLedger) {
    UnitResult result;
    result.status = UnitStatus::Partial;
    result.tier = DegradationTier::Essential;
    result.outputText = "x = 1\n";
    result.ledger.record(rangeAt(1), "assertion", LedgerOutcome::Applied, "");
    result.ledger.record(rangeAt(2), "assertion", LedgerOutcome::FellBackError, "no");

    json document = result.toJson();
    EXPECT_EQ(document["status"], "partial");
    EXPECT_EQ(document["tier"], "essential");
    EXPECT_EQ(document["summary"]["applied"], 1);
    EXPECT_EQ(document["summary"]["fellBackError"], 1);
    EXPECT_EQ(document["ledger"].size(), 2u);
    EXPECT_TRUE(document["error"].is_null());
    EXPECT_TRUE(result.isSuccess());
}

TEST_F(ChangeLedgerTest, FailedResultJsonCarriesErrorLocation) {
    UnitResult result;
    result.error = UnitError{UnitError::Kind::Parse, "unexpected ':'", SourcePosition{2, 7}};

    json document = result.toJson();
    EXPECT_EQ(document["status"], "failed");
    EXPECT_EQ(document["error"]["kind"], "parse");
    EXPECT_EQ(document["error"]["line"], 2);
    EXPECT_EQ(document["error"]["column"], 7);
    EXPECT_FALSE(result.isSuccess());
}

}  // namespace Tests
}  // namespace TCE
