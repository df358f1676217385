#include "stages/EntryPointStage.h"
#include "common/TestUtils.h"
#include <gtest/gtest.h>

namespace TCE {
namespace Tests {

using Test::Utils::hasEntry;
using Test::Utils::transform;

class EntryPointStageTest : public ::testing::Test {
protected:
    static std::string mainBlock(const std::string &call) {
        return "\n"
               "if __name__ == \"__main__\":\n"
               "    " +
               call + "\n";
    }
};

TEST_F(EntryPointStageTest, ArgumentsNeedExperimentalTier) {
    const std::string source = "import unittest\n" + mainBlock("unittest.main(verbosity=2)");

    UnitResult advanced = transform(source, DegradationTier::Advanced);
    EXPECT_EQ(advanced.status, UnitStatus::Partial);
    EXPECT_EQ(*advanced.outputText, source);
    EXPECT_TRUE(hasEntry(advanced.ledger, EntryPointStage::FAMILY, LedgerOutcome::SkippedAmbiguous,
                         "requires experimental tier"));

    UnitResult experimental = transform(source, DegradationTier::Experimental);
    ASSERT_EQ(experimental.status, UnitStatus::Complete);
    EXPECT_EQ(*experimental.outputText, "import pytest\n" + mainBlock("pytest.main()"));
    EXPECT_TRUE(hasEntry(experimental.ledger, EntryPointStage::FAMILY, LedgerOutcome::Applied, "arguments dropped"));
}

TEST_F(EntryPointStageTest, FromImportedMain) {
    UnitResult result = transform("from unittest import main\n" + mainBlock("main()"));

    ASSERT_EQ(result.status, UnitStatus::Complete);
    EXPECT_EQ(*result.outputText, "import pytest\n" + mainBlock("pytest.main()"));
}

TEST_F(EntryPointStageTest, OtherMainCallsAreUntouched) {
    const std::string source = "import app\n" + mainBlock("app.main()");

    UnitResult result = transform(source);

    EXPECT_EQ(result.status, UnitStatus::Complete);
    EXPECT_EQ(*result.outputText, source);
    EXPECT_TRUE(result.ledger.empty());
}

}  // namespace Tests
}  // namespace TCE
