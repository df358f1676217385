#include "runtime/BatchTransformer.h"
#include "mocks/MemoryOutputSink.h"
#include "mocks/MockOutputSink.h"
#include "runtime/FileOutputSink.h"
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

namespace TCE {
namespace Tests {

class BatchTransformerTest : public ::testing::Test {
protected:
    static BatchUnit unit(const std::string &name, const std::string &source, const std::string &outputPath = "") {
        return BatchUnit{name, source, outputPath};
    }

    static std::string testUnit(const std::string &name) {
        return "import unittest\n"
               "\n"
               "\n"
               "class " + name + "(unittest.TestCase):\n"
               "    def test_value(self):\n"
               "        self.assertTrue(True)\n";
    }

    PipelineDriver driver_;
    TransformConfig config_;
};

TEST_F(BatchTransformerTest, OutcomesFollowInputOrder) {
    auto sink = std::make_shared<::TCE::Test::MemoryOutputSink>();
    BatchTransformer batch(driver_, config_, sink);
    batch.setMaxParallel(3);

    std::vector<BatchUnit> units;
    for (int i = 0; i < 8; ++i) {
        units.push_back(unit("unit" + std::to_string(i), testUnit("TestUnit" + std::to_string(i)),
                             "out/test_" + std::to_string(i) + ".py"));
    }

    auto outcomes = batch.run(units);

    ASSERT_EQ(outcomes.size(), units.size());
    for (size_t i = 0; i < units.size(); ++i) {
        EXPECT_EQ(outcomes[i].name, units[i].name);
        EXPECT_EQ(outcomes[i].result.status, UnitStatus::Complete);
        EXPECT_FALSE(outcomes[i].writeError.has_value());
        EXPECT_NE(outcomes[i].result.outputText->find("class TestUnit" + std::to_string(i) + ":"), std::string::npos);
    }
    EXPECT_EQ(sink->getFiles().size(), units.size());
}

TEST_F(BatchTransformerTest, OneFailingUnitDoesNotAffectOthers) {
    auto sink = std::make_shared<::TCE::Test::MemoryOutputSink>(std::set<std::string>{"bad.py"});
    BatchTransformer batch(driver_, config_, sink);

    auto outcomes = batch.run({unit("good", testUnit("TestGood"), "good.py"),
                               unit("broken", "def f(:\n", "broken.py"),
                               unit("unwritable", testUnit("TestBad"), "bad.py")});

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].result.status, UnitStatus::Complete);
    EXPECT_EQ(outcomes[1].result.status, UnitStatus::Failed);
    EXPECT_EQ(outcomes[2].result.status, UnitStatus::Complete);
    ASSERT_TRUE(outcomes[2].writeError.has_value());
    EXPECT_EQ(*outcomes[2].writeError, "disk full: bad.py");

    auto files = sink->getFiles();
    EXPECT_EQ(files.size(), 1u);
    EXPECT_EQ(files.count("good.py"), 1u);
}

TEST_F(BatchTransformerTest, CancelAllStopsPendingUnits) {
    BatchTransformer batch(driver_, config_);
    batch.cancelAll();

    auto outcomes = batch.run({unit("a", testUnit("TestA")), unit("b", testUnit("TestB"))});

    ASSERT_EQ(outcomes.size(), 2u);
    for (const auto &outcome : outcomes) {
        EXPECT_EQ(outcome.result.status, UnitStatus::Failed);
        ASSERT_TRUE(outcome.result.error.has_value());
        EXPECT_EQ(outcome.result.error->kind, UnitError::Kind::Cancelled);
    }
}

TEST_F(BatchTransformerTest, ExplicitTierAppliesToEveryUnit) {
    BatchTransformer batch(driver_, config_);
    batch.setTier(DegradationTier::Essential);

    auto outcomes = batch.run({unit("a", testUnit("TestA"))});

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].result.tier, DegradationTier::Essential);
    EXPECT_EQ(outcomes[0].result.status, UnitStatus::Partial);
}

TEST_F(BatchTransformerTest, OnlyUnitsWithOutputAndPathAreWritten) {
    using ::testing::_;
    using ::testing::HasSubstr;

    auto sink = std::make_shared<::testing::StrictMock<::TCE::Test::MockOutputSink>>();
    EXPECT_CALL(*sink, write("kept.py", HasSubstr("class TestKept:"))).Times(1);
    EXPECT_CALL(*sink, write("thrown.py", _)).WillOnce(::testing::Throw(std::runtime_error("read-only")));

    BatchTransformer batch(driver_, config_, sink);
    auto outcomes = batch.run({unit("kept", testUnit("TestKept"), "kept.py"),
                               unit("unnamed", testUnit("TestUnnamed")),
                               unit("broken", "class :\n", "broken.py"),
                               unit("thrown", testUnit("TestThrown"), "thrown.py")});

    ASSERT_EQ(outcomes.size(), 4u);
    EXPECT_FALSE(outcomes[0].writeError.has_value());
    EXPECT_FALSE(outcomes[1].writeError.has_value());
    EXPECT_EQ(outcomes[2].result.status, UnitStatus::Failed);
    ASSERT_TRUE(outcomes[3].writeError.has_value());
    EXPECT_EQ(*outcomes[3].writeError, "read-only");
}

class FileOutputSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = std::filesystem::temp_directory_path() /
                     ("tce_sink_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(directory_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
    }

    static std::string readFile(const std::filesystem::path &path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path directory_;
};

TEST_F(FileOutputSinkTest, WritesAndOverwritesFiles) {
    FileOutputSink sink;
    std::string path = (directory_ / "test_out.py").string();

    sink.write(path, "first\n");
    sink.write(path, "x = 1\r\n");

    EXPECT_EQ(readFile(path), "x = 1\r\n");
    EXPECT_EQ(sink.getWriteCount(), 2u);
}

TEST_F(FileOutputSinkTest, MissingDirectoryIsAnError) {
    FileOutputSink sink;
    std::string path = (directory_ / "missing" / "test_out.py").string();

    EXPECT_THROW(sink.write(path, "x = 1\n"), std::runtime_error);
    EXPECT_EQ(sink.getWriteCount(), 0u);
}

}  // namespace Tests
}  // namespace TCE
