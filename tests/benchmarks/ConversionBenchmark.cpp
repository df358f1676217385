#include "runtime/BatchTransformer.h"
#include "runtime/PipelineDriver.h"
#include "syntax/Parser.h"
#include <benchmark/benchmark.h>
#include <sstream>
#include <string>

using namespace TCE;

// ============================================================================
// Test Units
// ============================================================================

// Generate a TestCase class with the given number of test methods
static std::string generateUnit(int numTests) {
    std::stringstream ss;
    ss << "import unittest\n\n\nclass TestGenerated(unittest.TestCase):\n";
    ss << "    def setUp(self):\n        self.items = list(range(10))\n";
    for (int i = 0; i < numTests; ++i) {
        ss << "\n    def test_case_" << i << "(self):\n";
        ss << "        self.assertEqual(len(self.items), 10)\n";
        ss << "        self.assertIn(" << (i % 10) << ", self.items)\n";
        if (i % 3 == 0) {
            ss << "        with self.assertRaises(IndexError):\n";
            ss << "            self.items[100]\n";
        }
        if (i % 5 == 0) {
            ss << "        for value in [1, 2, 3]:\n";
            ss << "            self.assertGreater(value, 0)\n";
        }
    }
    ss << "\n\nif __name__ == \"__main__\":\n    unittest.main()\n";
    return ss.str();
}

// ============================================================================
// Parsing Benchmarks
// ============================================================================

// Measure lossless parse and render of a unit
static void BM_ParseAndRender(benchmark::State &state) {
    const std::string source = generateUnit(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        NodePtr module = Parser::parse(source);
        std::string text = module->render();
        benchmark::DoNotOptimize(text.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(source.size()));
    state.SetLabel(std::to_string(state.range(0)) + " tests");
}

BENCHMARK(BM_ParseAndRender)->Arg(10)->Arg(50)->Arg(200);

// ============================================================================
// Pipeline Benchmarks
// ============================================================================

// Measure a full unit transformation at each tier
static void BM_TransformUnit(benchmark::State &state) {
    const std::string source = generateUnit(static_cast<int>(state.range(0)));
    const auto tier = static_cast<DegradationTier>(state.range(1));
    PipelineDriver driver;
    TransformConfig config;
    for (auto _ : state) {
        UnitResult result = driver.transformUnit(source, config, tier);
        if (!result.isSuccess()) {
            state.SkipWithError("unit transformation failed");
            return;
        }
        benchmark::DoNotOptimize(result.outputText);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetLabel(std::to_string(state.range(0)) + " tests, " + tierToString(tier));
}

BENCHMARK(BM_TransformUnit)->Args({10, 0})->Args({10, 1})->Args({10, 2})->Args({100, 1});

// Measure batch throughput with varying parallelism
static void BM_BatchTransform(benchmark::State &state) {
    std::vector<BatchUnit> units;
    for (int i = 0; i < 16; ++i) {
        units.push_back(BatchUnit{"unit" + std::to_string(i), generateUnit(20), ""});
    }
    PipelineDriver driver;
    TransformConfig config;
    for (auto _ : state) {
        BatchTransformer batch(driver, config);
        batch.setMaxParallel(static_cast<size_t>(state.range(0)));
        auto outcomes = batch.run(units);
        benchmark::DoNotOptimize(outcomes.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(units.size()));
    state.SetLabel(std::to_string(state.range(0)) + " in parallel");
}

BENCHMARK(BM_BatchTransform)->Arg(1)->Arg(4)->UseRealTime();

BENCHMARK_MAIN();
