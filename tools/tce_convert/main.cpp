// tce_convert: converts one unittest-style Python test module to pytest style

#include "backends/SpdlogBackend.h"
#include "common/Exceptions.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "model/ConfigFile.h"
#include "model/TransformConfig.h"
#include "runtime/BatchTransformer.h"
#include "runtime/FileOutputSink.h"
#include "runtime/PipelineDriver.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_COMPLETE = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_PARTIAL = 2;
constexpr int EXIT_FAILED = 3;

struct Options {
    std::optional<std::string> tier;
    std::optional<fs::path> configPath;
    std::vector<std::string> prefixes;
    bool noParametrize = false;
    bool keepClasses = false;
    bool dryRun = false;
    std::optional<TCE::LogLevel> logLevel;
    std::optional<fs::path> logDir;
    std::optional<fs::path> reportPath;
    fs::path inputPath;
    std::optional<fs::path> outputPath;
};

void printUsage(const char *programName) {
    std::cout << "Usage: " << programName << " [options] <input.py> [output.py]\n\n";
    std::cout << "Convert a unittest-style test module to pytest style.\n";
    std::cout << "Without output.py the converted module is written to stdout.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --tier <name>         essential, advanced or experimental (default: from analysis)\n";
    std::cout << "  --config <file.json>  JSON configuration file\n";
    std::cout << "  --prefix <prefix>     accepted test name prefix, repeatable (default: test)\n";
    std::cout << "  --no-parametrize      keep assertion loops as loops\n";
    std::cout << "  --keep-classes        keep unittest.TestCase classes and their hooks\n";
    std::cout << "  --report <file.json>  write the unit result and change ledger as JSON\n";
    std::cout << "  --dry-run             convert and report without writing the module\n";
    std::cout << "  --verbose             same as --log-level debug\n";
    std::cout << "  --log-level <level>   trace, debug, info, warn, error or off (default: warn)\n";
    std::cout << "  --log-dir <dir>       also append diagnostics to <dir>/tce.log\n";
    std::cout << "  --help                show this text\n\n";
    std::cout << "Exit codes: 0 complete, 1 usage or I/O error, 2 partial, 3 failed\n";
}

std::string readFile(const fs::path &filePath) {
    if (!fs::exists(filePath)) {
        throw std::runtime_error("File does not exist: " + filePath.string());
    }

    std::ifstream file(filePath, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void writeFile(const fs::path &filePath, const std::string &content) {
    std::ofstream file(filePath, std::ios::out | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create output file: " + filePath.string());
    }

    file << content;
    if (!file) {
        throw std::runtime_error("Failed to write to output file: " + filePath.string());
    }
}

/**
 * @brief Parse argv into options
 * @return std::nullopt after printing usage for --help or malformed arguments
 */
std::optional<Options> parseArguments(int argc, char **argv, bool &helpRequested) {
    Options options;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string argument = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argument << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (argument == "--help" || argument == "-h") {
            helpRequested = true;
            return std::nullopt;
        } else if (argument == "--tier") {
            options.tier = value();
            if (!options.tier) {
                return std::nullopt;
            }
        } else if (argument == "--config") {
            auto path = value();
            if (!path) {
                return std::nullopt;
            }
            options.configPath = *path;
        } else if (argument == "--prefix") {
            auto prefix = value();
            if (!prefix) {
                return std::nullopt;
            }
            options.prefixes.push_back(*prefix);
        } else if (argument == "--report") {
            auto path = value();
            if (!path) {
                return std::nullopt;
            }
            options.reportPath = *path;
        } else if (argument == "--no-parametrize") {
            options.noParametrize = true;
        } else if (argument == "--keep-classes") {
            options.keepClasses = true;
        } else if (argument == "--dry-run") {
            options.dryRun = true;
        } else if (argument == "--verbose") {
            options.logLevel = TCE::LogLevel::Debug;
        } else if (argument == "--log-level") {
            auto name = value();
            if (!name) {
                return std::nullopt;
            }
            options.logLevel = TCE::logLevelFromString(*name);
            if (!options.logLevel) {
                std::cerr << "Error: unknown log level " << *name << "\n";
                return std::nullopt;
            }
        } else if (argument == "--log-dir") {
            auto path = value();
            if (!path) {
                return std::nullopt;
            }
            options.logDir = *path;
        } else if (argument.starts_with("--")) {
            std::cerr << "Error: unknown option " << argument << "\n";
            return std::nullopt;
        } else {
            positional.push_back(argument);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        return std::nullopt;
    }
    options.inputPath = positional[0];
    if (positional.size() == 2) {
        options.outputPath = positional[1];
    }
    return options;
}

TCE::TransformConfig buildConfig(const Options &options) {
    TCE::TransformConfig::Builder builder;
    if (options.configPath) {
        TCE::ConfigFile::apply(readFile(*options.configPath), builder);
    }
    if (!options.prefixes.empty()) {
        builder.setTestPrefixes(options.prefixes);
    }
    if (options.tier) {
        auto tier = TCE::tierFromString(*options.tier);
        if (!tier) {
            throw TCE::ConfigurationError("unknown tier '" + *options.tier + "'");
        }
        builder.setTier(*tier);
    }
    if (options.noParametrize) {
        builder.setLoopParametrize(false);
    }
    if (options.keepClasses) {
        builder.setKeepLegacyClassStructure(true);
    }
    return builder.build();
}

int exitCodeFor(TCE::UnitStatus status) {
    switch (status) {
    case TCE::UnitStatus::Complete:
        return EXIT_COMPLETE;
    case TCE::UnitStatus::Partial:
        return EXIT_PARTIAL;
    case TCE::UnitStatus::Failed:
        return EXIT_FAILED;
    }
    return EXIT_FAILED;
}

}  // namespace

int main(int argc, char **argv) {
    bool helpRequested = false;
    auto options = parseArguments(argc, argv, helpRequested);
    if (!options) {
        printUsage(argv[0]);
        return helpRequested ? EXIT_COMPLETE : EXIT_USAGE;
    }

    try {
        if (options->logDir) {
            TCE::Logger::setBackend(std::make_unique<TCE::SpdlogBackend>(options->logDir->string(), true));
        }
        TCE::Logger::setLevel(options->logLevel.value_or(TCE::LogLevel::Warn));

        TCE::TransformConfig config = buildConfig(*options);
        TCE::BatchUnit unit{options->inputPath.string(), readFile(options->inputPath), ""};
        if (options->outputPath && !options->dryRun) {
            unit.outputPath = options->outputPath->string();
        }

        TCE::PipelineDriver driver;
        TCE::BatchTransformer batch(driver, config, std::make_shared<TCE::FileOutputSink>());
        TCE::BatchOutcome outcome = batch.run({unit}).front();
        const TCE::UnitResult &result = outcome.result;

        if (options->reportPath) {
            TCE::json report = result.toJson();
            report["input"] = unit.name;
            writeFile(*options->reportPath, TCE::JsonUtils::toPrettyString(report) + "\n");
        }
        if (outcome.writeError) {
            std::cerr << "Error: " << *outcome.writeError << "\n";
            return EXIT_USAGE;
        }

        if (result.status == TCE::UnitStatus::Failed) {
            std::cerr << "Conversion failed: " << result.error->message << "\n";
        } else if (!options->outputPath && !options->dryRun) {
            std::cout << *result.outputText;
        }
        std::cerr << unit.name << ": " << TCE::statusToString(result.status) << " ("
                  << result.ledger.count(TCE::LedgerOutcome::Applied) << " applied, "
                  << result.ledger.count(TCE::LedgerOutcome::SkippedAmbiguous) << " skipped, "
                  << result.ledger.count(TCE::LedgerOutcome::FellBackError) << " fell back)\n";
        TCE::Logger::flush();
        return exitCodeFor(result.status);

    } catch (const std::exception &e) {
        LOG_ERROR("tce_convert: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}
