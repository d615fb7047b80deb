/**
 * @file main.cpp
 * @brief Batch medical image analysis utility
 *
 * Usage:
 *   medical_image_analyze [options] <image>...
 *
 * Prints one JSON object per image with the structured analysis, the
 * generated description and the prioritized keywords.
 */

#include "core/analysis_serializer.hpp"
#include "core/classifier_config.hpp"
#include "core/logging.hpp"
#include "services/classification/medical_image_classifier.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace med_classifier;

/**
 * @brief Command line options
 */
struct Options {
    std::optional<std::filesystem::path> configPath;
    logging::LogLevel logLevel = logging::LogLevel::Warning;
    bool pretty = false;
    bool showHelp = false;
    std::vector<std::filesystem::path> images;
};

void printUsage(const char* programName) {
    std::cout << "\nMedical Image Analyzer\n\n";
    std::cout << "Usage: " << programName << " [options] <image>...\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>       Classifier configuration (JSON)\n";
    std::cout << "  -l, --log-level <level>   trace, debug, info, warn, error, critical, off\n";
    std::cout << "                            (default: warn)\n";
    std::cout << "  -p, --pretty              Indent JSON output\n";
    std::cout << "  -h, --help                Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " chest.png\n";
    std::cout << "  " << programName << " --config classifier.json --pretty scan.dcm photo.jpg\n";
}

std::optional<Options> parseArguments(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-p" || arg == "--pretty") {
            options.pretty = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file argument\n";
                return std::nullopt;
            }
            options.configPath = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a level argument\n";
                return std::nullopt;
            }
            auto level = logging::logLevelFromString(argv[++i]);
            if (!level) {
                std::cerr << "Error: unknown log level '" << argv[i] << "'\n";
                return std::nullopt;
            }
            options.logLevel = *level;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            return std::nullopt;
        } else {
            options.images.emplace_back(arg);
        }
    }
    return options;
}

std::optional<std::vector<std::uint8_t>> readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(file),
                                     std::istreambuf_iterator<char>());
}

}  // anonymous namespace

int main(int argc, char* argv[])
{
    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 1;
    }
    if (options->showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (options->images.empty()) {
        std::cerr << "Error: no input images\n";
        printUsage(argv[0]);
        return 1;
    }

    // Diagnostics go to stderr so stdout stays valid JSON
    logging::LogConfig logConfig;
    logConfig.level = options->logLevel;
    logConfig.consoleToStderr = true;
    logging::LoggerFactory::configure(logConfig);
    auto logger = logging::LoggerFactory::create("MedicalImageAnalyze");

    core::ClassifierConfig config;
    if (options->configPath) {
        auto loaded = core::ClassifierConfig::loadFromFile(*options->configPath);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().toString() << "\n";
            return 1;
        }
        config = *loaded;
    }

    auto classifier = services::MedicalImageClassifier::create(config);
    if (!classifier) {
        std::cerr << "Error: " << classifier.error().toString() << "\n";
        return 1;
    }

    const int indent = options->pretty ? 2 : -1;
    int status = 0;
    for (const auto& path : options->images) {
        auto bytes = readFile(path);
        if (!bytes) {
            logger->error("Cannot read {}", path.string());
            std::cerr << "Error: cannot read " << path.string() << "\n";
            status = 1;
            continue;
        }

        const std::string fileName = path.filename().string();
        auto analysis = classifier->analyzeMedicalImage(*bytes, fileName);

        nlohmann::json output = {
            {"file", path.string()},
            {"analysis", core::AnalysisSerializer::toJson(analysis)},
            {"description", classifier->createMedicalDescription(fileName, analysis)},
            {"keywords", classifier->generateMedicalKeywords(analysis)}
        };
        std::cout << core::AnalysisSerializer::dump(output, indent) << "\n";
    }

    logging::LoggerFactory::shutdown();
    return status;
}
