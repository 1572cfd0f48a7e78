#include "omr/Errors.hpp"
#include "omr/Logger.hpp"
#include "omr/OmrPipeline.hpp"
#include "omr/PipelineConfig.hpp"
#include "omr/ResultJson.hpp"
#include "omr/TextUtil.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

namespace {

const int kExitOk = 0;
const int kExitNoPages = 1;
const int kExitUsage = 2;

struct CliOptions {
    std::string document;
    std::string configPath;
    std::string jsonOut;
    bool verbose = false;
    omr::OmrRequest request;
};

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <document.pdf|image> [options]\n"
              << "  --subjects a,b,c     subjects printed on the sheet, top to bottom\n"
              << "  --phase CODE         class/stream code used when no subjects are given\n"
              << "  --config FILE        JSON configuration\n"
              << "  --respondents N      number of people who answered\n"
              << "  --forms-per-page N   forms printed on each page\n"
              << "  --questions N        questions per subject\n"
              << "  --debug-dir DIR      write annotated forms to DIR\n"
              << "  --json FILE          write the full result as JSON\n"
              << "  --verbose            debug logging\n";
}

int parseInt(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw omr::ConfigError(flag + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw omr::ConfigError(flag + " expects an integer, got '" + value + "'");
    }
    return n;
}

// Throws ConfigError on malformed arguments
CliOptions parseArgs(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw omr::ConfigError(arg + " needs a value");
            return argv[++i];
        };

        if (arg == "--subjects") {
            opts.request.subjects = omr::splitCSV(next());
        } else if (arg == "--phase") {
            opts.request.phase = next();
        } else if (arg == "--config") {
            opts.configPath = next();
        } else if (arg == "--respondents") {
            opts.request.respondents = parseInt(arg, next());
        } else if (arg == "--forms-per-page") {
            opts.request.formsPerPage = parseInt(arg, next());
        } else if (arg == "--questions") {
            opts.request.expectedQuestions = parseInt(arg, next());
        } else if (arg == "--debug-dir") {
            opts.request.debugDir = next();
        } else if (arg == "--json") {
            opts.jsonOut = next();
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw omr::ConfigError("unknown option " + arg);
        } else if (opts.document.empty()) {
            opts.document = arg;
        } else {
            throw omr::ConfigError("more than one document given");
        }
    }
    if (opts.document.empty()) throw omr::ConfigError("no document given");
    opts.request.document.path = opts.document;
    return opts;
}

void printReport(const omr::PipelineResult& result) {
    std::cout << "\n=== FEEDBACK SUMMARY ===\n";
    std::cout << "Pages: " << result.pageCount
              << " | Forms: " << result.forms.size()
              << " | Responses: " << result.responses
              << " | Layout: " << omr::layoutSourceName(result.layoutSource) << "\n\n";

    std::cout << std::left << std::setw(20) << "Subject";
    for (size_t i = 0; i < result.ratings.size(); ++i) {
        std::cout << std::right << std::setw(9) << result.ratings[i].key;
    }
    std::cout << std::right << std::setw(10) << "Score" << std::setw(9) << "%" << "  Verdict\n";

    for (const auto& subject : result.subjects) {
        auto counts = result.totals.find(subject);
        auto score = result.scores.find(subject);

        std::cout << std::left << std::setw(20) << subject;
        for (size_t i = 0; i < result.ratings.size(); ++i) {
            int n = counts != result.totals.end() ? counts->second.at(i) : 0;
            std::cout << std::right << std::setw(9) << n;
        }
        if (score != result.scores.end()) {
            const omr::SubjectScore& s = score->second;
            std::cout << std::right << std::setw(10)
                      << (std::to_string(s.weightedScore) + "/" + std::to_string(s.maxScore))
                      << std::setw(9) << std::fixed << std::setprecision(2) << s.percentage
                      << "  " << s.verdict.label;
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const omr::ConfigError& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    omr::PipelineResult result;
    try {
        omr::PipelineConfig config = opts.configPath.empty()
            ? omr::defaultPipelineConfig()
            : omr::loadPipelineConfig(opts.configPath);
        omr::setLogLevel(opts.verbose ? omr::LogLevel::Debug : config.logLevel);

        omr::OmrPipeline pipeline(config);
        result = pipeline.run(opts.request);
    } catch (const omr::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    } catch (const omr::LayoutError& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }

    if (!opts.jsonOut.empty() && !omr::writeResultJson(result, opts.jsonOut)) {
        std::cerr << "Could not write " << opts.jsonOut << "\n";
    }

    if (!result.ok()) {
        std::cerr << "No pages processed: " << result.message << "\n";
        return kExitNoPages;
    }

    printReport(result);
    return kExitOk;
}
