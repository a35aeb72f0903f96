#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/Finding.hpp"
#include "core/Manifest.hpp"

#include "input/FindingReader.hpp"

#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include "analysis/TieringClassifier.hpp"

#include "report/ConsoleReporter.hpp"
#include "report/JsonReporter.hpp"
#include "report/ManifestBuilder.hpp"

#include "service/TriageService.hpp"
#include "store/FindingsStore.hpp"

// -------------------------
// CLI
// -------------------------
struct CliOptions
{
    std::string inputFile;
    std::string configFile;
    std::string buildUrl;
    std::string buildStatus;
    std::string requestId;
    std::string findingId;
    std::optional<int> limit;
    bool full = false;
    bool console = false;
    bool pretty = false;
    bool verbose = false;
    bool help = false;
    std::string error;
};

static CliOptions parseArgs(int argc, char *argv[])
{
    CliOptions opts;

    auto value = [&](int &i, const std::string &flag) -> std::string
    {
        if (i + 1 >= argc)
        {
            opts.error = "missing value for " + flag;
            return {};
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" || arg == "-c")
        {
            opts.configFile = value(i, arg);
        }
        else if (arg == "--limit" || arg == "-l")
        {
            const std::string raw = value(i, arg);
            opts.limit = Triage::Utils::parseInteger<int>(raw);
            if (!opts.limit && opts.error.empty())
                opts.error = "--limit expects an integer, got '" + raw + "'";
        }
        else if (arg == "--build-url")
        {
            opts.buildUrl = value(i, arg);
        }
        else if (arg == "--status")
        {
            opts.buildStatus = value(i, arg);
        }
        else if (arg == "--request-id")
        {
            opts.requestId = value(i, arg);
        }
        else if (arg == "--finding")
        {
            opts.findingId = value(i, arg);
        }
        else if (arg == "--full")
        {
            opts.full = true;
        }
        else if (arg == "--console")
        {
            opts.console = true;
        }
        else if (arg == "--pretty")
        {
            opts.pretty = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            opts.verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
        }
        else if (arg == "-" || (!arg.empty() && arg[0] != '-'))
        {
            opts.inputFile = arg;
        }
        else if (opts.error.empty())
        {
            opts.error = "unknown option " + arg;
        }
    }

    return opts;
}

static void printUsage(const char *progName)
{
    std::cout
        << "Usage: " << progName << " [OPTIONS] findings.jsonl\n\n"
        << "Reads extracted CI error findings (one JSON object per line, '-' for stdin),\n"
        << "classifies them into triage tiers and prints a manifest.\n\n"
        << "OPTIONS:\n"
        << "  -c, --config FILE        Config file (key = value)\n"
        << "  -l, --limit N            Tier-1 capacity (default: config default_limit, 20)\n"
        << "  --build-url URL          Build URL recorded in the manifest\n"
        << "  --status STATUS          Build status recorded in the manifest\n"
        << "  --request-id ID          Request id (default: from findings, else generated)\n"
        << "  --finding ID             Print the full record of one finding instead\n"
        << "  --full                   Print the full tiered result instead\n"
        << "  --console                Human-readable manifest instead of JSON\n"
        << "  --pretty                 Multi-line JSON\n"
        << "  -v, --verbose            Verbose logging\n\n"
        << "EXIT CODES:\n"
        << "  0 success, 1 usage or input error, 2 finding not found\n";
}

int main(int argc, char *argv[])
{
    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(argv[0]);
        return 0;
    }
    if (!opts.error.empty() || opts.inputFile.empty())
    {
        std::cerr << "Error: " << (opts.error.empty() ? "findings file required" : opts.error) << ".\n\n";
        printUsage(argv[0]);
        return 1;
    }

    // Logger
    auto &logger = Triage::Utils::getLogger();

    // Config (missing file or keys fall back to built-in defaults)
    Triage::Utils::ConfigLoader config;
    if (!opts.configFile.empty())
        config.loadFromFile(opts.configFile);

    if (auto level = config.getString("log_level"))
    {
        if (auto parsed = Triage::Utils::parseLogLevel(*level))
            logger.setLevel(*parsed);
        else
            logger.warn("Unknown log_level '" + *level + "', keeping INFO");
    }
    if (auto logFile = config.getString("log_file"))
    {
        if (!logger.openFile(*logFile))
            logger.warn("Cannot open log file: " + *logFile);
    }
    if (opts.verbose)
        logger.setLevel(Triage::Utils::LogLevel::DEBUG);

    logger.info("Starting build triage");
    logger.info("Input: " + opts.inputFile);

    // Input
    std::vector<core::RawFinding> findings;
    if (opts.inputFile == "-")
    {
        Triage::Input::FindingReader reader(std::cin);
        findings = reader.readAll();
    }
    else
    {
        Triage::Input::FindingReader reader(opts.inputFile);
        if (!reader.isOpen())
            return 1;
        findings = reader.readAll();
    }

    // Pipeline
    const auto policy = Triage::Analysis::TieringPolicy::fromConfig(config);
    const int summaryLimit = config.getIntOr("summary_message_limit",
                                             static_cast<int>(Triage::Report::ManifestBuilder::kDefaultSummaryLimit));

    auto store = std::make_shared<Triage::Store::InMemoryFindingsStore>();
    Triage::Service::TriageService service(
        store,
        policy,
        summaryLimit > 0 ? static_cast<std::size_t>(summaryLimit)
                         : Triage::Report::ManifestBuilder::kDefaultSummaryLimit);

    core::BuildInfo build;
    build.url = opts.buildUrl;
    build.status = opts.buildStatus;

    const int limit = opts.limit.value_or(policy.defaultLimit);
    const core::Manifest manifest = service.analyzeBuild(build, findings, limit, opts.requestId);

    // Output
    const bool pretty = opts.pretty || config.getBoolOr("pretty_json", false);
    Triage::Report::JsonReporter json(pretty ? Triage::Report::JsonReporter::PrettyPrint::PRETTY
                                             : Triage::Report::JsonReporter::PrettyPrint::COMPACT);

    if (!opts.findingId.empty())
    {
        const auto finding = service.getFindingDetails(manifest.requestId, opts.findingId);
        if (!finding)
        {
            logger.error("Finding not found: " + opts.findingId);
            return 2;
        }
        std::cout << json.findingToJson(*finding) << "\n";
    }
    else if (opts.full)
    {
        const auto result = service.getFullResult(manifest.requestId);
        if (!result)
        {
            logger.error("No stored result for request " + manifest.requestId);
            return 1;
        }
        std::cout << json.tieredResultToJson(manifest.requestId, *result) << "\n";
    }
    else if (opts.console)
    {
        Triage::Report::ConsoleReporter console(opts.verbose ? Triage::Report::ConsoleReporter::Verbosity::VERBOSE
                                                             : Triage::Report::ConsoleReporter::Verbosity::NORMAL);
        console.printManifest(manifest);
    }
    else
    {
        json.writeManifest(std::cout, manifest);
    }

    logger.info("Triage complete: request " + manifest.requestId);
    return 0;
}
