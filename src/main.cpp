#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/pipeline_config.hpp"
#include "core/pipeline.hpp"
#include "processors/csv_processor.hpp"
#include "processors/file_processor.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

namespace {

const char *kVersion = "piianon v1.0.0";

std::atomic<bool> g_interrupted(false);

void onSigint(int)
{
    g_interrupted.store(true);
}

struct CliOptions
{
    std::string input;
    std::string output;
    std::string configPath;
    bool dirMode = false;
    bool recursive = false;
    bool csvMode = false;
    std::vector<std::string> columns;
    long workers = -1;
    bool singleThreaded = false;
    piianon::util::ConfigLayer overrides;
};

void printUsage(std::ostream &os)
{
    os << "Usage: piianon [options] <input>\n"
          "\n"
          "Detect and anonymize personally identifiable information in text and CSV files.\n"
          "\n"
          "Options:\n"
          "  -o, --output PATH      Output file or directory (derived from the input if omitted)\n"
          "      --dir              Process every *.txt file in the input directory\n"
          "  -r, --recursive        Descend into subdirectories (with --dir)\n"
          "      --csv              Process the input as a CSV file\n"
          "      --columns A,B      CSV columns to process (default: all)\n"
          "      --workers N        Parallel workers for CSV processing\n"
          "      --single-threaded  Force one CSV worker\n"
          "      --no-progress      Do not log LLM batch progress\n"
          "  -c, --config FILE      key=value configuration file\n"
          "      --strategy NAME    redact, mask, replace or hash\n"
          "      --entities A,B     Entity categories to detect\n"
          "      --confidence X     Confidence threshold in [0, 1]\n"
          "      --llm              Enable the LLM second pass\n"
          "      --no-audit         Do not write the audit log\n"
          "      --backup           Copy the input to <input>.backup first\n"
          "  -v, --verbose          Debug logging\n"
          "      --version          Print the version and exit\n"
          "  -h, --help             Print this help and exit\n"
          "\n"
          "Examples:\n"
          "  piianon notes.txt -o notes_clean.txt\n"
          "  piianon notes.txt --strategy mask\n"
          "  piianon input_dir -o output_dir --dir -r\n"
          "  piianon data.csv --csv --columns notes,email --workers 4\n";
}

/**
 * @return 0 to continue, 1 on a usage error, -1 after --help or --version.
 */
int parseArgs(int argc, char **argv, CliOptions &opts)
{
    auto needValue = [&](int &i, const std::string &flag, std::string &out) -> bool {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << flag << " requires a value\n";
            return false;
        }
        out = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        std::string value;

        if (arg == "-h" || arg == "--help") {
            printUsage(std::cout);
            return -1;
        }
        else if (arg == "--version") {
            std::cout << kVersion << "\n";
            return -1;
        }
        else if (arg == "-o" || arg == "--output") {
            if (!needValue(i, arg, opts.output)) return 1;
        }
        else if (arg == "--dir") { opts.dirMode = true; }
        else if (arg == "-r" || arg == "--recursive") { opts.recursive = true; }
        else if (arg == "--csv") { opts.csvMode = true; }
        else if (arg == "--columns") {
            if (!needValue(i, arg, value)) return 1;
            opts.columns = piianon::util::splitList(value);
        }
        else if (arg == "--workers") {
            if (!needValue(i, arg, value)) return 1;
            try {
                size_t idx = 0;
                opts.workers = std::stol(value, &idx);
                if (idx != value.size() || opts.workers < 1) {
                    throw std::invalid_argument(value);
                }
            }
            catch (const std::exception &) {
                std::cerr << "Error: --workers expects a positive integer, got '" << value << "'\n";
                return 1;
            }
        }
        else if (arg == "--single-threaded") { opts.singleThreaded = true; }
        else if (arg == "--no-progress") { opts.overrides["processing.show_progress"] = "false"; }
        else if (arg == "-c" || arg == "--config") {
            if (!needValue(i, arg, opts.configPath)) return 1;
        }
        else if (arg == "--strategy") {
            if (!needValue(i, arg, value)) return 1;
            const std::string s = piianon::util::toLower(value);
            if (s != "redact" && s != "mask" && s != "replace" && s != "hash") {
                std::cerr << "Error: --strategy must be one of redact, mask, replace, hash\n";
                return 1;
            }
            opts.overrides["anonymization.strategy"] = s;
        }
        else if (arg == "--entities") {
            if (!needValue(i, arg, value)) return 1;
            opts.overrides["detection.entities"] = value;
        }
        else if (arg == "--confidence") {
            if (!needValue(i, arg, value)) return 1;
            opts.overrides["detection.confidence_threshold"] = value;
        }
        else if (arg == "--llm") { opts.overrides["llm_detection.enabled"] = "true"; }
        else if (arg == "--no-audit") { opts.overrides["processing.create_audit_log"] = "false"; }
        else if (arg == "--backup") { opts.overrides["processing.backup_original"] = "true"; }
        else if (arg == "-v" || arg == "--verbose") {
            opts.overrides["logging.level"] = "DEBUG";
        }
        else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage(std::cerr);
            return 1;
        }
        else if (opts.input.empty()) {
            opts.input = arg;
        }
        else {
            std::cerr << "Error: unexpected argument " << arg << "\n";
            return 1;
        }
    }

    if (opts.input.empty()) {
        std::cerr << "Error: no input given\n";
        printUsage(std::cerr);
        return 1;
    }
    return 0;
}

bool validateInput(const CliOptions &opts)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(opts.input, ec)) {
        std::cerr << "Error: Input path does not exist: " << opts.input << "\n";
        return false;
    }
    if (opts.csvMode) {
        if (!fs::is_regular_file(opts.input, ec)) {
            std::cerr << "Error: --csv specified but input is not a file: " << opts.input << "\n";
            return false;
        }
        if (!piianon::util::endsWith(piianon::util::toLower(opts.input), ".csv")) {
            piianon::util::logger::warn("main: input file does not have a .csv extension");
        }
        return true;
    }
    if (opts.dirMode) {
        if (!fs::is_directory(opts.input, ec)) {
            std::cerr << "Error: --dir specified but input is not a directory: " << opts.input << "\n";
            return false;
        }
    } else if (!fs::is_regular_file(opts.input, ec)) {
        std::cerr << "Error: Input is not a file: " << opts.input << "\n";
        return false;
    }
    if (opts.recursive && !opts.dirMode) {
        piianon::util::logger::warn("main: --recursive ignored outside --dir mode");
    }
    return true;
}

void setupLogging(const piianon::config::LoggingConfig &cfg)
{
    namespace logger = piianon::util::logger;
    logger::setLogLevel(logger::parseLogLevel(cfg.level));
    if (!cfg.file.empty() && !logger::enableFileOutput(cfg.file)) {
        logger::warn("main: could not open log file " + cfg.file);
    }
}

std::string seconds(double s)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fs", s);
    return buf;
}

const std::string kRule(70, '=');

void printCsvResult(const piianon::processors::CsvProcessResult &r)
{
    std::cout << "\n" << kRule << "\nCSV PROCESSING RESULT\n" << kRule << "\n"
              << "Input: " << r.inputPath << "\n"
              << "Output: " << r.outputPath << "\n"
              << "Status: " << (r.success ? "SUCCESS" : "FAILED") << "\n"
              << "Workers: " << r.workersUsed << "\n"
              << "Rows processed: " << r.rowsProcessed << "\n";
    if (r.rowsFailed > 0) {
        std::cout << "Rows failed: " << r.rowsFailed << "\n";
    }
    std::cout << "PII found: " << r.totalPiiFound << "\n";
    if (r.llmPiiFound > 0) {
        std::cout << "  LLM second pass: " << r.llmPiiFound << "\n";
    }
    if (r.rowsProcessed > 0) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(r.totalPiiFound) / r.rowsProcessed);
        std::cout << "Avg PII/row: " << buf << "\n";
    }
    std::cout << "Processing time: " << seconds(r.processingTime) << "\n";
    if (r.processingTime > 0.0 && r.rowsProcessed > 0) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", r.rowsProcessed / r.processingTime);
        std::cout << "Rate: " << buf << " rows/sec\n";
    }
    if (!r.errors.empty()) {
        std::cout << "\nErrors:\n";
        for (const auto &e : r.errors) {
            std::cout << "  - " << e << "\n";
        }
    }
    std::cout << kRule << std::endl;
}

void printDirectoryResults(const std::vector<piianon::processors::ProcessResult> &results)
{
    size_t ok = 0;
    size_t totalPii = 0;
    double totalTime = 0.0;
    std::vector<const piianon::processors::ProcessResult*> failed;
    for (const auto &r : results) {
        if (r.success) {
            ++ok;
        } else {
            failed.push_back(&r);
        }
        totalPii += r.piiAnonymized;
        totalTime += r.processingTime;
    }

    std::cout << "\n" << kRule << "\nPROCESSING SUMMARY\n" << kRule << "\n"
              << "Files processed: " << ok << "/" << results.size() << "\n"
              << "Total PII anonymized: " << totalPii << "\n"
              << "Total processing time: " << seconds(totalTime) << "\n";
    if (!failed.empty()) {
        std::cout << "\nErrors (" << failed.size() << " files):\n";
        for (size_t i = 0; i < failed.size() && i < 5; ++i) {
            std::cout << "  - " << failed[i]->inputPath << ": "
                      << (failed[i]->errors.empty() ? std::string("Unknown error") : failed[i]->errors.front())
                      << "\n";
        }
        if (failed.size() > 5) {
            std::cout << "  ... and " << failed.size() - 5 << " more errors\n";
        }
    }
    std::cout << kRule << std::endl;
}

void printFileResult(const piianon::processors::ProcessResult &r)
{
    std::cout << "\n" << kRule << "\nPROCESSING RESULT\n" << kRule << "\n"
              << "Input: " << r.inputPath << "\n"
              << "Output: " << r.outputPath << "\n"
              << "Status: " << (r.success ? "SUCCESS" : "FAILED") << "\n"
              << "PII found: " << r.piiFound << "\n";
    if (r.llmPiiFound > 0) {
        std::cout << "  LLM second pass: " << r.llmPiiFound << "\n";
    }
    std::cout << "PII anonymized: " << r.piiAnonymized << "\n"
              << "Processing time: " << seconds(r.processingTime) << "\n";
    if (!r.errors.empty()) {
        std::cout << "\nErrors:\n";
        for (const auto &e : r.errors) {
            std::cout << "  - " << e << "\n";
        }
    }
    if (!r.warnings.empty()) {
        std::cout << "\nWarnings:\n";
        for (const auto &w : r.warnings) {
            std::cout << "  - " << w << "\n";
        }
    }
    std::cout << kRule << std::endl;
}

size_t resolveWorkers(const CliOptions &opts, const piianon::config::PipelineConfig &cfg)
{
    if (opts.singleThreaded) {
        return 1;
    }
    size_t workers = opts.workers > 0 ? static_cast<size_t>(opts.workers) : cfg.processing.workers;
    const size_t cpus = std::max<size_t>(1, std::thread::hardware_concurrency());
    if (workers > cpus) {
        piianon::util::logger::warn("main: requested " + std::to_string(workers) + " workers, but only " +
                                    std::to_string(cpus) + " CPUs available");
        workers = cpus;
    }
    return std::max<size_t>(1, workers);
}

} // namespace

int main(int argc, char **argv)
{
    using namespace piianon;

    CliOptions opts;
    int rc = parseArgs(argc, argv, opts);
    if (rc != 0) {
        return rc < 0 ? 0 : rc;
    }
    if (!validateInput(opts)) {
        return 1;
    }

    // defaults -> file -> environment -> CLI
    config::PipelineConfig cfg;
    util::ConfigLayer merged;
    if (!opts.configPath.empty()) {
        util::mergeLayer(merged, util::ConfigParser::parseFile(opts.configPath));
    }
    util::mergeLayer(merged, util::ConfigParser::environmentLayer());
    util::mergeLayer(merged, opts.overrides);
    util::ConfigParser parser(cfg);
    parser.applyLayer(merged);

    setupLogging(cfg.logging);
    util::logger::info(std::string("main: ") + kVersion + " starting");

    std::signal(SIGINT, onSigint);

    int exitCode = 0;
    try {
        std::shared_ptr<detection::NerOracle> ner = core::createNerOracle(cfg);
        std::shared_ptr<llm::ChatBackend> chat = core::createChatBackend(cfg);

        if (opts.csvMode) {
            const size_t workers = resolveWorkers(opts, cfg);
            util::logger::info("main: CSV mode with " + std::to_string(workers) + " workers");
            processors::CsvProcessor processor(cfg, ner, chat);
            processors::CsvProcessResult result =
                processor.processCsv(opts.input, opts.output, opts.columns, workers, &g_interrupted);
            printCsvResult(result);
            exitCode = result.success ? 0 : 1;
        }
        else if (opts.dirMode) {
            processors::FileProcessor processor(cfg, ner, chat);
            std::vector<processors::ProcessResult> results =
                processor.processDirectory(opts.input, opts.output, opts.recursive, &g_interrupted);
            printDirectoryResults(results);
            const bool allOk = std::all_of(results.begin(), results.end(),
                                           [](const processors::ProcessResult &r) { return r.success; });
            exitCode = allOk ? 0 : 1;
        }
        else {
            processors::FileProcessor processor(cfg, ner, chat);
            processors::ProcessResult result = processor.processFile(opts.input, opts.output);
            printFileResult(result);
            exitCode = result.success ? 0 : 1;
        }
    }
    catch (const std::exception &ex) {
        util::logger::critical(std::string("main: fatal error: ") + ex.what());
        std::cerr << "\nFatal error: " << ex.what() << "\n";
        exitCode = 1;
    }

    if (g_interrupted.load()) {
        std::cerr << "\nInterrupted by user\n";
        return 130;
    }
    return exitCode;
}
