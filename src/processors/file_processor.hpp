#ifndef PIIANON_PROCESSORS_FILE_PROCESSOR_HPP
#define PIIANON_PROCESSORS_FILE_PROCESSOR_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "config/pipeline_config.hpp"
#include "core/audit_log.hpp"
#include "core/audit_store.hpp"
#include "core/pipeline.hpp"
#include "util/file_io.hpp"
#include "util/logger.hpp"

/**
 * @file file_processor.hpp
 * @brief Anonymizes text files one at a time, or every *.txt file of a directory.
 *
 * DESIGN GOALS:
 *   - Output lands beside the input as "<stem><suffix><ext>" unless a path is given.
 *   - Output and audit files are written through a temporary file and a rename.
 *   - A file that fails is reported in its ProcessResult; the others continue.
 *
 * USAGE:
 *   @code
 *   piianon::processors::FileProcessor processor(cfg);
 *   auto result = processor.processFile("notes.txt");
 *   // result.outputPath == "notes_anonymized.txt"
 *   @endcode
 */

namespace piianon {
namespace processors {

struct ProcessResult
{
    bool success = false;
    std::string inputPath;
    std::string outputPath;
    size_t piiFound = 0;
    size_t llmPiiFound = 0;
    size_t piiAnonymized = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    /// Seconds.
    double processingTime = 0.0;

    void addError(const std::string &error)
    {
        errors.push_back(error);
        success = false;
    }
};

/// "<output stem>_audit.json" beside the output file.
inline std::string auditPathFor(const std::string &outputPath)
{
    const std::filesystem::path p(outputPath);
    return (p.parent_path() / (p.stem().string() + "_audit.json")).string();
}

class FileProcessor
{
public:
    explicit FileProcessor(const config::PipelineConfig &cfg,
                           std::shared_ptr<detection::NerOracle> nerOracle = nullptr,
                           std::shared_ptr<llm::ChatBackend> chat = nullptr)
        : m_config(cfg),
          m_pipeline(cfg, std::move(nerOracle), std::move(chat))
    {
        if (!cfg.processing.auditDbPath.empty()) {
            m_auditStore = std::make_unique<core::AuditStore>(cfg.processing.auditDbPath);
        }
    }

    /**
     * @param outputPath Empty selects "<stem><output_suffix><ext>" beside the input.
     */
    ProcessResult processFile(const std::string &inputPath, const std::string &outputPath = "")
    {
        const auto started = std::chrono::steady_clock::now();

        ProcessResult result;
        result.inputPath = inputPath;
        runFile(result, outputPath);

        result.processingTime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        if (result.success) {
            util::logger::info("FileProcessor: " + inputPath + " -> " + result.outputPath + " (" +
                               std::to_string(result.piiAnonymized) + " anonymized)");
        } else {
            util::logger::error("FileProcessor: " + inputPath + " failed: " +
                                (result.errors.empty() ? std::string("unknown error") : result.errors.front()));
        }
        return result;
    }

    /**
     * @brief Process every *.txt file under @p inputDir, mirroring relative
     *        paths into @p outputDir (default "<inputDir>_anonymized").
     * @param cancelled Checked before each file; remaining files are skipped once set.
     */
    std::vector<ProcessResult> processDirectory(const std::string &inputDir, const std::string &outputDir = "",
                                                bool recursive = false,
                                                const std::atomic<bool> *cancelled = nullptr)
    {
        namespace fs = std::filesystem;
        std::vector<ProcessResult> results;

        std::string dirString = inputDir;
        while (dirString.size() > 1 && (dirString.back() == '/' || dirString.back() == '\\')) {
            dirString.pop_back();
        }
        const fs::path inDir(dirString);
        const fs::path outDir = outputDir.empty() ? fs::path(dirString + "_anonymized") : fs::path(outputDir);

        std::error_code ec;
        if (!fs::is_directory(inDir, ec)) {
            ProcessResult r;
            r.inputPath = inputDir;
            r.addError("Input path is not a directory: " + inputDir);
            results.push_back(r);
            return results;
        }

        std::vector<fs::path> files;
        try {
            files = listTextFiles(inDir, recursive);
        }
        catch (const fs::filesystem_error &ex) {
            ProcessResult r;
            r.inputPath = inputDir;
            r.addError(std::string("Cannot list directory: ") + ex.what());
            results.push_back(r);
            return results;
        }
        util::logger::info("FileProcessor: " + std::to_string(files.size()) + " files to process in " + inputDir);

        for (const auto &file : files) {
            if (cancelled && cancelled->load()) {
                util::logger::warn("FileProcessor: interrupted, skipping remaining files");
                break;
            }
            const fs::path rel = fs::relative(file, inDir, ec);
            const fs::path target = ec ? outDir / file.filename() : outDir / rel;
            results.push_back(processFile(file.string(), target.string()));
        }

        size_t ok = static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                                      [](const ProcessResult &r) { return r.success; }));
        util::logger::info("FileProcessor: " + std::to_string(ok) + "/" + std::to_string(results.size()) +
                           " files successful");
        return results;
    }

    core::Pipeline& pipeline() { return m_pipeline; }

private:
    static std::vector<std::filesystem::path> listTextFiles(const std::filesystem::path &dir, bool recursive)
    {
        namespace fs = std::filesystem;
        std::vector<fs::path> files;
        auto accept = [&files](const fs::directory_entry &entry) {
            std::error_code ec;
            if (entry.is_regular_file(ec) && entry.path().extension() == ".txt") {
                files.push_back(entry.path());
            }
        };
        if (recursive) {
            for (const auto &entry : fs::recursive_directory_iterator(dir)) {
                accept(entry);
            }
        } else {
            for (const auto &entry : fs::directory_iterator(dir)) {
                accept(entry);
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    void runFile(ProcessResult &result, const std::string &requestedOutput)
    {
        namespace fs = std::filesystem;
        const std::string &inputPath = result.inputPath;

        std::error_code ec;
        if (!fs::exists(inputPath, ec)) {
            result.addError("Input file not found: " + inputPath);
            return;
        }
        if (!fs::is_regular_file(inputPath, ec)) {
            result.addError("Input path is not a file: " + inputPath);
            return;
        }

        result.outputPath = requestedOutput.empty()
            ? util::siblingWithSuffix(inputPath, m_config.processing.outputSuffix)
            : requestedOutput;

        if (m_config.processing.backupOriginal) {
            const std::string backup = inputPath + ".backup";
            fs::copy_file(inputPath, backup, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                result.addError("Backup failed for " + inputPath + ": " + ec.message());
                return;
            }
            util::logger::info("FileProcessor: backup created: " + backup);
        }

        std::string text;
        try {
            text = util::readFile(inputPath);
        }
        catch (const std::exception &ex) {
            result.addError(std::string("Error reading file: ") + ex.what());
            return;
        }

        core::PipelineResult run = m_pipeline.process(text);
        result.warnings.insert(result.warnings.end(), run.warnings.begin(), run.warnings.end());
        result.piiFound = run.piiFound;
        result.llmPiiFound = run.llmPiiFound;
        result.piiAnonymized = run.piiAnonymized;
        if (!run.success()) {
            for (const auto &e : run.errors) {
                result.addError("Error processing file: " + e);
            }
            if (run.errors.empty()) {
                result.addError("Error processing file: pipeline did not complete");
            }
            return;
        }

        try {
            util::writeFileAtomic(result.outputPath, run.anonymizedText);
        }
        catch (const std::exception &ex) {
            result.addError(std::string("Error writing output: ") + ex.what());
            return;
        }

        if (m_config.processing.createAuditLog) {
            core::AuditTrail trail(anonymizers::strategyName(m_pipeline.anonymizer().strategy()));
            trail.append(run.auditEntries);
            const std::string auditPath = auditPathFor(result.outputPath);
            try {
                util::writeFileAtomic(auditPath, trail.toJson().dump(2) + "\n");
                util::logger::debug("FileProcessor: audit log written: " + auditPath);
            }
            catch (const std::exception &ex) {
                result.warnings.push_back(std::string("Audit log not written: ") + ex.what());
                util::logger::warn(std::string("FileProcessor: audit log not written: ") + ex.what());
            }
        }

        if (m_auditStore && !m_auditStore->record(inputPath, run.auditEntries)) {
            result.warnings.push_back("Audit entries not stored in " + m_auditStore->path());
        }

        result.success = true;
    }

    config::PipelineConfig m_config;
    core::Pipeline m_pipeline;
    std::unique_ptr<core::AuditStore> m_auditStore;
};

} // namespace processors
} // namespace piianon

#endif // PIIANON_PROCESSORS_FILE_PROCESSOR_HPP
