#ifndef PIIANON_PROCESSORS_CSV_PROCESSOR_HPP
#define PIIANON_PROCESSORS_CSV_PROCESSOR_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "anonymizers/replacement_cache.hpp"
#include "config/pipeline_config.hpp"
#include "core/pipeline.hpp"
#include "llm/llm_detector.hpp"
#include "util/csv.hpp"
#include "util/file_io.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"
#include "util/thread_pool.hpp"

/**
 * @file csv_processor.hpp
 * @brief Anonymizes selected columns of a CSV file, row-parallel.
 *
 * DESIGN GOALS:
 *   - Rows are partitioned by index (row % N); each of the N worker tasks
 *     builds its own Pipeline and writes into a pre-sized result vector, so
 *     output rows keep their input order.
 *   - A row that fails keeps its original content and counts in rowsFailed.
 *   - With the LLM pass enabled, every processed cell goes through one
 *     LlmSecondPass batch after the workers finish.
 *
 * USAGE:
 *   @code
 *   piianon::processors::CsvProcessor csv(cfg);
 *   auto result = csv.processCsv("tickets.csv", "", {"notes", "email"}, 4);
 *   // result.outputPath == "tickets_anonymized.csv"
 *   @endcode
 */

namespace piianon {
namespace processors {

struct CsvProcessResult
{
    bool success = false;
    std::string inputPath;
    std::string outputPath;
    size_t rowsProcessed = 0;
    size_t rowsFailed = 0;
    size_t totalPiiFound = 0;
    size_t llmPiiFound = 0;
    /// Seconds.
    double processingTime = 0.0;
    size_t workersUsed = 1;
    std::vector<std::string> errors;
};

class CsvProcessor
{
public:
    explicit CsvProcessor(const config::PipelineConfig &cfg,
                          std::shared_ptr<detection::NerOracle> nerOracle = nullptr,
                          std::shared_ptr<llm::ChatBackend> chat = nullptr)
        : m_config(cfg),
          m_nerOracle(std::move(nerOracle)),
          m_chat(std::move(chat))
    {
    }

    /**
     * @param outputPath Empty selects "<stem>_anonymized<ext>" beside the input.
     * @param columns Header names to process; empty processes every column.
     * @param workers Worker count; 0 or 1 runs on a single worker.
     * @param cancelled Checked before each row; once set the run stops and writes nothing.
     */
    CsvProcessResult processCsv(const std::string &inputPath, const std::string &outputPath = "",
                                const std::vector<std::string> &columns = {}, size_t workers = 1,
                                const std::atomic<bool> *cancelled = nullptr)
    {
        const auto started = std::chrono::steady_clock::now();
        CsvProcessResult result;
        result.inputPath = inputPath;
        result.outputPath = outputPath.empty() ? util::siblingWithSuffix(inputPath, "_anonymized") : outputPath;

        try {
            run(result, columns, workers, cancelled);
        }
        catch (const std::exception &ex) {
            result.success = false;
            result.errors.push_back(ex.what());
            util::logger::error(std::string("CsvProcessor: ") + ex.what());
        }

        result.processingTime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        return result;
    }

private:
    struct CellResult
    {
        size_t column;
        core::PipelineResult pipeline;
    };

    struct RowOutcome
    {
        util::csv::Record fields;
        std::vector<CellResult> cells;
        size_t piiFound = 0;
        bool failed = false;
        std::string error;
    };

    void run(CsvProcessResult &result, const std::vector<std::string> &columns, size_t workers,
             const std::atomic<bool> *cancelled)
    {
        std::vector<util::csv::Record> records = util::csv::parse(util::readFile(result.inputPath));
        if (records.size() < 2) {
            result.errors.push_back("CSV file is empty");
            return;
        }

        const util::csv::Record header = records.front();
        std::vector<size_t> selected = selectColumns(header, columns, result);
        if (!result.errors.empty()) {
            return;
        }

        std::vector<util::csv::Record> rows(std::make_move_iterator(records.begin() + 1),
                                            std::make_move_iterator(records.end()));
        const size_t n = std::max<size_t>(1, std::min(workers, rows.size()));
        result.workersUsed = n;

        std::shared_ptr<anonymizers::ReplacementCache> sharedCache;
        if (m_config.processing.sharedReplacementCache) {
            sharedCache = std::make_shared<anonymizers::ReplacementCache>();
        }
        std::vector<std::shared_ptr<anonymizers::ReplacementCache>> caches;
        for (size_t w = 0; w < n; ++w) {
            caches.push_back(sharedCache ? sharedCache : std::make_shared<anonymizers::ReplacementCache>());
        }

        util::logger::info("CsvProcessor: " + std::to_string(rows.size()) + " rows, " +
                           std::to_string(selected.size()) + " columns, " + std::to_string(n) + " workers");

        std::vector<RowOutcome> outcomes(rows.size());
        {
            util::ThreadPool pool(n);
            std::vector<std::future<void>> futures;
            for (size_t w = 0; w < n; ++w) {
                futures.push_back(pool.enqueue([&, w]() {
                    processPartition(w, n, rows, selected, caches[w], outcomes, cancelled);
                }));
            }
            for (size_t w = 0; w < n; ++w) {
                try {
                    futures[w].get();
                }
                catch (const std::exception &ex) {
                    util::logger::error("CsvProcessor: worker " + std::to_string(w) + " failed: " + ex.what());
                    for (size_t r = w; r < rows.size(); r += n) {
                        if (outcomes[r].fields.empty()) {
                            markFailed(outcomes[r], rows[r], ex.what());
                        }
                    }
                }
            }
        }

        if (cancelled && cancelled->load()) {
            result.errors.push_back("interrupted");
            return;
        }

        if (m_chat) {
            runSecondPass(outcomes, caches, result);
        }

        std::string out = util::csv::formatRecord(header);
        for (size_t r = 0; r < outcomes.size(); ++r) {
            const RowOutcome &o = outcomes[r];
            if (o.failed) {
                ++result.rowsFailed;
                result.errors.push_back("Row " + std::to_string(r + 1) + ": " + o.error);
            } else {
                result.totalPiiFound += o.piiFound;
            }
            out += util::csv::formatRecord(o.fields);
        }
        util::writeFileAtomic(result.outputPath, out);

        result.rowsProcessed = rows.size();
        result.totalPiiFound += result.llmPiiFound;
        result.success = true;
        util::logger::info("CsvProcessor: wrote " + result.outputPath + " (" + std::to_string(result.rowsFailed) +
                           " rows failed)");
    }

    static std::vector<size_t> selectColumns(const util::csv::Record &header, const std::vector<std::string> &columns,
                                             CsvProcessResult &result)
    {
        std::vector<size_t> selected;
        if (columns.empty()) {
            for (size_t i = 0; i < header.size(); ++i) {
                selected.push_back(i);
            }
            return selected;
        }
        std::vector<std::string> missing;
        for (const auto &c : columns) {
            auto it = std::find(header.begin(), header.end(), c);
            if (it == header.end()) {
                missing.push_back(c);
            } else {
                selected.push_back(static_cast<size_t>(it - header.begin()));
            }
        }
        if (!missing.empty()) {
            result.errors.push_back("Columns not found: " + util::join(missing, ", "));
        }
        return selected;
    }

    static void markFailed(RowOutcome &outcome, const util::csv::Record &original, const std::string &error)
    {
        outcome.fields = original;
        outcome.cells.clear();
        outcome.piiFound = 0;
        outcome.failed = true;
        outcome.error = error;
    }

    void processPartition(size_t worker, size_t stride, const std::vector<util::csv::Record> &rows,
                          const std::vector<size_t> &selected,
                          const std::shared_ptr<anonymizers::ReplacementCache> &cache,
                          std::vector<RowOutcome> &outcomes, const std::atomic<bool> *cancelled) const
    {
        core::Pipeline pipeline(m_config, m_nerOracle, nullptr, cache);

        for (size_t r = worker; r < rows.size(); r += stride) {
            if (cancelled && cancelled->load()) {
                return;
            }
            RowOutcome &outcome = outcomes[r];
            try {
                outcome.fields = rows[r];
                for (size_t col : selected) {
                    if (col >= outcome.fields.size() || outcome.fields[col].empty()) {
                        continue;
                    }
                    core::PipelineResult cell = pipeline.runFirstPass(outcome.fields[col]);
                    if (cell.finalState != core::PipelineState::Anonymizing) {
                        throw std::runtime_error(cell.errors.empty() ? std::string("pipeline failed")
                                                                     : cell.errors.front());
                    }
                    outcome.fields[col] = cell.anonymizedText;
                    outcome.piiFound += cell.piiFound;
                    outcome.cells.push_back(CellResult{col, std::move(cell)});
                }
            }
            catch (const std::exception &ex) {
                util::logger::error("CsvProcessor: row " + std::to_string(r + 1) + " failed: " + ex.what());
                markFailed(outcome, rows[r], ex.what());
            }
        }
    }

    /**
     * Row r is finished by a pipeline over worker (r % N)'s cache, so a value
     * the LLM finds again keeps the replacement it got in the first pass.
     */
    void runSecondPass(std::vector<RowOutcome> &outcomes,
                       const std::vector<std::shared_ptr<anonymizers::ReplacementCache>> &caches,
                       CsvProcessResult &result)
    {
        std::vector<std::unique_ptr<core::Pipeline>> pipelines;
        for (const auto &cache : caches) {
            pipelines.push_back(std::make_unique<core::Pipeline>(m_config, nullptr, m_chat, cache));
        }
        llm::LlmDetector *detector = pipelines.front()->llmDetector();
        if (!detector) {
            return;
        }

        std::vector<std::pair<size_t, size_t>> refs;
        std::vector<std::string> texts;
        for (size_t r = 0; r < outcomes.size(); ++r) {
            if (outcomes[r].failed) {
                continue;
            }
            for (size_t c = 0; c < outcomes[r].cells.size(); ++c) {
                refs.emplace_back(r, c);
                texts.push_back(outcomes[r].cells[c].pipeline.anonymizedText);
            }
        }

        llm::LlmSecondPass pass(*detector, m_config.llm.maxConcurrent, m_config.processing.showProgress);
        std::vector<std::vector<core::Span>> found = pass.detectBatch(texts);

        for (size_t k = 0; k < refs.size(); ++k) {
            RowOutcome &outcome = outcomes[refs[k].first];
            CellResult &cell = outcome.cells[refs[k].second];
            core::Pipeline &pipeline = *pipelines[refs[k].first % pipelines.size()];
            pipeline.runSecondPass(cell.pipeline, found[k]);
            if (!cell.pipeline.success()) {
                result.errors.push_back("Row " + std::to_string(refs[k].first + 1) + ": LLM pass failed");
                continue;
            }
            outcome.fields[cell.column] = cell.pipeline.anonymizedText;
            result.llmPiiFound += cell.pipeline.llmPiiFound;
        }
    }

    config::PipelineConfig m_config;
    std::shared_ptr<detection::NerOracle> m_nerOracle;
    std::shared_ptr<llm::ChatBackend> m_chat;
};

} // namespace processors
} // namespace piianon

#endif // PIIANON_PROCESSORS_CSV_PROCESSOR_HPP
