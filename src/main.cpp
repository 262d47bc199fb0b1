#include "cli.hpp"
#include "descriptors.hpp"
#include "io.hpp"
#include "utils.hpp"
#include <cxxopts.hpp>
#include <RDGeneral/RDLog.h>
#include <filesystem>
#include <vector>
#include <string>
#include <iostream>
#include <chrono>
#include <atomic>
#include <thread>
#include <utility>
#include <cstring>

#ifdef WITH_TBB
#include <tbb/global_control.h>
#include <tbb/parallel_pipeline.h>
#endif

using namespace hbacc;

namespace {

const char* VERSION = "0.1.0";

void printVersion() {
    std::cout << "\033[1;36mhbacc\033[0m (smart H-bond acceptor count) v" << VERSION << std::endl;
}

void printHelp(const cxxopts::Options& options) {
    std::cout << options.help() << std::endl;
}

struct RowBatch {
    std::vector<std::string> lines;
};

struct ParsedBatch {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> smiles;
};

struct CountedBatch {
    std::shared_ptr<MoleculeBatch> molecules;
    std::vector<std::vector<std::string>> rows;
    std::vector<int> values;
};

CountedBatch countBatch(ParsedBatch input, const descriptors::SmartHBondAcceptorCount& descriptor) {
    auto batch = std::make_shared<MoleculeBatch>(input.smiles.size());
    batch->addSmilesBatch(input.smiles);
    std::vector<int> values = calculateColumn(descriptor, *batch);
    return {std::move(batch), std::move(input.rows), std::move(values)};
}

void configureLogging(const Config& config) {
    LogLevel level = effectiveLogLevel(config);
    globalLogger.setMinLevel(level);
    if (level > LogLevel::DEBUG) {
        // RDKit reports every unparsable SMILES on its own; rows already end up as NA
        boost::logging::disable_logs("rdApp.error");
        boost::logging::disable_logs("rdApp.warning");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options = buildOptions();

    if (argc == 1 || (argc > 1 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0))) {
        printHelp(options);
        return 0;
    }

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) { printHelp(options); return 0; }
        if (result.count("version")) { printVersion(); return 0; }

        globalConfig = resolveSettings(result);
        configureLogging(globalConfig);

        if (saveRequestedSettings(result, globalConfig)) {
            std::cout << "\033[1;32m✓\033[0m Settings written to \033[1m"
                      << result["save-settings"].as<std::string>() << "\033[0m" << std::endl;
            if (isSettingsOnlyRun(result)) {
                return 0;
            }
        }

        if (!result.count("input") || !result.count("output")) {
            std::cerr << "\033[1;31mError:\033[0m input and output are required arguments." << std::endl;
            printHelp(options);
            return 1;
        }

        const std::string inputPath = result["input"].as<std::string>();
        const std::string outputPath = result["output"].as<std::string>();

        if (!std::filesystem::exists(std::filesystem::path(inputPath))) {
            globalLogger.error("Input file does not exist: " + inputPath);
            return 1;
        }

        if (globalConfig.numThreads <= 0) {
            int availableCores = static_cast<int>(std::thread::hardware_concurrency());
            globalConfig.numThreads = availableCores > 1 ? availableCores - 1 : 1;
            globalLogger.info("Auto-configured to use " + std::to_string(globalConfig.numThreads) + " threads.");
        }

#ifdef WITH_TBB
        tbb::global_control globalLimit(tbb::global_control::max_allowed_parallelism, globalConfig.numThreads);
        globalLogger.debug("TBB configured with " + std::to_string(globalConfig.numThreads) + " threads");
#endif

        globalLogger.info("Processing input file: " + inputPath);
        globalLogger.info("Output will be written to: " + outputPath);
        if (!globalConfig.verbose) {
            std::cout << "\033[1;36mProcessing:\033[0m " << inputPath << " → " << outputPath << std::endl;
        }

        CsvIO csvHandler(inputPath, outputPath, globalConfig);
        globalLogger.info("Molecule column: '" + csvHandler.getMoleculeColumnName() + "', result column: '" +
                          csvHandler.getOutputColumnName() + "'");

        const descriptors::SmartHBondAcceptorCount descriptor;
        CsvIO::ResultWriter resultWriter = csvHandler.createResultWriter();
        CsvIO::LineReader lineReader = csvHandler.createLineReader();

        size_t estimatedLines = lineReader.estimateTotalLines();
        globalLogger.info("Estimated " + std::to_string(estimatedLines) + " data lines in CSV file.");

        ProgressBar progressBar(estimatedLines, "Counting", 100);
        progressBar.start();
        auto startTime = std::chrono::steady_clock::now();

        const size_t batchSize = globalConfig.batchSize;
        const std::string delimiter = csvHandler.getDelimiter();
        const std::string escapeChar = csvHandler.getEscapeChar();
        const int molIndex = csvHandler.getMoleculeIndex();
        size_t processedCount = 0;
        size_t invalidCount = 0;
        std::atomic<bool> writeFailed{false};

        auto writeCounted = [&](const CountedBatch& data) {
            const auto& molecules = data.molecules->getMolecules();
            if (!resultWriter.writeBatch(molecules, data.rows, data.values)) {
                writeFailed = true;
            }
            invalidCount += molecules.size() - data.molecules->countValid();
            processedCount += molecules.size();
            progressBar.update(molecules.size());
        };

#ifdef WITH_TBB
        try {
            tbb::parallel_pipeline(
                static_cast<size_t>(globalConfig.numThreads) * 2,
                // Stage 1: Read batch (serial)
                tbb::make_filter<void, RowBatch>(
                    tbb::filter_mode::serial_in_order,
                    [&](tbb::flow_control& fc) -> RowBatch {
                        RowBatch data;
                        if (writeFailed || !lineReader.readBatch(data.lines, batchSize)) {
                            fc.stop();
                        }
                        return data;
                    }
                ) &
                // Stage 2: Split rows and extract SMILES (parallel)
                tbb::make_filter<RowBatch, ParsedBatch>(
                    tbb::filter_mode::parallel,
                    [&](const RowBatch& input) -> ParsedBatch {
                        ParsedBatch data;
                        CsvIO::splitRows(input.lines, delimiter, escapeChar, molIndex, data.rows, data.smiles);
                        return data;
                    }
                ) &
                // Stage 3: Parse molecules and count acceptors (parallel)
                tbb::make_filter<ParsedBatch, CountedBatch>(
                    tbb::filter_mode::parallel,
                    [&](ParsedBatch input) -> CountedBatch {
                        return countBatch(std::move(input), descriptor);
                    }
                ) &
                // Stage 4: Write results (serial, input order)
                tbb::make_filter<CountedBatch, void>(
                    tbb::filter_mode::serial_in_order,
                    [&](const CountedBatch& data) {
                        writeCounted(data);
                    }
                )
            );
        } catch (const std::exception& e) {
            progressBar.finish();
            globalLogger.fatal("Processing pipeline error: " + std::string(e.what()));
            return 1;
        }
#else
        globalLogger.warning("TBB not enabled. Running single-threaded.");
        RowBatch rawBatch;
        while (!writeFailed && lineReader.readBatch(rawBatch.lines, batchSize)) {
            ParsedBatch parsed;
            CsvIO::splitRows(rawBatch.lines, delimiter, escapeChar, molIndex, parsed.rows, parsed.smiles);
            writeCounted(countBatch(std::move(parsed), descriptor));
        }
#endif
        resultWriter.flush();
        progressBar.finish();

        if (writeFailed) {
            globalLogger.error("Failed to write results to " + outputPath);
            return 1;
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);

        std::cout << "\033[1;32m✓\033[0m Processed \033[1m" << processedCount << "\033[0m rows";
        if (invalidCount > 0) {
            std::cout << " (\033[1;33m" << invalidCount << "\033[0m invalid molecules written as NA)";
        }
        std::cout << std::endl;
        std::cout << "\033[1;32m✓\033[0m Results written to \033[1m" << outputPath << "\033[0m" << std::endl;
        std::cout << "\033[1;32m✓\033[0m Total processing time: \033[1m" << (duration.count() / 1000.0) << "\033[0m seconds" << std::endl;

        globalLogger.info("Processing complete. " + std::to_string(processedCount) + " rows, " +
                          std::to_string(invalidCount) + " invalid molecules.");

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "\033[1;31mError parsing options:\033[0m " << e.what() << std::endl;
        return 1;
    } catch (const DescriptorException& e) {
        std::cerr << "\033[1;31mError:\033[0m " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\033[1;31mError:\033[0m " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
