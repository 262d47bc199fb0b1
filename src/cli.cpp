#include "cli.hpp"

namespace hbacc {

cxxopts::Options buildOptions() {
    cxxopts::Options options("\033[1;36mhbacc\033[0m", "Smart hydrogen-bond acceptor count (nHBAcc) for molecules in CSV files");

    options.add_options("Basic")
        ("h,help", "Display help information")
        ("v,version", "Display version information");

    options.add_options("Input/Output")
        ("i,input", "Input CSV file path", cxxopts::value<std::string>())
        ("o,output", "Output CSV file path", cxxopts::value<std::string>());

    options.add_options("CSV Options")
        ("s,smiles-column", "Name or index of the column containing SMILES (default: SMILES)", cxxopts::value<std::string>())
        ("c,column-name", "Name of the appended result column (default: nHBAcc)", cxxopts::value<std::string>())
        ("delimiter", "CSV delimiter character (default: ,)", cxxopts::value<std::string>())
        ("no-header", "Input CSV file has no header")
        ("escapechar", "CSV escape character (disables standard \"\" quoting)", cxxopts::value<std::string>());

    options.add_options("Settings")
        ("settings", "Load settings from a JSON file", cxxopts::value<std::string>())
        ("save-settings", "Write the effective settings to a JSON file", cxxopts::value<std::string>());

    options.add_options("Performance")
        ("b,batch-size", "Number of molecules to process per batch (default: 64)", cxxopts::value<size_t>())
        ("t,threads", "Number of parallel threads (0=auto)", cxxopts::value<int>())
        ("log-level", "Minimum log level: DEBUG, INFO, WARNING, ERROR, FATAL", cxxopts::value<std::string>())
        ("verbose", "Enable detailed logging output");

    options.positional_help("\033[1m-i <input file>\033[0m \033[1m-o <output file>\033[0m");
    options.set_width(100);
    return options;
}

void applyOptions(const cxxopts::ParseResult& result, Config& config) {
    if (result.count("smiles-column")) config.molColumn = result["smiles-column"].as<std::string>();
    if (result.count("column-name")) config.outputColumn = result["column-name"].as<std::string>();
    if (result.count("delimiter")) config.delimiter = result["delimiter"].as<std::string>();
    if (result.count("no-header")) config.hasHeader = false;
    if (result.count("escapechar")) config.escapeChar = result["escapechar"].as<std::string>();
    if (result.count("batch-size")) config.batchSize = result["batch-size"].as<size_t>();
    if (result.count("threads")) config.numThreads = result["threads"].as<int>();
    if (result.count("verbose")) config.verbose = true;
    if (result.count("log-level")) config.logLevel = result["log-level"].as<std::string>();
}

Config resolveSettings(const cxxopts::ParseResult& result) {
    Config config;
    if (result.count("settings")) {
        const std::string settingsPath = result["settings"].as<std::string>();
        config = Config::loadFromFile(settingsPath);
        config.validate();
        globalLogger.info("Loaded settings from " + settingsPath);
    }
    applyOptions(result, config);
    config.validate();
    return config;
}

LogLevel effectiveLogLevel(const Config& config) {
    return config.verbose ? LogLevel::DEBUG : parseLogLevel(config.logLevel);
}

bool saveRequestedSettings(const cxxopts::ParseResult& result, const Config& config) {
    if (!result.count("save-settings")) return false;
    config.saveToFile(result["save-settings"].as<std::string>());
    return true;
}

bool isSettingsOnlyRun(const cxxopts::ParseResult& result) {
    return result.count("save-settings") && !result.count("input") && !result.count("output");
}

} // namespace hbacc
