#include "utils.hpp"

// RDKit includes for implementation
#include <GraphMol/GraphMol.h>
#include <GraphMol/SanitException.h>
#include <GraphMol/SmilesParse/SmilesParse.h>
#include <GraphMol/SmilesParse/SmilesWrite.h>

// RapidJSON includes for Config persistence
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>

// TBB includes (conditionally)
#ifdef WITH_TBB
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#endif

// Includes for ProgressBar display
#include <unistd.h>
#include <sys/ioctl.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib> // For getenv
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace hbacc {

// --- Global Variables ---
Config globalConfig;
Logger globalLogger(LogLevel::WARNING, std::cout, std::cerr, true);

// --- DescriptorException ---
DescriptorException::DescriptorException(const std::string& message, ErrorCode code)
    : std::runtime_error(message), code(code) {}

ErrorCode DescriptorException::getCode() const { return code; }

// --- Utility Functions ---
namespace util {
    std::string getTimeStamp() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::tm localTime{};
        localtime_r(&in_time_t, &localTime);
        std::stringstream ss;
        ss << std::put_time(&localTime, "%Y-%m-%d %X");
        return ss.str();
    }

    std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r\f\v");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\n\r\f\v");
        return str.substr(first, last - first + 1);
    }
}

// --- Config Implementation ---
void Config::validate() const {
    if (util::trim(molColumn).empty()) {
        throw DescriptorException("No molecule column chosen", ErrorCode::PARSE_ERROR);
    }
    if (util::trim(outputColumn).empty()) {
        throw DescriptorException("Output column name must not be empty", ErrorCode::PARSE_ERROR);
    }
    if (delimiter.size() != 1) {
        throw DescriptorException("Delimiter must be a single character, got '" + delimiter + "'",
                                  ErrorCode::PARSE_ERROR);
    }
    if (escapeChar.size() > 1) {
        throw DescriptorException("Escape character must be empty or a single character, got '" + escapeChar + "'",
                                  ErrorCode::PARSE_ERROR);
    }
    if (batchSize == 0) {
        throw DescriptorException("Batch size must be at least 1", ErrorCode::PARSE_ERROR);
    }
    parseLogLevel(logLevel);
}

std::string Config::toJSON() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("mol_column"); writer.String(molColumn.c_str());
    writer.Key("output_column"); writer.String(outputColumn.c_str());
    writer.Key("delimiter"); writer.String(delimiter.c_str());
    writer.Key("has_header"); writer.Bool(hasHeader);
    writer.Key("escape_char"); writer.String(escapeChar.c_str());
    writer.Key("batch_size"); writer.Uint64(batchSize);
    writer.Key("threads"); writer.Int(numThreads);
    writer.Key("verbose"); writer.Bool(verbose);
    writer.Key("log_level"); writer.String(logLevel.c_str());
    writer.EndObject();
    return buffer.GetString();
}

Config Config::fromJSON(const std::string& json) {
    rapidjson::Document document;
    document.Parse(json.c_str());
    if (document.HasParseError()) {
        throw DescriptorException("Malformed settings JSON at offset " +
                                  std::to_string(document.GetErrorOffset()) + ": " +
                                  rapidjson::GetParseError_En(document.GetParseError()),
                                  ErrorCode::PARSE_ERROR);
    }
    if (!document.IsObject()) {
        throw DescriptorException("Settings JSON must be an object", ErrorCode::PARSE_ERROR);
    }

    // Missing or mistyped members keep their defaults
    Config config;
    if (document.HasMember("mol_column") && document["mol_column"].IsString()) {
        config.molColumn = document["mol_column"].GetString();
    }
    if (document.HasMember("output_column") && document["output_column"].IsString()) {
        config.outputColumn = document["output_column"].GetString();
    }
    if (document.HasMember("delimiter") && document["delimiter"].IsString()) {
        config.delimiter = document["delimiter"].GetString();
    }
    if (document.HasMember("has_header") && document["has_header"].IsBool()) {
        config.hasHeader = document["has_header"].GetBool();
    }
    if (document.HasMember("escape_char") && document["escape_char"].IsString()) {
        config.escapeChar = document["escape_char"].GetString();
    }
    if (document.HasMember("batch_size") && document["batch_size"].IsUint64()) {
        config.batchSize = static_cast<size_t>(document["batch_size"].GetUint64());
    }
    if (document.HasMember("threads") && document["threads"].IsInt()) {
        config.numThreads = document["threads"].GetInt();
    }
    if (document.HasMember("verbose") && document["verbose"].IsBool()) {
        config.verbose = document["verbose"].GetBool();
    }
    if (document.HasMember("log_level") && document["log_level"].IsString()) {
        config.logLevel = document["log_level"].GetString();
    }
    return config;
}

void Config::saveToFile(const std::string& path) const {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw DescriptorException("Failed to open settings file for writing: " + path, ErrorCode::IO_ERROR);
    }
    file << toJSON() << "\n";
    if (!file.good()) {
        throw DescriptorException("Failed to write settings file: " + path, ErrorCode::IO_ERROR);
    }
}

Config Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DescriptorException("Failed to open settings file: " + path, ErrorCode::IO_ERROR);
    }
    std::stringstream contents;
    contents << file.rdbuf();
    return fromJSON(contents.str());
}

// --- Logger Implementation ---
LogLevel parseLogLevel(const std::string& name) {
    std::string upper = util::trim(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    throw DescriptorException("Unknown log level: " + name, ErrorCode::PARSE_ERROR);
}

Logger::Logger(LogLevel minLevel, std::ostream& out_stream, std::ostream& err_stream, bool colorEnabled)
    : minLevel(minLevel), out(out_stream), err_out(err_stream),
      colorEnabled(colorEnabled), activeProgressBar(nullptr) {}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

const char* Logger::levelToColor(LogLevel level) const {
    if (!colorEnabled || !isatty(fileno(stderr))) return "";

    switch (level) {
        case LogLevel::DEBUG:   return "\033[38;5;250m";
        case LogLevel::INFO:    return "\033[38;5;44m";
        case LogLevel::WARNING: return "\033[38;5;208m";
        case LogLevel::ERROR:   return "\033[38;5;203m";
        case LogLevel::FATAL:   return "\033[38;5;199m";
        default:                return "\033[0m";
    }
}

std::string Logger::formatMessage(LogLevel level, const std::string& message) const {
    const char* color = levelToColor(level);
    const char* reset = (color[0] == '\0') ? "" : "\033[0m";
    std::stringstream ss;
    if (minLevel == LogLevel::DEBUG) {
        ss << util::getTimeStamp() << " ";
    }
    ss << color << "[" << levelToString(level) << "]" << reset << " " << message;
    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < minLevel) return;
    std::lock_guard<std::mutex> lock(logMutex);

    std::ostream& target_out = (level >= LogLevel::WARNING) ? err_out : out;

    if (activeProgressBar) {
        if (level < LogLevel::ERROR) {
            bufferedMessages.emplace_back(level, message);
            return;
        }
        std::string formattedMessage = formatMessage(level, message);
        activeProgressBar->temporarilyPauseDisplay([&]() {
            flushBufferedMessages();
            target_out << formattedMessage << std::endl;
        });
        return;
    }
    target_out << formatMessage(level, message) << std::endl;
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warning(const std::string& message) { log(LogLevel::WARNING, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }
void Logger::fatal(const std::string& message) { log(LogLevel::FATAL, message); }

void Logger::setMinLevel(LogLevel level) { minLevel = level; }

void Logger::setActiveProgressBar(ProgressBar* progressBar) {
    std::lock_guard<std::mutex> lock(logMutex);
    activeProgressBar = progressBar;
    bufferedMessages.clear();
}

void Logger::clearActiveProgressBar() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (activeProgressBar) {
        flushBufferedMessages();
        activeProgressBar = nullptr;
    }
}

// Caller holds logMutex
void Logger::flushBufferedMessages() {
    for (const auto& [level, message] : bufferedMessages) {
        std::ostream& target_out = (level >= LogLevel::WARNING) ? err_out : out;
        target_out << formatMessage(level, message) << std::endl;
    }
    bufferedMessages.clear();
}

// --- ProgressBar Implementation ---
ProgressBar::ProgressBar(size_t total, const std::string& description, int updateFrequencyMs)
    : total(total), description(description), updateFrequency(updateFrequencyMs) {}

ProgressBar::~ProgressBar() {
    finish();
}

void ProgressBar::start() {
    if (active.exchange(true)) return;
    startTime = std::chrono::steady_clock::now();
    globalLogger.setActiveProgressBar(this);
    displayThread = std::thread(&ProgressBar::displayLoop, this);
}

void ProgressBar::update(size_t increment) {
    current.fetch_add(increment, std::memory_order_relaxed);
}

void ProgressBar::finish() {
    if (!active.exchange(false)) return;
    if (displayThread.joinable()) {
        displayThread.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        clearLine();
        renderFinal();
        std::cout << std::endl;
    }
    globalLogger.clearActiveProgressBar();
}

double ProgressBar::getProgress() const {
    size_t totalVal = total.load(std::memory_order_relaxed);
    if (totalVal == 0) return 0.0;
    return std::min(static_cast<double>(current.load(std::memory_order_relaxed)) / totalVal, 1.0);
}

std::chrono::milliseconds ProgressBar::getElapsedTime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
}

std::chrono::milliseconds ProgressBar::getEstimatedTimeRemaining() const {
    double progress = getProgress();
    auto elapsedMs = getElapsedTime().count();
    if (progress <= 1e-6 || elapsedMs <= 0) {
        return std::chrono::milliseconds(0);
    }
    double remainingMs = static_cast<double>(elapsedMs) / progress - elapsedMs;
    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, remainingMs)));
}

void ProgressBar::displayLoop() {
    while (active.load()) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            render();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(updateFrequency));
    }
}

void ProgressBar::clearLine() {
    std::cout << "\r\033[K" << std::flush;
}

int ProgressBar::getTerminalWidth() const {
    int termWidth = 80;
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        termWidth = w.ws_col;
    } else if (const char* colsEnv = getenv("COLUMNS")) {
        int parsed = std::atoi(colsEnv);
        if (parsed > 0) termWidth = parsed;
    }
    return std::max(40, std::min(termWidth, 250));
}

// Caller holds mutex
void ProgressBar::render() {
    size_t currentVal = current.load(std::memory_order_relaxed);
    size_t totalVal = total.load(std::memory_order_relaxed);
    double seconds = getElapsedTime().count() / 1000.0;
    double rate = seconds > 0.01 ? currentVal / seconds : 0.0;

    int termWidth = getTerminalWidth();
    int barWidth = std::max(10, std::min(40, termWidth / 4));

    std::stringstream ss;
    ss << "\r\033[K" << description << " ";
    ss << "\033[38;5;45m" << static_cast<int>(getProgress() * 100) << "%\033[0m ";
    ss << getBlockBar(getProgress(), barWidth) << " ";
    ss << "\033[1m" << currentVal << "/" << totalVal << "\033[0m ";
    if (termWidth >= 80) {
        ss << "\033[38;5;208m" << std::fixed << std::setprecision(1) << rate << "/s\033[0m ";
        ss << "\033[38;5;105mETA: " << getETA() << "\033[0m";
    }
    std::cout << ss.str() << std::flush;
}

void ProgressBar::renderFinal() {
    double seconds = getElapsedTime().count() / 1000.0;
    size_t finalCount = current.load(std::memory_order_relaxed);
    double rate = seconds > 0.01 ? finalCount / seconds : 0.0;

    std::stringstream ss;
    ss << "\033[38;5;40m✓\033[0m " << description << " \033[1m" << finalCount << " rows\033[0m";
    ss << " \033[38;5;208m" << std::fixed << std::setprecision(1) << rate << " it/s\033[0m";
    ss << " \033[38;5;105m" << std::fixed << std::setprecision(2) << seconds << "s\033[0m";
    std::cout << ss.str();
}

void ProgressBar::temporarilyPauseDisplay(const std::function<void()>& callback) {
    std::lock_guard<std::mutex> lock(mutex);
    clearLine();
    callback();
    if (active.load()) render();
}

std::string ProgressBar::getBlockBar(double progress, int width) const {
    static const char* blocks[] = {" ", "▏", "▎", "▍", "▌", "▋", "▊", "▉", "█"};
    double scaled = progress * width;
    int fullBlocks = static_cast<int>(std::floor(scaled));
    int remainder = static_cast<int>((scaled - fullBlocks) * 8);

    std::stringstream bar;
    bar << "\033[38;5;39m";
    for (int i = 0; i < fullBlocks; i++) {
        bar << "█";
    }
    if (fullBlocks < width) {
        bar << blocks[remainder];
        for (int i = fullBlocks + 1; i < width; i++) {
            bar << " ";
        }
    }
    bar << "\033[0m";
    return bar.str();
}

std::string ProgressBar::getETA() const {
    auto seconds = getEstimatedTimeRemaining().count() / 1000;
    if (seconds <= 0) return "0s";
    std::stringstream eta;
    if (seconds >= 3600) {
        eta << seconds / 3600 << "h " << (seconds % 3600) / 60 << "m";
    } else if (seconds >= 60) {
        eta << seconds / 60 << "m " << seconds % 60 << "s";
    } else {
        eta << seconds << "s";
    }
    return eta.str();
}

// --- Molecule Implementation ---
Molecule::Molecule() : valid(false) {}

Molecule::Molecule(const std::string& smilesStr) : originalSmiles(smilesStr), valid(false) {
    parse(smilesStr);
}

bool Molecule::parse(const std::string& smilesStr) {
    originalSmiles = smilesStr;
    mol = nullptr;
    smiles.clear();
    valid = false;
    errorMessage.clear();

    std::string trimmed = util::trim(smilesStr);
    if (trimmed.empty()) {
        errorMessage = "Input SMILES string is empty.";
        return false;
    }

    try {
        std::unique_ptr<RDKit::RWMol> rawMol(RDKit::SmilesToMol(trimmed));
        if (!rawMol) {
            errorMessage = "RDKit failed to parse SMILES (returned null).";
            return false;
        }
        mol.reset(rawMol.release());
        smiles = RDKit::MolToSmiles(*mol);
        valid = true;
        return true;
    } catch (const RDKit::MolSanitizeException& e) {
        errorMessage = "RDKit Sanity Exception during SMILES parse: " + std::string(e.what());
    } catch (const std::exception& e) {
        errorMessage = "Error parsing SMILES: " + std::string(e.what());
    }
    mol = nullptr;
    return false;
}

bool Molecule::isValid() const { return valid; }
const std::string& Molecule::getErrorMessage() const { return errorMessage; }
std::shared_ptr<RDKit::ROMol> Molecule::getMolecule() const { return mol; }
const std::string& Molecule::getSmiles() const { return smiles; }
const std::string& Molecule::getOriginalSmiles() const { return originalSmiles; }


// --- MoleculeBatch Implementation ---
MoleculeBatch::MoleculeBatch(size_t initialSize) {
    molecules.reserve(initialSize);
}

void MoleculeBatch::addSmilesBatch(const std::vector<std::string>& smilesVec) {
    molecules.clear();
    molecules.resize(smilesVec.size());

#ifdef WITH_TBB
    tbb::parallel_for(tbb::blocked_range<size_t>(0, smilesVec.size()),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i != range.end(); ++i) {
                if (!molecules[i].parse(smilesVec[i])) {
                    globalLogger.debug("Skipping invalid SMILES: " + smilesVec[i] + " - " + molecules[i].getErrorMessage());
                }
            }
        });
#else
    for (size_t i = 0; i < smilesVec.size(); ++i) {
        if (!molecules[i].parse(smilesVec[i])) {
            globalLogger.debug("Skipping invalid SMILES: " + smilesVec[i] + " - " + molecules[i].getErrorMessage());
        }
    }
#endif
}

size_t MoleculeBatch::size() const {
    return molecules.size();
}

size_t MoleculeBatch::countValid() const {
    return static_cast<size_t>(std::count_if(molecules.begin(), molecules.end(),
                                             [](const Molecule& m) { return m.isValid(); }));
}

const std::vector<Molecule>& MoleculeBatch::getMolecules() const {
    return molecules;
}

} // namespace hbacc
