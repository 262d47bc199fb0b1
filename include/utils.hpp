#pragma once

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <chrono>
#include <mutex>
#include <atomic>
#include <thread>
#include <functional>
#include <utility>
#include <ostream>
#include <iostream> // For default std::cout in Logger

// RDKit Forward Declarations
namespace RDKit {
    class ROMol;
    class RWMol;
}

namespace hbacc {

enum class ErrorCode {
    SUCCESS = 0,
    PARSE_ERROR,
    IO_ERROR,
    CALCULATION_ERROR,
    UNKNOWN_ERROR
};

class DescriptorException : public std::runtime_error {
private:
    ErrorCode code;

public:
    DescriptorException(const std::string& message, ErrorCode code = ErrorCode::UNKNOWN_ERROR);
    ErrorCode getCode() const;
};

// Settings of the tabular host. Persisted as JSON with saveToFile/loadFromFile.
struct Config {
    int numThreads = 0;             // 0 = auto
    bool verbose = false;
    std::string logLevel = "WARNING";
    size_t batchSize = 64;

    std::string molColumn = "SMILES";   // column name, or numeric index
    std::string outputColumn = "nHBAcc";
    std::string delimiter = ",";
    bool hasHeader = true;
    std::string escapeChar;

    // Throws DescriptorException(PARSE_ERROR) on unusable settings
    void validate() const;

    std::string toJSON() const;
    static Config fromJSON(const std::string& json);

    void saveToFile(const std::string& path) const;
    static Config loadFromFile(const std::string& path);
};

extern Config globalConfig;

namespace util {
    std::string getTimeStamp();
    std::string trim(const std::string& str);
}


enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

LogLevel parseLogLevel(const std::string& name);

class ProgressBar;

class Logger {
private:
    LogLevel minLevel;
    std::mutex logMutex;
    std::ostream& out;
    std::ostream& err_out;
    bool colorEnabled;
    ProgressBar* activeProgressBar;
    std::vector<std::pair<LogLevel, std::string>> bufferedMessages;

    static const char* levelToString(LogLevel level);
    const char* levelToColor(LogLevel level) const;
    std::string formatMessage(LogLevel level, const std::string& message) const;
    void flushBufferedMessages();

public:
    Logger(LogLevel minLevel = LogLevel::WARNING,
          std::ostream& out_stream = std::cout,
          std::ostream& err_stream = std::cerr,
          bool colorEnabled = true);

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    void setMinLevel(LogLevel level);
    LogLevel getMinLevel() const { return minLevel; }

    // While a bar is active, messages below ERROR are held back until it finishes
    void setActiveProgressBar(ProgressBar* progressBar);
    void clearActiveProgressBar();
};

extern Logger globalLogger;

class ProgressBar {
private:
    std::atomic<size_t> total;
    std::atomic<size_t> current{0};
    std::string description;
    std::atomic<bool> active{false};
    int updateFrequency;
    std::chrono::time_point<std::chrono::steady_clock> startTime;
    std::mutex mutex;
    std::thread displayThread;

    int getTerminalWidth() const;
    void displayLoop();
    void render();
    void renderFinal();
    void clearLine();
    std::string getBlockBar(double progress, int width) const;
    std::string getETA() const;

public:
    ProgressBar(size_t total,
                const std::string& description = std::string("Processing"),
                int updateFrequencyMs = 100);
    ~ProgressBar();

    void start();
    void update(size_t increment = 1);
    void finish();
    double getProgress() const;
    std::chrono::milliseconds getElapsedTime() const;
    std::chrono::milliseconds getEstimatedTimeRemaining() const;
    void temporarilyPauseDisplay(const std::function<void()>& callback);
};


class Molecule {
private:
    std::shared_ptr<RDKit::ROMol> mol;
    std::string smiles;
    std::string originalSmiles;
    bool valid;
    std::string errorMessage;

public:
    Molecule();
    explicit Molecule(const std::string& smiles);

    bool parse(const std::string& smiles);
    bool isValid() const;
    const std::string& getErrorMessage() const;

    std::shared_ptr<RDKit::ROMol> getMolecule() const;
    const std::string& getSmiles() const;
    const std::string& getOriginalSmiles() const;
};

class MoleculeBatch {
private:
    std::vector<Molecule> molecules;

public:
    explicit MoleculeBatch(size_t initialSize = 0);

    // Parses every string into its own slot; failures stay in place as invalid molecules
    void addSmilesBatch(const std::vector<std::string>& smiles);

    size_t size() const;
    size_t countValid() const;
    const std::vector<Molecule>& getMolecules() const;
};

} // namespace hbacc
