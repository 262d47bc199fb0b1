#pragma once

#include "utils.hpp" // Molecule, Config, Logger
#include <string>
#include <vector>
#include <fstream>
#include <mutex>

namespace hbacc {

class CsvIO {
private:
    std::string inputPath;
    std::string outputPath;
    std::string delimiter;
    std::string escapeChar;
    bool hasHeader;
    std::vector<std::string> headerColumns;
    std::vector<std::vector<std::string>> sampleRows;
    int molIndex = -1;
    std::string outputColumnName;

    bool readHeaderAndSamples(std::ifstream& file);

public:
    // Number of data rows inspected when choosing the molecule column automatically
    static constexpr size_t AUTO_COLUMN_SAMPLE_ROWS = 5;

    CsvIO(const std::string& inputPath, const std::string& outputPath, const Config& config);

    int getMoleculeIndex() const { return molIndex; }
    std::string getMoleculeColumnName() const;
    const std::string& getOutputColumnName() const { return outputColumnName; }
    const std::string& getDelimiter() const { return delimiter; }
    const std::string& getEscapeChar() const { return escapeChar; }

    class LineReader {
    private:
        std::string filePath;
        std::mutex readMutex;
        std::ifstream fileStream;
        bool atFirstLine;
        bool headerSkipped;
        bool readerHasHeader;

    public:
        LineReader(const std::string& filePath, bool hasHeaderFlag);
        ~LineReader();

        // Reads up to batchSize non-empty lines; false once the input is exhausted
        bool readBatch(std::vector<std::string>& lines, size_t batchSize);

        // Number of non-blank data lines, for the progress display
        size_t estimateTotalLines();
    };

    LineReader createLineReader() const;

    class ResultWriter {
    private:
        std::string outputPath;
        std::ofstream fileStream;
        std::string delimiter;
        std::string escapeChar;
        int molIndex;
        std::mutex writeMutex;

        std::string formatCell(const std::string& cell) const;
        void writeHeader(const std::vector<std::string>& headerColumns, const std::string& outputColumnName);

    public:
        // With an empty headerColumns no header line is written
        ResultWriter(const std::string& outFilePath, const std::string& delimiter,
                     const std::string& escapeChar, int molIndex,
                     const std::vector<std::string>& headerColumns,
                     const std::string& outputColumnName);
        ~ResultWriter();

        bool writeBatch(const std::vector<Molecule>& molecules,
                        const std::vector<std::vector<std::string>>& rows,
                        const std::vector<int>& values);

        void flush();
    };

    ResultWriter createResultWriter() const;

    static std::vector<std::string> parseCsvLine(const std::string& line,
                                                 const std::string& delimiter,
                                                 const std::string& escapeChar = "");

    // Splits raw lines into cells and pulls out the molecule cell of each row.
    // Rows too short to hold the molecule column get an empty molecule cell.
    static void splitRows(const std::vector<std::string>& lines, const std::string& delimiter,
                          const std::string& escapeChar, int molIndex,
                          std::vector<std::vector<std::string>>& rows,
                          std::vector<std::string>& smiles);

    // Index of the molecule column: numeric index, header name, or the first
    // column whose sampled cells all parse as SMILES. Throws when none fits.
    static int resolveMoleculeColumn(const std::vector<std::string>& headerColumns,
                                     const std::string& columnSpec,
                                     const std::vector<std::vector<std::string>>& sampleRows);

    // `name`, or `name (#k)` with the smallest k not already taken
    static std::string uniqueColumnName(const std::vector<std::string>& headerColumns,
                                        const std::string& name);
};

} // namespace hbacc
