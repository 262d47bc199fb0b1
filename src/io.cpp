#include "io.hpp"
#include "utils.hpp" // Access to globalLogger
#include <algorithm>
#include <cctype>
#include <sstream>

namespace hbacc {

namespace {
bool isColumnIndex(const std::string& spec) {
    return !spec.empty() && std::all_of(spec.begin(), spec.end(),
                                        [](unsigned char c) { return std::isdigit(c); });
}

void stripLineEnding(std::string& line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

const std::string UTF8_BOM = "\xEF\xBB\xBF";

void stripBom(std::string& line) {
    if (line.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0) {
        line.erase(0, UTF8_BOM.size());
    }
}
} // namespace

std::vector<std::string> CsvIO::parseCsvLine(const std::string& line, const std::string& delimiter,
                                             const std::string& escapeCharStr) {
    std::vector<std::string> cells;
    if (line.empty()) return cells;

    const char delimChar = delimiter.empty() ? ',' : delimiter[0];
    const char quoteChar = '"';
    const char escChar = escapeCharStr.empty() ? '\0' : escapeCharStr[0];
    std::string currentCell;
    bool inQuotes = false;

    for (size_t i = 0; i < line.length(); ++i) {
        char c = line[i];
        if (!inQuotes) {
            if (c == quoteChar && currentCell.empty()) {
                inQuotes = true; // opening quote, not part of the value
            } else if (c == delimChar) {
                cells.push_back(currentCell);
                currentCell.clear();
            } else {
                currentCell += c;
            }
            continue;
        }

        if (escChar != '\0' && c == escChar) {
            if (i + 1 == line.length()) {
                currentCell += c;
                continue;
            }
            char next = line[++i];
            switch (next) {
                case 'n': currentCell += '\n'; break;
                case 'r': currentCell += '\r'; break;
                case 't': currentCell += '\t'; break;
                default:  currentCell += next; break;
            }
        } else if (c == quoteChar) {
            // "" is a literal quote unless a custom escape character is in use
            if (escChar == '\0' && i + 1 < line.length() && line[i + 1] == quoteChar) {
                currentCell += quoteChar;
                ++i;
            } else {
                inQuotes = false;
            }
        } else {
            currentCell += c;
        }
    }

    cells.push_back(currentCell);
    return cells;
}

void CsvIO::splitRows(const std::vector<std::string>& lines, const std::string& delimiter,
                      const std::string& escapeChar, int molIndex,
                      std::vector<std::vector<std::string>>& rows,
                      std::vector<std::string>& smiles) {
    rows.clear();
    smiles.clear();
    rows.reserve(lines.size());
    smiles.reserve(lines.size());

    for (const auto& line : lines) {
        std::string trimmedLine = line;
        stripLineEnding(trimmedLine);
        std::vector<std::string> cells = parseCsvLine(trimmedLine, delimiter, escapeChar);
        if (molIndex >= 0 && static_cast<size_t>(molIndex) < cells.size()) {
            smiles.push_back(cells[molIndex]);
        } else {
            globalLogger.debug("Row has no cell at molecule column index " + std::to_string(molIndex) +
                               ": " + trimmedLine.substr(0, 50));
            smiles.emplace_back();
        }
        rows.push_back(std::move(cells));
    }
}

int CsvIO::resolveMoleculeColumn(const std::vector<std::string>& headerColumns,
                                 const std::string& columnSpec,
                                 const std::vector<std::vector<std::string>>& sampleRows) {
    const std::string spec = util::trim(columnSpec);

    if (isColumnIndex(spec)) {
        int index = -1;
        try {
            index = std::stoi(spec);
        } catch (const std::out_of_range&) {
            if (headerColumns.empty()) {
                throw DescriptorException("Column does not exist: index " + spec + " is out of range",
                                          ErrorCode::PARSE_ERROR);
            }
        }
        if (index >= 0 && (headerColumns.empty() || index < static_cast<int>(headerColumns.size()))) {
            globalLogger.info("CsvIO: Using molecule column at index " + spec);
            return index;
        }
    }

    for (size_t i = 0; i < headerColumns.size(); ++i) {
        if (headerColumns[i] == spec) {
            globalLogger.info("CsvIO: Found molecule column '" + spec + "' at index " + std::to_string(i));
            return static_cast<int>(i);
        }
    }

    if (headerColumns.empty()) {
        globalLogger.info("CsvIO: No header, assuming molecules in column 0.");
        return 0;
    }

    for (size_t col = 0; col < headerColumns.size(); ++col) {
        size_t inspected = 0;
        bool allParse = true;
        for (const auto& row : sampleRows) {
            if (col >= row.size() || util::trim(row[col]).empty()) continue;
            inspected++;
            Molecule probe;
            if (!probe.parse(row[col])) {
                allParse = false;
                break;
            }
        }
        if (inspected > 0 && allParse) {
            globalLogger.warning("Column '" + headerColumns[col] + "' automatically chosen as molecule column");
            return static_cast<int>(col);
        }
    }

    throw DescriptorException("Column does not exist: no column '" + spec +
                              "' and no column holding SMILES", ErrorCode::PARSE_ERROR);
}

std::string CsvIO::uniqueColumnName(const std::vector<std::string>& headerColumns, const std::string& name) {
    auto taken = [&headerColumns](const std::string& candidate) {
        return std::find(headerColumns.begin(), headerColumns.end(), candidate) != headerColumns.end();
    };
    if (!taken(name)) return name;

    for (int k = 1;; ++k) {
        std::string candidate = name + " (#" + std::to_string(k) + ")";
        if (!taken(candidate)) return candidate;
    }
}


CsvIO::CsvIO(const std::string& inputPath, const std::string& outputPath, const Config& config)
    : inputPath(inputPath), outputPath(outputPath), delimiter(config.delimiter),
      escapeChar(config.escapeChar), hasHeader(config.hasHeader) {

    std::ifstream file(inputPath);
    if (!file.is_open()) {
        throw DescriptorException("CsvIO: Failed to open input file: " + inputPath, ErrorCode::IO_ERROR);
    }
    if (!readHeaderAndSamples(file)) {
        throw DescriptorException("CsvIO: Failed to read header line from file: " + inputPath,
                                  ErrorCode::PARSE_ERROR);
    }

    molIndex = resolveMoleculeColumn(headerColumns, config.molColumn, sampleRows);
    outputColumnName = uniqueColumnName(headerColumns, config.outputColumn);
    if (outputColumnName != config.outputColumn) {
        globalLogger.warning("CsvIO: Column '" + config.outputColumn + "' already exists, writing results to '" +
                             outputColumnName + "'");
    }
}

bool CsvIO::readHeaderAndSamples(std::ifstream& file) {
    std::string line;
    bool firstLine = true;
    if (hasHeader) {
        if (!std::getline(file, line)) {
            return false;
        }
        firstLine = false;
        stripBom(line);
        stripLineEnding(line);
        headerColumns = parseCsvLine(line, delimiter, escapeChar);
        if (headerColumns.empty()) {
            globalLogger.error("CsvIO: Header line parsed into zero columns. Check delimiter or file format.");
            return false;
        }
    }

    while (sampleRows.size() < AUTO_COLUMN_SAMPLE_ROWS && std::getline(file, line)) {
        if (firstLine) {
            stripBom(line);
            firstLine = false;
        }
        if (isBlank(line)) continue;
        stripLineEnding(line);
        sampleRows.push_back(parseCsvLine(line, delimiter, escapeChar));
    }
    return true;
}

std::string CsvIO::getMoleculeColumnName() const {
    if (molIndex >= 0 && static_cast<size_t>(molIndex) < headerColumns.size()) {
        return headerColumns[molIndex];
    }
    return "column " + std::to_string(molIndex);
}


// --- LineReader Implementation ---
CsvIO::LineReader::LineReader(const std::string& filePath, bool hasHeaderFlag)
    : filePath(filePath), atFirstLine(true), headerSkipped(false), readerHasHeader(hasHeaderFlag) {

    fileStream.open(filePath, std::ios::binary);
    if (!fileStream.is_open()) {
        throw DescriptorException("LineReader: Failed to open file: " + filePath, ErrorCode::IO_ERROR);
    }
}

CsvIO::LineReader::~LineReader() {
    if (fileStream.is_open()) {
        fileStream.close();
    }
}

bool CsvIO::LineReader::readBatch(std::vector<std::string>& lines, size_t batchSize) {
    std::lock_guard<std::mutex> lock(readMutex);
    lines.clear();
    lines.reserve(batchSize);

    if (!fileStream.is_open() || fileStream.eof()) {
        return false;
    }

    std::string line;
    if (readerHasHeader && !headerSkipped) {
        if (!std::getline(fileStream, line)) {
            globalLogger.warning("LineReader: Failed reading or skipping header.");
            return false;
        }
        headerSkipped = true;
        atFirstLine = false;
    }

    while (lines.size() < batchSize && std::getline(fileStream, line)) {
        if (atFirstLine) {
            stripBom(line);
            atFirstLine = false;
        }
        if (isBlank(line)) {
            globalLogger.debug("LineReader: Skipping empty or whitespace-only line.");
            continue;
        }
        lines.push_back(line);
    }

    return !lines.empty();
}

size_t CsvIO::LineReader::estimateTotalLines() {
    std::lock_guard<std::mutex> lock(readMutex);

    std::streampos originalPos = fileStream.tellg();
    fileStream.clear();
    fileStream.seekg(0, std::ios::beg);

    std::string line;
    if (readerHasHeader && !std::getline(fileStream, line)) {
        fileStream.clear();
        fileStream.seekg(originalPos);
        return 0;
    }

    size_t lineCount = 0;
    while (std::getline(fileStream, line)) {
        if (!isBlank(line)) {
            lineCount++;
        }
    }

    fileStream.clear();
    fileStream.seekg(originalPos);

    globalLogger.debug("Exact line count: " + std::to_string(lineCount));
    return lineCount;
}

CsvIO::LineReader CsvIO::createLineReader() const {
    if (molIndex < 0) {
        throw DescriptorException("Cannot create LineReader: molecule column index is invalid.", ErrorCode::PARSE_ERROR);
    }
    return LineReader(inputPath, hasHeader);
}


// --- ResultWriter Implementation ---
CsvIO::ResultWriter::ResultWriter(const std::string& outFilePath, const std::string& delimiter,
                                  const std::string& escapeChar, int molIndex,
                                  const std::vector<std::string>& headerColumns,
                                  const std::string& outputColumnName)
    : outputPath(outFilePath), delimiter(delimiter), escapeChar(escapeChar), molIndex(molIndex) {

    fileStream.open(outFilePath, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!fileStream.is_open()) {
        throw DescriptorException("ResultWriter: Failed to open output file: " + outFilePath, ErrorCode::IO_ERROR);
    }
    if (!headerColumns.empty()) {
        writeHeader(headerColumns, outputColumnName);
    }
    globalLogger.info("ResultWriter: Initialized for output file: " + outFilePath);
}

CsvIO::ResultWriter::~ResultWriter() {
    if (fileStream.is_open()) {
        fileStream.flush();
        fileStream.close();
        globalLogger.debug("ResultWriter: Closed output file stream.");
    }
}

std::string CsvIO::ResultWriter::formatCell(const std::string& cell) const {
    std::string value = cell;
    value.erase(std::remove(value.begin(), value.end(), '\r'), value.end());

    bool needsQuotes = value.find(delimiter) != std::string::npos ||
                       value.find('"') != std::string::npos ||
                       value.find_first_of(" \t\n") != std::string::npos;
    if (!needsQuotes) return value;

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += escapeChar.empty() ? std::string("\"\"") : escapeChar + c;
        } else if (!escapeChar.empty() && c == escapeChar[0]) {
            quoted += escapeChar + escapeChar;
        } else if (c == '\n' && !escapeChar.empty()) {
            quoted += escapeChar + 'n';
        } else {
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

void CsvIO::ResultWriter::writeHeader(const std::vector<std::string>& headerColumns,
                                      const std::string& outputColumnName) {
    std::ostringstream header;
    for (const auto& column : headerColumns) {
        header << formatCell(column) << delimiter;
    }
    header << formatCell(outputColumnName) << "\n";
    fileStream << header.str();
}

bool CsvIO::ResultWriter::writeBatch(const std::vector<Molecule>& molecules,
                                     const std::vector<std::vector<std::string>>& rows,
                                     const std::vector<int>& values) {
    std::lock_guard<std::mutex> lock(writeMutex);

    if (!fileStream.is_open()) {
        globalLogger.error("ResultWriter::writeBatch: Output file stream is not open.");
        return false;
    }
    if (molecules.size() != rows.size() || values.size() != rows.size()) {
        globalLogger.error("ResultWriter::writeBatch: Mismatch between molecule count (" +
                           std::to_string(molecules.size()) + "), row count (" + std::to_string(rows.size()) +
                           ") and value count (" + std::to_string(values.size()) + ").");
        return false;
    }

    std::ostringstream batchBuffer;
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        for (size_t j = 0; j < row.size(); ++j) {
            if (static_cast<int>(j) == molIndex && molecules[i].isValid()) {
                batchBuffer << formatCell(molecules[i].getSmiles());
            } else {
                batchBuffer << formatCell(row[j]);
            }
            batchBuffer << delimiter;
        }
        if (values[i] < 0) {
            batchBuffer << "NA";
        } else {
            batchBuffer << values[i];
        }
        batchBuffer << "\n";
    }

    fileStream << batchBuffer.str();
    if (!fileStream.good()) {
        globalLogger.error("ResultWriter::writeBatch: File stream encountered an error after writing batch.");
        fileStream.clear();
        return false;
    }
    return true;
}

void CsvIO::ResultWriter::flush() {
    std::lock_guard<std::mutex> lock(writeMutex);
    if (fileStream.is_open()) {
        fileStream.flush();
    }
}

CsvIO::ResultWriter CsvIO::createResultWriter() const {
    if (molIndex < 0) {
        throw DescriptorException("Cannot create ResultWriter: molecule column index is invalid.", ErrorCode::PARSE_ERROR);
    }
    if (outputPath.empty()) {
        throw DescriptorException("Cannot create ResultWriter: Output file path is not set.", ErrorCode::IO_ERROR);
    }
    return ResultWriter(outputPath, delimiter, escapeChar, molIndex,
                        hasHeader ? headerColumns : std::vector<std::string>{}, outputColumnName);
}

} // namespace hbacc
