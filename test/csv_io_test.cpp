// Tests for CSV parsing, molecule column resolution and result writing

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "descriptors.hpp"
#include "io.hpp"
#include "utils.hpp"

namespace {

using hbacc::Config;
using hbacc::CsvIO;
using hbacc::DescriptorException;
using hbacc::ErrorCode;
using testing::ElementsAre;

TEST(TestParseCsvLine, PlainCells) {
  EXPECT_THAT(CsvIO::parseCsvLine("a,b,,c", ","), ElementsAre("a", "b", "", "c"));
  EXPECT_THAT(CsvIO::parseCsvLine("a;b", ";"), ElementsAre("a", "b"));
  EXPECT_TRUE(CsvIO::parseCsvLine("", ",").empty());
}

TEST(TestParseCsvLine, QuotedCells) {
  EXPECT_THAT(CsvIO::parseCsvLine("\"x,y\",CCO", ","), ElementsAre("x,y", "CCO"));
  EXPECT_THAT(CsvIO::parseCsvLine("\"say \"\"hi\"\"\",1", ","), ElementsAre("say \"hi\"", "1"));
}

TEST(TestParseCsvLine, EscapeCharacter) {
  EXPECT_THAT(CsvIO::parseCsvLine("\"a\\\"b\",c", ",", "\\"), ElementsAre("a\"b", "c"));
}

TEST(TestSplitRows, ShortRowGetsEmptyMolecule) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> smiles;
  CsvIO::splitRows({"1,CCO\r", "2"}, ",", "", 1, rows, smiles);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_THAT(smiles, ElementsAre("CCO", ""));
  EXPECT_THAT(rows[0], ElementsAre("1", "CCO"));
}

TEST(TestResolveMoleculeColumn, ByName) {
  EXPECT_EQ(CsvIO::resolveMoleculeColumn({"id", "SMILES", "name"}, "SMILES", {}), 1);
}

TEST(TestResolveMoleculeColumn, ByIndex) {
  EXPECT_EQ(CsvIO::resolveMoleculeColumn({"id", "structure"}, "1", {}), 1);
  // Without a header any index is taken as given
  EXPECT_EQ(CsvIO::resolveMoleculeColumn({}, "3", {}), 3);
}

TEST(TestResolveMoleculeColumn, NoHeaderDefaultsToFirstColumn) {
  EXPECT_EQ(CsvIO::resolveMoleculeColumn({}, "SMILES", {{"CCO", "x"}}), 0);
}

TEST(TestResolveMoleculeColumn, ChoosesFirstCompatibleColumn) {
  const std::vector<std::string> header = {"id", "smi", "other"};
  const std::vector<std::vector<std::string>> samples = {
      {"1", "CCO", "CC"},
      {"2", "c1ccncc1", "CCC"},
  };
  EXPECT_EQ(CsvIO::resolveMoleculeColumn(header, "SMILES", samples), 1);
}

TEST(TestResolveMoleculeColumn, NoCompatibleColumn) {
  const std::vector<std::string> header = {"id", "label"};
  const std::vector<std::vector<std::string>> samples = {{"1", "x1"}, {"2", "C1CC"}};
  try {
    CsvIO::resolveMoleculeColumn(header, "SMILES", samples);
    FAIL() << "column resolved without any SMILES";
  } catch (const DescriptorException& e) {
    EXPECT_EQ(e.getCode(), ErrorCode::PARSE_ERROR);
    EXPECT_THAT(e.what(), testing::HasSubstr("Column does not exist"));
  }
}

TEST(TestResolveMoleculeColumn, OversizedIndex) {
  const std::string huge = "99999999999999999999";
  // Too large for an index, and not a header name either
  try {
    CsvIO::resolveMoleculeColumn({"id", "label"}, huge, {{"1", "x1"}});
    FAIL() << "oversized index resolved";
  } catch (const DescriptorException& e) {
    EXPECT_EQ(e.getCode(), ErrorCode::PARSE_ERROR);
    EXPECT_THAT(e.what(), testing::HasSubstr(huge));
  }
  EXPECT_EQ(CsvIO::resolveMoleculeColumn({"id", huge}, huge, {}), 1);
  EXPECT_THROW(CsvIO::resolveMoleculeColumn({}, huge, {}), DescriptorException);
}

TEST(TestUniqueColumnName, Suffixes) {
  EXPECT_EQ(CsvIO::uniqueColumnName({"SMILES"}, "nHBAcc"), "nHBAcc");
  EXPECT_EQ(CsvIO::uniqueColumnName({"SMILES", "nHBAcc"}, "nHBAcc"), "nHBAcc (#1)");
  EXPECT_EQ(CsvIO::uniqueColumnName({"nHBAcc", "nHBAcc (#1)"}, "nHBAcc"), "nHBAcc (#2)");
}

class TestCsvRoundTrip : public testing::Test {
 protected:
  std::filesystem::path _input;
  std::filesystem::path _output;

  void SetUp() override {
    const std::string name = testing::UnitTest::GetInstance()->current_test_info()->name();
    _input = std::filesystem::temp_directory_path() / ("hbacc_" + name + "_in.csv");
    _output = std::filesystem::temp_directory_path() / ("hbacc_" + name + "_out.csv");
  }

  void TearDown() override {
    std::filesystem::remove(_input);
    std::filesystem::remove(_output);
  }

  void WriteInput(const std::string& contents) {
    std::ofstream file(_input, std::ios::binary);
    file << contents;
  }

  // Runs the reader, counter and writer over the input, as the command line tool does
  void Process(const Config& config) {
    CsvIO csv(_input.string(), _output.string(), config);
    CsvIO::ResultWriter writer = csv.createResultWriter();
    CsvIO::LineReader reader = csv.createLineReader();
    hbacc::descriptors::SmartHBondAcceptorCount descriptor;

    std::vector<std::string> lines;
    while (reader.readBatch(lines, 2)) {
      std::vector<std::vector<std::string>> rows;
      std::vector<std::string> smiles;
      CsvIO::splitRows(lines, csv.getDelimiter(), csv.getEscapeChar(), csv.getMoleculeIndex(), rows, smiles);
      hbacc::MoleculeBatch batch;
      batch.addSmilesBatch(smiles);
      std::vector<int> values = hbacc::calculateColumn(descriptor, batch);
      ASSERT_TRUE(writer.writeBatch(batch.getMolecules(), rows, values));
    }
    writer.flush();
  }

  std::vector<std::string> OutputLines() const {
    std::ifstream file(_output);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
      lines.push_back(line);
    }
    return lines;
  }
};

TEST_F(TestCsvRoundTrip, AppendsCountColumn) {
  WriteInput("id,SMILES\n1,CC(=O)O\n2,C1CC\n\n3,c1ccncc1\n");
  Process(Config());
  EXPECT_THAT(OutputLines(), ElementsAre("id,SMILES,nHBAcc",
                                         "1,CC(=O)O,2",
                                         "2,C1CC,NA",
                                         "3,c1ccncc1,0"));
}

TEST_F(TestCsvRoundTrip, WritesCanonicalSmiles) {
  WriteInput("SMILES\nOCC\n");
  Process(Config());
  EXPECT_THAT(OutputLines(), ElementsAre("SMILES,nHBAcc", "CCO,1"));
}

TEST_F(TestCsvRoundTrip, ExistingOutputColumn) {
  WriteInput("SMILES,nHBAcc\r\nCCO,7\r\n");
  Process(Config());
  EXPECT_THAT(OutputLines(), ElementsAre("SMILES,nHBAcc,\"nHBAcc (#1)\"", "CCO,7,1"));
}

TEST_F(TestCsvRoundTrip, AutomaticColumnChoice) {
  WriteInput("name;structure\nethanol;CCO\nacetamide;CC(N)=O\n");
  Config config;
  config.delimiter = ";";
  CsvIO csv(_input.string(), _output.string(), config);
  EXPECT_EQ(csv.getMoleculeIndex(), 1);
  EXPECT_EQ(csv.getMoleculeColumnName(), "structure");

  Process(config);
  EXPECT_THAT(OutputLines(), ElementsAre("name;structure;nHBAcc",
                                         "ethanol;CCO;1",
                                         "acetamide;CC(N)=O;2"));
}

TEST_F(TestCsvRoundTrip, NoHeader) {
  WriteInput("CCO,first\nCOC,second\n");
  Config config;
  config.hasHeader = false;
  Process(config);
  EXPECT_THAT(OutputLines(), ElementsAre("CCO,first,1", "COC,second,1"));
}

TEST_F(TestCsvRoundTrip, ByteOrderMarkWithoutHeader) {
  WriteInput("\xEF\xBB\xBFCCO,first\nCOC,second\n");
  Config config;
  config.hasHeader = false;
  Process(config);
  EXPECT_THAT(OutputLines(), ElementsAre("CCO,first,1", "COC,second,1"));
}

TEST_F(TestCsvRoundTrip, ByteOrderMarkBeforeHeader) {
  WriteInput("\xEF\xBB\xBFSMILES,id\nCCO,1\n");
  Process(Config());
  EXPECT_THAT(OutputLines(), ElementsAre("SMILES,id,nHBAcc", "CCO,1,1"));
}

TEST_F(TestCsvRoundTrip, QuotedCellsSurvive) {
  WriteInput("label,SMILES\n\"a, b\",CCN\n");
  Process(Config());
  EXPECT_THAT(OutputLines(), ElementsAre("label,SMILES,nHBAcc", "\"a, b\",CCN,1"));
}

TEST_F(TestCsvRoundTrip, MissingInput) {
  try {
    CsvIO csv(_input.string(), _output.string(), Config());
    FAIL() << "missing input opened";
  } catch (const DescriptorException& e) {
    EXPECT_EQ(e.getCode(), ErrorCode::IO_ERROR);
  }
}

TEST(TestResultWriter, EscapeCharacterInQuotedCell) {
  const std::filesystem::path path = std::filesystem::temp_directory_path() / "hbacc_escape_out.csv";
  {
    CsvIO::ResultWriter writer(path.string(), ",", "\\", 1, {}, "nHBAcc");
    hbacc::MoleculeBatch batch;
    batch.addSmilesBatch({"CCO"});
    const std::vector<std::vector<std::string>> rows = {{"x \\ \"y\"", "CCO"}};
    ASSERT_TRUE(writer.writeBatch(batch.getMolecules(), rows, {1}));
  }
  std::ifstream file(path);
  std::string line;
  ASSERT_TRUE(std::getline(file, line));
  EXPECT_THAT(CsvIO::parseCsvLine(line, ",", "\\"), ElementsAre("x \\ \"y\"", "CCO", "1"));
  std::filesystem::remove(path);
}

TEST(TestResultWriter, RejectsMismatchedBatch) {
  const std::filesystem::path path = std::filesystem::temp_directory_path() / "hbacc_mismatch_out.csv";
  {
    CsvIO::ResultWriter writer(path.string(), ",", "", 0, {"SMILES"}, "nHBAcc");
    hbacc::MoleculeBatch batch;
    batch.addSmilesBatch({"CCO"});
    const std::vector<std::vector<std::string>> rows = {{"CCO"}};
    EXPECT_FALSE(writer.writeBatch(batch.getMolecules(), rows, std::vector<int>()));
  }
  std::filesystem::remove(path);
}

}  // namespace
