// Acceptor counts on molecules parsed from SMILES with RDKit

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "descriptors.hpp"
#include "descriptors/hbond.hpp"
#include "graph.hpp"
#include "utils.hpp"

namespace {

using hbacc::Molecule;
using hbacc::MoleculeBatch;
using hbacc::RDKitGraph;
using hbacc::descriptors::SmartHBondAcceptorCount;

struct SmilesCount {
  std::string smiles;
  int expected;
};

class TestSmilesAcceptors : public testing::TestWithParam<SmilesCount> {
 protected:
  SmartHBondAcceptorCount _descriptor;
};

TEST_P(TestSmilesAcceptors, MatchesExpected) {
  const auto& params = GetParam();
  Molecule mol(params.smiles);
  ASSERT_TRUE(mol.isValid()) << params.smiles << ": " << mol.getErrorMessage();
  EXPECT_EQ(_descriptor.calculate(mol), params.expected) << params.smiles;
}

INSTANTIATE_TEST_SUITE_P(TestSmilesAcceptors, TestSmilesAcceptors, testing::Values(
  SmilesCount{"CC(=O)O", 2},          // acetic acid
  SmilesCount{"CC(=O)[O-]", 2},       // acetate
  SmilesCount{"CCO", 1},
  SmilesCount{"COC", 1},
  SmilesCount{"CCN(CC)CC", 1},        // triethylamine
  SmilesCount{"CC(N)=O", 2},          // acetamide
  SmilesCount{"CC#N", 1},
  SmilesCount{"NO", 0},               // hydroxylamine
  SmilesCount{"C[N+](=O)[O-]", 0},    // nitromethane
  SmilesCount{"C[O+](C)C", 0},
  SmilesCount{"c1ccncc1", 0},         // aromatic bonds are not DOUBLE
  SmilesCount{"C1=CC=NC=C1", 0},      // aromatized on input
  SmilesCount{"c1cc[nH]c1", 0},
  SmilesCount{"Oc1ccccc1", 0},        // phenol
  SmilesCount{"CCCC", 0},
  SmilesCount{"[Na+].[Cl-]", 0}
));

TEST(TestSmartHBondAcceptorCount, Name) {
  SmartHBondAcceptorCount descriptor;
  EXPECT_EQ(descriptor.getName(), "nHBAcc");
  EXPECT_FALSE(descriptor.getDescription().empty());
}

TEST(TestSmartHBondAcceptorCount, InvalidMolecule) {
  SmartHBondAcceptorCount descriptor;
  Molecule mol("C1CC");
  EXPECT_FALSE(mol.isValid());
  EXPECT_EQ(descriptor.calculate(mol), -1);

  Molecule empty("");
  EXPECT_FALSE(empty.isValid());
  EXPECT_EQ(descriptor.calculate(empty), -1);
}

TEST(TestRDKitGraph, MirrorsMolecule) {
  Molecule mol("CC(=O)O");
  ASSERT_TRUE(mol.isValid());
  RDKitGraph graph(*mol.getMolecule());

  EXPECT_EQ(graph.numAtoms(), 4u);
  EXPECT_EQ(graph.numBonds(), 3u);
  EXPECT_EQ(graph.atomSymbol(2), "O");
  EXPECT_EQ(graph.atomNeighbors(1).size(), 3u);
  EXPECT_EQ(graph.bondOrder(1), hbacc::BondOrder::DOUBLE);
  EXPECT_EQ(SmartHBondAcceptorCount::count(graph), 2);
}

TEST(TestRDKitGraph, AromaticAtomsAndBonds) {
  Molecule mol("c1ccncc1");
  ASSERT_TRUE(mol.isValid());
  RDKitGraph graph(*mol.getMolecule());

  for (unsigned int atom = 0; atom < graph.numAtoms(); ++atom) {
    EXPECT_TRUE(graph.atomIsAromatic(atom));
  }
  for (unsigned int bond = 0; bond < graph.numBonds(); ++bond) {
    EXPECT_EQ(graph.bondOrder(bond), hbacc::BondOrder::AROMATIC);
  }
}

TEST(TestCalculateColumn, KeepsBatchOrder) {
  MoleculeBatch batch;
  batch.addSmilesBatch({"CCO", "C1CC", "CC(=O)O", "", "c1ccncc1"});
  ASSERT_EQ(batch.size(), 5u);
  EXPECT_EQ(batch.countValid(), 3u);

  SmartHBondAcceptorCount descriptor;
  std::vector<int> column = hbacc::calculateColumn(descriptor, batch);
  EXPECT_EQ(column, (std::vector<int>{1, hbacc::MISSING_VALUE, 2, hbacc::MISSING_VALUE, 0}));
}

TEST(TestCalculateColumn, EmptyBatch) {
  MoleculeBatch batch;
  SmartHBondAcceptorCount descriptor;
  EXPECT_TRUE(hbacc::calculateColumn(descriptor, batch).empty());
}

}  // namespace
