#include "graph.hpp"
#include <GraphMol/GraphMol.h>
#include <GraphMol/Atom.h>
#include <GraphMol/Bond.h>

namespace hbacc {

// --- MolGraph ---

void MolGraph::checkAtom(unsigned int atom) const {
    if (atom >= atoms.size()) {
        throw DescriptorException("Atom index " + std::to_string(atom) + " out of range (molecule has " +
                                  std::to_string(atoms.size()) + " atoms)", ErrorCode::PARSE_ERROR);
    }
}

void MolGraph::checkBond(unsigned int bond) const {
    if (bond >= bonds.size()) {
        throw DescriptorException("Bond index " + std::to_string(bond) + " out of range (molecule has " +
                                  std::to_string(bonds.size()) + " bonds)", ErrorCode::PARSE_ERROR);
    }
}

unsigned int MolGraph::addAtom(const std::string& symbol, int formalCharge, bool aromatic) {
    if (symbol.empty()) {
        throw DescriptorException("Atom symbol must not be empty", ErrorCode::PARSE_ERROR);
    }
    atoms.push_back({symbol, formalCharge, aromatic, {}});
    return static_cast<unsigned int>(atoms.size() - 1);
}

unsigned int MolGraph::addBond(unsigned int begin, unsigned int end, BondOrder order) {
    checkAtom(begin);
    checkAtom(end);
    if (begin == end) {
        throw DescriptorException("Bond endpoints must differ (atom " + std::to_string(begin) + ")",
                                  ErrorCode::PARSE_ERROR);
    }
    unsigned int idx = static_cast<unsigned int>(bonds.size());
    bonds.push_back({begin, end, order});
    atoms[begin].bonds.push_back(idx);
    atoms[end].bonds.push_back(idx);
    return idx;
}

unsigned int MolGraph::numAtoms() const { return static_cast<unsigned int>(atoms.size()); }
unsigned int MolGraph::numBonds() const { return static_cast<unsigned int>(bonds.size()); }

std::string MolGraph::atomSymbol(unsigned int atom) const {
    checkAtom(atom);
    return atoms[atom].symbol;
}

int MolGraph::atomFormalCharge(unsigned int atom) const {
    checkAtom(atom);
    return atoms[atom].formalCharge;
}

bool MolGraph::atomIsAromatic(unsigned int atom) const {
    checkAtom(atom);
    return atoms[atom].aromatic;
}

std::vector<unsigned int> MolGraph::atomBonds(unsigned int atom) const {
    checkAtom(atom);
    return atoms[atom].bonds;
}

std::vector<unsigned int> MolGraph::atomNeighbors(unsigned int atom) const {
    checkAtom(atom);
    std::vector<unsigned int> neighbors;
    neighbors.reserve(atoms[atom].bonds.size());
    for (unsigned int bond : atoms[atom].bonds) {
        neighbors.push_back(bondOtherAtom(bond, atom));
    }
    return neighbors;
}

BondOrder MolGraph::bondOrder(unsigned int bond) const {
    checkBond(bond);
    return bonds[bond].order;
}

unsigned int MolGraph::bondOtherAtom(unsigned int bond, unsigned int atom) const {
    checkBond(bond);
    const BondRecord& record = bonds[bond];
    if (record.begin == atom) return record.end;
    if (record.end == atom) return record.begin;
    throw DescriptorException("Atom " + std::to_string(atom) + " is not an endpoint of bond " +
                              std::to_string(bond), ErrorCode::CALCULATION_ERROR);
}

// --- RDKitGraph ---

namespace {
BondOrder toBondOrder(RDKit::Bond::BondType type) {
    switch (type) {
        case RDKit::Bond::SINGLE:    return BondOrder::SINGLE;
        case RDKit::Bond::DOUBLE:    return BondOrder::DOUBLE;
        case RDKit::Bond::TRIPLE:    return BondOrder::TRIPLE;
        case RDKit::Bond::QUADRUPLE: return BondOrder::QUADRUPLE;
        case RDKit::Bond::AROMATIC:  return BondOrder::AROMATIC;
        default:                     return BondOrder::OTHER;
    }
}
} // namespace

RDKitGraph::RDKitGraph(const RDKit::ROMol& mol) : mol(mol) {}

unsigned int RDKitGraph::numAtoms() const { return mol.getNumAtoms(); }
unsigned int RDKitGraph::numBonds() const { return mol.getNumBonds(); }

std::string RDKitGraph::atomSymbol(unsigned int atom) const {
    return mol.getAtomWithIdx(atom)->getSymbol();
}

int RDKitGraph::atomFormalCharge(unsigned int atom) const {
    return mol.getAtomWithIdx(atom)->getFormalCharge();
}

bool RDKitGraph::atomIsAromatic(unsigned int atom) const {
    return mol.getAtomWithIdx(atom)->getIsAromatic();
}

std::vector<unsigned int> RDKitGraph::atomBonds(unsigned int atom) const {
    std::vector<unsigned int> result;
    for (const auto bond : mol.atomBonds(mol.getAtomWithIdx(atom))) {
        result.push_back(bond->getIdx());
    }
    return result;
}

std::vector<unsigned int> RDKitGraph::atomNeighbors(unsigned int atom) const {
    std::vector<unsigned int> result;
    for (const auto nbr : mol.atomNeighbors(mol.getAtomWithIdx(atom))) {
        result.push_back(nbr->getIdx());
    }
    return result;
}

BondOrder RDKitGraph::bondOrder(unsigned int bond) const {
    return toBondOrder(mol.getBondWithIdx(bond)->getBondType());
}

unsigned int RDKitGraph::bondOtherAtom(unsigned int bond, unsigned int atom) const {
    return mol.getBondWithIdx(bond)->getOtherAtomIdx(atom);
}

} // namespace hbacc
