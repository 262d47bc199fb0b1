#include "descriptors/hbond.hpp"
#include <GraphMol/GraphMol.h>

namespace hbacc {
namespace descriptors {

SmartHBondAcceptorCount::SmartHBondAcceptorCount()
    : name("nHBAcc"), description("Number of hydrogen bond acceptors (smart heuristic)") {}

bool SmartHBondAcceptorCount::isAcceptorNitrogen(const MolecularGraph& graph, unsigned int atom) {
    if (graph.atomSymbol(atom) != "N" || graph.atomFormalCharge(atom) > 0) return false;

    int nPiBonds = 0;
    for (unsigned int bond : graph.atomBonds(atom)) {
        // N next to O (nitro, N-oxide, hydroxylamine) does not accept
        if (graph.atomSymbol(graph.bondOtherAtom(bond, atom)) == "O") return false;
        if (graph.bondOrder(bond) == BondOrder::DOUBLE) nPiBonds++;
    }

    // Aromatic N without a pi bond has its lone pair in the ring
    if (graph.atomIsAromatic(atom) && nPiBonds == 0) return false;
    return true;
}

bool SmartHBondAcceptorCount::isAcceptorOxygen(const MolecularGraph& graph, unsigned int atom) {
    if (graph.atomSymbol(atom) != "O" || graph.atomFormalCharge(atom) > 0) return false;

    for (unsigned int nbr : graph.atomNeighbors(atom)) {
        const std::string symbol = graph.atomSymbol(nbr);
        if (symbol == "N") return false;
        if (symbol == "C" && graph.atomIsAromatic(nbr)) return false;
    }
    return true;
}

int SmartHBondAcceptorCount::count(const MolecularGraph& graph) {
    int hBondAcceptors = 0;
    for (unsigned int atom = 0; atom < graph.numAtoms(); ++atom) {
        if (isAcceptorNitrogen(graph, atom) || isAcceptorOxygen(graph, atom)) {
            hBondAcceptors++;
        }
    }
    return hBondAcceptors;
}

int SmartHBondAcceptorCount::calculate(const Molecule& mol) const {
    if (!mol.isValid() || !mol.getMolecule()) return -1;
    return count(RDKitGraph(*mol.getMolecule()));
}

} // namespace descriptors
} // namespace hbacc
