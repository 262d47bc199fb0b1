#pragma once

#include "graph.hpp"
#include "utils.hpp"
#include <string>

namespace hbacc {
namespace descriptors {

// Smart hydrogen-bond-acceptor count (nHBAcc).
//
// Counts N with formal charge <= 0 that has no bond to O and is not an
// aromatic N without a DOUBLE bond, plus O with formal charge <= 0 that has
// no N neighbor and no aromatic C neighbor.
class SmartHBondAcceptorCount {
private:
    std::string name;
    std::string description;

public:
    SmartHBondAcceptorCount();

    const std::string& getName() const { return name; }
    const std::string& getDescription() const { return description; }

    static int count(const MolecularGraph& graph);

    // Count for a parsed molecule, -1 when the molecule is invalid
    int calculate(const Molecule& mol) const;

    static bool isAcceptorNitrogen(const MolecularGraph& graph, unsigned int atom);
    static bool isAcceptorOxygen(const MolecularGraph& graph, unsigned int atom);
};

} // namespace descriptors
} // namespace hbacc
