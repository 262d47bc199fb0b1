#pragma once

#include "utils.hpp"
#include <string>
#include <vector>

namespace RDKit {
    class ROMol;
}

namespace hbacc {

enum class BondOrder {
    SINGLE,
    DOUBLE,
    TRIPLE,
    QUADRUPLE,
    AROMATIC,
    OTHER
};

// Read-only view of a molecule's atom-bond graph. Atoms and bonds are
// addressed by index in [0, numAtoms()) and [0, numBonds()).
class MolecularGraph {
public:
    virtual ~MolecularGraph() = default;

    virtual unsigned int numAtoms() const = 0;
    virtual unsigned int numBonds() const = 0;

    virtual std::string atomSymbol(unsigned int atom) const = 0;
    virtual int atomFormalCharge(unsigned int atom) const = 0;
    virtual bool atomIsAromatic(unsigned int atom) const = 0;

    virtual std::vector<unsigned int> atomBonds(unsigned int atom) const = 0;
    virtual std::vector<unsigned int> atomNeighbors(unsigned int atom) const = 0;

    virtual BondOrder bondOrder(unsigned int bond) const = 0;
    // Endpoint of `bond` opposite to `atom`; `atom` must be one of its endpoints
    virtual unsigned int bondOtherAtom(unsigned int bond, unsigned int atom) const = 0;
};

// Plain in-memory graph, assembled atom by atom and bond by bond.
class MolGraph : public MolecularGraph {
private:
    struct AtomRecord {
        std::string symbol;
        int formalCharge;
        bool aromatic;
        std::vector<unsigned int> bonds;
    };

    struct BondRecord {
        unsigned int begin;
        unsigned int end;
        BondOrder order;
    };

    std::vector<AtomRecord> atoms;
    std::vector<BondRecord> bonds;

    void checkAtom(unsigned int atom) const;
    void checkBond(unsigned int bond) const;

public:
    MolGraph() = default;

    // Returns the index of the new atom. Throws on an empty symbol.
    unsigned int addAtom(const std::string& symbol, int formalCharge = 0, bool aromatic = false);
    // Returns the index of the new bond. Throws when an endpoint is unknown or both endpoints coincide.
    unsigned int addBond(unsigned int begin, unsigned int end, BondOrder order = BondOrder::SINGLE);

    unsigned int numAtoms() const override;
    unsigned int numBonds() const override;

    std::string atomSymbol(unsigned int atom) const override;
    int atomFormalCharge(unsigned int atom) const override;
    bool atomIsAromatic(unsigned int atom) const override;

    std::vector<unsigned int> atomBonds(unsigned int atom) const override;
    std::vector<unsigned int> atomNeighbors(unsigned int atom) const override;

    BondOrder bondOrder(unsigned int bond) const override;
    unsigned int bondOtherAtom(unsigned int bond, unsigned int atom) const override;
};

// View over an RDKit molecule. The molecule must outlive the view.
class RDKitGraph : public MolecularGraph {
private:
    const RDKit::ROMol& mol;

public:
    explicit RDKitGraph(const RDKit::ROMol& mol);

    unsigned int numAtoms() const override;
    unsigned int numBonds() const override;

    std::string atomSymbol(unsigned int atom) const override;
    int atomFormalCharge(unsigned int atom) const override;
    bool atomIsAromatic(unsigned int atom) const override;

    std::vector<unsigned int> atomBonds(unsigned int atom) const override;
    std::vector<unsigned int> atomNeighbors(unsigned int atom) const override;

    BondOrder bondOrder(unsigned int bond) const override;
    unsigned int bondOtherAtom(unsigned int bond, unsigned int atom) const override;
};

} // namespace hbacc
