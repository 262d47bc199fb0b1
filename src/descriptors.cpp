#include "descriptors.hpp"
#ifdef WITH_TBB
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#endif

namespace hbacc {

namespace {
int calculateOne(const descriptors::SmartHBondAcceptorCount& descriptor, const Molecule& mol) {
    if (!mol.isValid()) return MISSING_VALUE;
    try {
        return descriptor.calculate(mol);
    } catch (const std::exception& e) {
        globalLogger.debug("Calculation Error for SMILES " + mol.getOriginalSmiles() + ", Desc: " +
                           descriptor.getName() + " - " + e.what());
        return MISSING_VALUE;
    }
}
} // namespace

std::vector<int> calculateColumn(const descriptors::SmartHBondAcceptorCount& descriptor,
                                 const MoleculeBatch& batch) {
    const auto& molecules = batch.getMolecules();
    std::vector<int> column(molecules.size(), MISSING_VALUE);
    if (molecules.empty()) {
        return column;
    }

#ifdef WITH_TBB
    if (globalConfig.numThreads != 1) {
        tbb::parallel_for(tbb::blocked_range<size_t>(0, molecules.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    column[i] = calculateOne(descriptor, molecules[i]);
                }
            });
        return column;
    }
#endif
    for (size_t i = 0; i < molecules.size(); ++i) {
        column[i] = calculateOne(descriptor, molecules[i]);
    }
    return column;
}

} // namespace hbacc
