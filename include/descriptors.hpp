#pragma once

#include "utils.hpp"
#include "descriptors/hbond.hpp"
#include <vector>

namespace hbacc {

// Value written for a row whose molecule could not be evaluated
constexpr int MISSING_VALUE = -1;

// One descriptor value per molecule of `batch`, in batch order.
// Invalid molecules and per-molecule failures yield MISSING_VALUE.
std::vector<int> calculateColumn(const descriptors::SmartHBondAcceptorCount& descriptor,
                                 const MoleculeBatch& batch);

} // namespace hbacc
