#pragma once

#include <vector>

#include "divergence.h"
#include "receipts.h"

namespace Crosscheck {

/**
 * Matches token-ledger entries by (ticker, txid) and compares operation,
 * balance delta and the addresses involved. A differing entry count is
 * reported as COUNT_MISMATCH after the per-entry divergences.
 */
class Brc20Comparator {
public:
    std::vector<DivergenceEntry> Compare(BlockHeight height,
                                         const Brc20Receipts& primary,
                                         const Brc20Receipts& secondary) const;
};

} // namespace Crosscheck
