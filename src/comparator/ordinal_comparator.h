#pragma once

#include <vector>

#include "divergence.h"
#include "receipts.h"

namespace Crosscheck {

/**
 * Matches inscription events by inscription id and compares owner,
 * content hash and transfer sequence number.
 */
class OrdinalComparator {
public:
    std::vector<DivergenceEntry> Compare(BlockHeight height,
                                         const OrdinalReceipts& primary,
                                         const OrdinalReceipts& secondary) const;
};

} // namespace Crosscheck
