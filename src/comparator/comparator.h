#pragma once

#include <vector>

#include "divergence.h"
#include "receipts.h"

namespace Crosscheck {

/**
 * Dispatches to the comparator matching the receipts' protocol.
 * Both receipt sets must hold the same alternative; the scheduler rejects
 * mismatched sets as schema errors before they get here.
 * Output is deterministic: ordered by match key, then divergence kind,
 * with block-level entries last.
 */
std::vector<DivergenceEntry> CompareReceipts(BlockHeight height,
                                             const Receipts& primary,
                                             const Receipts& secondary);

} // namespace Crosscheck
