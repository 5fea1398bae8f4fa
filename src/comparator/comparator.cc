#include "comparator.h"

#include <glog/logging.h>

#include "brc20_comparator.h"
#include "ordinal_comparator.h"

namespace Crosscheck {

std::vector<DivergenceEntry> CompareReceipts(BlockHeight height,
                                             const Receipts& primary,
                                             const Receipts& secondary) {
    CHECK_EQ(primary.index(), secondary.index()) << "Receipt protocols differ at height " << height;

    if (const auto* p = std::get_if<OrdinalReceipts>(&primary)) {
        return OrdinalComparator().Compare(height, *p, std::get<OrdinalReceipts>(secondary));
    }
    return Brc20Comparator().Compare(height, std::get<Brc20Receipts>(primary),
                                     std::get<Brc20Receipts>(secondary));
}

} // namespace Crosscheck
