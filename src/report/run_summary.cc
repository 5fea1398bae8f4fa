#include "run_summary.h"

namespace Crosscheck {

void RunSummary::Record(const BlockResult& result) {
    ++blocks_finalized;
    if (result.status != BlockStatus::OK) {
        ++unverified_blocks;
        if (!unverified_ranges.empty() && unverified_ranges.back().last + 1 == result.height) {
            unverified_ranges.back().last = result.height;
        } else {
            unverified_ranges.push_back({result.height, result.height});
        }
        return;
    }
    ++blocks_ok;
    if (result.divergences.empty()) {
        return;
    }
    ++blocks_diverged;
    for (const auto& entry : result.divergences) {
        ++total_divergences;
        ++divergences_by_kind[entry.kind];
        ++divergences_by_bucket[BucketOf(entry.height)];
    }
}

} // namespace Crosscheck
