#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "../comparator/divergence.h"

namespace Crosscheck {

// Inclusive run of consecutive heights.
struct HeightRange {
    BlockHeight first = 0;
    BlockHeight last = 0;

    bool operator==(const HeightRange& other) const { return first == other.first && last == other.last; }
};

/**
 * Aggregate of every finalized block in a run. Blocks arrive in height order,
 * so unverified heights collapse into ranges and stay small on flaky runs.
 */
struct RunSummary {
    explicit RunSummary(BlockHeight bucket = 1000) : bucket_size(bucket == 0 ? 1 : bucket) {}

    void Record(const BlockResult& result);

    bool DivergenceFound() const { return total_divergences > 0; }
    // Some heights could not be verified; distinct from DivergenceFound().
    bool VerificationIncomplete() const { return unverified_blocks > 0; }

    BlockHeight BucketOf(BlockHeight height) const { return height / bucket_size * bucket_size; }

    std::string final_state;
    BlockHeight start_height = 0;
    BlockHeight end_height = 0;
    BlockHeight bucket_size;

    uint64_t blocks_finalized = 0;
    uint64_t blocks_ok = 0;
    uint64_t blocks_diverged = 0;
    uint64_t total_divergences = 0;
    absl::btree_map<DivergenceKind, uint64_t> divergences_by_kind;
    absl::btree_map<BlockHeight, uint64_t> divergences_by_bucket;
    uint64_t unverified_blocks = 0;
    std::vector<HeightRange> unverified_ranges;

    double elapsed_seconds = 0;
};

} // namespace Crosscheck
