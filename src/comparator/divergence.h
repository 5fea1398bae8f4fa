#pragma once

#include <string>
#include <vector>

#include "../common/types.h"

namespace Crosscheck {

enum class DivergenceKind {
    MISSING_IN_SECONDARY,
    MISSING_IN_PRIMARY,
    FIELD_MISMATCH,
    COUNT_MISMATCH
};

const char* DivergenceKindName(DivergenceKind kind);

struct FieldDifference {
    std::string field;
    std::string primary;
    std::string secondary;

    bool operator==(const FieldDifference& other) const {
        return field == other.field && primary == other.primary && secondary == other.secondary;
    }
};

/**
 * A single disagreement between the two indexers at one height.
 * key is the comparator's match key; empty for block-level entries.
 */
struct DivergenceEntry {
    BlockHeight height = 0;
    DivergenceKind kind = DivergenceKind::FIELD_MISMATCH;
    std::string key;
    std::string detail;
    std::vector<FieldDifference> fields;

    bool operator==(const DivergenceEntry& other) const {
        return height == other.height && kind == other.kind && key == other.key &&
               detail == other.detail && fields == other.fields;
    }
};

enum class BlockStatus {
    OK,
    FETCH_FAILED,
    FATAL
};

const char* BlockStatusName(BlockStatus status);

struct BlockResult {
    BlockHeight height = 0;
    BlockStatus status = BlockStatus::OK;
    std::vector<DivergenceEntry> divergences;
    std::string error;   // set for FETCH_FAILED and FATAL
    int attempts = 0;    // fetch attempts summed over both endpoints
};

// One-line human readable rendering, e.g. for log sinks.
std::string DescribeDivergence(const DivergenceEntry& entry);

} // namespace Crosscheck
