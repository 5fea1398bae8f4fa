#include "divergence.h"

#include <sstream>

namespace Crosscheck {

const char* DivergenceKindName(DivergenceKind kind) {
    switch (kind) {
        case DivergenceKind::MISSING_IN_SECONDARY: return "MISSING_IN_SECONDARY";
        case DivergenceKind::MISSING_IN_PRIMARY: return "MISSING_IN_PRIMARY";
        case DivergenceKind::FIELD_MISMATCH: return "FIELD_MISMATCH";
        case DivergenceKind::COUNT_MISMATCH: return "COUNT_MISMATCH";
    }
    return "UNKNOWN";
}

const char* BlockStatusName(BlockStatus status) {
    switch (status) {
        case BlockStatus::OK: return "OK";
        case BlockStatus::FETCH_FAILED: return "FETCH_FAILED";
        case BlockStatus::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

std::string DescribeDivergence(const DivergenceEntry& entry) {
    std::ostringstream out;
    out << "[" << entry.height << "] " << DivergenceKindName(entry.kind);
    if (!entry.key.empty()) {
        out << " " << entry.key;
    }
    if (!entry.detail.empty()) {
        out << ": " << entry.detail;
    }
    for (const auto& field : entry.fields) {
        out << " " << field.field << "{primary=" << field.primary
            << ", secondary=" << field.secondary << "}";
    }
    return out.str();
}

} // namespace Crosscheck
