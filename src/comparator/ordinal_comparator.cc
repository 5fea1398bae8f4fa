#include "ordinal_comparator.h"

#include "match_index.h"

namespace Crosscheck {

namespace {

std::string InscriptionKey(const InscriptionEvent& event) {
    return event.inscription_id;
}

void AddIfDifferent(std::vector<FieldDifference>& fields, const char* name,
                    const std::string& primary, const std::string& secondary) {
    if (primary != secondary) {
        fields.push_back({name, primary, secondary});
    }
}

} // namespace

std::vector<DivergenceEntry> OrdinalComparator::Compare(BlockHeight height,
                                                        const OrdinalReceipts& primary,
                                                        const OrdinalReceipts& secondary) const {
    std::vector<DivergenceEntry> divergences;
    auto primary_index = IndexByMatchKey(primary.events, InscriptionKey);
    auto secondary_index = IndexByMatchKey(secondary.events, InscriptionKey);

    MergeByMatchKey<InscriptionEvent>(
        primary_index, secondary_index,
        [&](const std::string& key, const InscriptionEvent& event) {
            divergences.push_back({height, DivergenceKind::MISSING_IN_SECONDARY, key,
                                   "inscription event in tx " + event.txid + " not reported by secondary", {}});
        },
        [&](const std::string& key, const InscriptionEvent& event) {
            divergences.push_back({height, DivergenceKind::MISSING_IN_PRIMARY, key,
                                   "inscription event in tx " + event.txid + " not reported by primary", {}});
        },
        [&](const std::string& key, const InscriptionEvent& p, const InscriptionEvent& s) {
            std::vector<FieldDifference> fields;
            AddIfDifferent(fields, "owner", p.owner, s.owner);
            AddIfDifferent(fields, "content_hash", p.content_hash, s.content_hash);
            AddIfDifferent(fields, "sequence", std::to_string(p.sequence), std::to_string(s.sequence));
            if (!fields.empty()) {
                divergences.push_back({height, DivergenceKind::FIELD_MISMATCH, key, "", std::move(fields)});
            }
        });

    return divergences;
}

} // namespace Crosscheck
