#include "brc20_comparator.h"

#include "match_index.h"
#include "normalize.h"

namespace Crosscheck {

namespace {

std::string LedgerKey(const Brc20Event& event) {
    return absl::StrCat(NormalizeTicker(event.ticker), ":", event.txid);
}

std::string CanonicalAmount(const std::string& amount) {
    std::string normalized;
    return NormalizeDecimal(amount, normalized) ? normalized : amount;
}

std::string DescribeEntry(const Brc20Event& event) {
    return absl::StrCat(Brc20OperationName(event.op), " ", event.amount, " ", event.ticker,
                        " from '", event.from, "' to '", event.to, "'");
}

} // namespace

std::vector<DivergenceEntry> Brc20Comparator::Compare(BlockHeight height,
                                                      const Brc20Receipts& primary,
                                                      const Brc20Receipts& secondary) const {
    std::vector<DivergenceEntry> divergences;
    auto primary_index = IndexByMatchKey(primary.events, LedgerKey);
    auto secondary_index = IndexByMatchKey(secondary.events, LedgerKey);

    // Block-level entry; its empty key orders it before every keyed entry.
    if (primary.events.size() != secondary.events.size()) {
        divergences.push_back({height, DivergenceKind::COUNT_MISMATCH, "",
                               absl::StrCat("primary reported ", primary.events.size(),
                                            " entries, secondary reported ", secondary.events.size()),
                               {}});
    }

    MergeByMatchKey<Brc20Event>(
        primary_index, secondary_index,
        [&](const std::string& key, const Brc20Event& event) {
            divergences.push_back({height, DivergenceKind::MISSING_IN_SECONDARY, key,
                                   DescribeEntry(event) + " not reported by secondary", {}});
        },
        [&](const std::string& key, const Brc20Event& event) {
            divergences.push_back({height, DivergenceKind::MISSING_IN_PRIMARY, key,
                                   DescribeEntry(event) + " not reported by primary", {}});
        },
        [&](const std::string& key, const Brc20Event& p, const Brc20Event& s) {
            std::vector<FieldDifference> fields;
            if (p.op != s.op) {
                fields.push_back({"op", Brc20OperationName(p.op), Brc20OperationName(s.op)});
            }
            std::string p_amount = CanonicalAmount(p.amount);
            std::string s_amount = CanonicalAmount(s.amount);
            if (p_amount != s_amount) {
                fields.push_back({"amount", p_amount, s_amount});
            }
            if (p.from != s.from) {
                fields.push_back({"from", p.from, s.from});
            }
            if (p.to != s.to) {
                fields.push_back({"to", p.to, s.to});
            }
            if (!fields.empty()) {
                divergences.push_back({height, DivergenceKind::FIELD_MISMATCH, key, "", std::move(fields)});
            }
        });

    return divergences;
}

} // namespace Crosscheck
