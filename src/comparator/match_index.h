#pragma once

#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"

namespace Crosscheck {

/**
 * Orders events by match key. An event whose key was already taken in the
 * same block is keyed "<key>#<n>", n counting repeats in receipt order, so two
 * indexers that emit the same events in the same order produce identical keys.
 */
template <typename Event, typename KeyFn>
absl::btree_map<std::string, const Event*> IndexByMatchKey(const std::vector<Event>& events, KeyFn key_fn) {
    absl::btree_map<std::string, const Event*> index;
    absl::flat_hash_map<std::string, int> repeats;
    for (const auto& event : events) {
        std::string base = key_fn(event);
        std::string key = base;
        int& n = repeats[base];
        if (n > 0) {
            key = absl::StrCat(base, "#", n);
        }
        while (!index.emplace(key, &event).second) {
            key = absl::StrCat(base, "#", ++n);
        }
        ++n;
    }
    return index;
}

/**
 * Walks two match indexes in key order, calling on_primary_only,
 * on_secondary_only or on_both for every key.
 */
template <typename Event, typename PrimaryOnly, typename SecondaryOnly, typename Both>
void MergeByMatchKey(const absl::btree_map<std::string, const Event*>& primary,
                     const absl::btree_map<std::string, const Event*>& secondary,
                     PrimaryOnly on_primary_only, SecondaryOnly on_secondary_only, Both on_both) {
    auto p = primary.begin();
    auto s = secondary.begin();
    while (p != primary.end() || s != secondary.end()) {
        if (s == secondary.end() || (p != primary.end() && p->first < s->first)) {
            on_primary_only(p->first, *p->second);
            ++p;
        } else if (p == primary.end() || s->first < p->first) {
            on_secondary_only(s->first, *s->second);
            ++s;
        } else {
            on_both(p->first, *p->second, *s->second);
            ++p;
            ++s;
        }
    }
}

} // namespace Crosscheck
