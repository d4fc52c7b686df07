#pragma once

#include "clump_match/catalog/catalog.hpp"
#include "clump_match/config/configuration.hpp"
#include "clump_match/core/types.hpp"

#include <string>
#include <vector>

namespace clump_match::match {

// One accepted target/reference pair
struct Match {
    int target_index = -1;
    int reference_index = -1;
    catalog::Detection target;
    catalog::Detection reference;
    double separation = 0.0;
    bool ambiguous = false;  // another candidate was within the ambiguity margin
};

enum class UnmatchedReason {
    NO_MATCH,       // no candidate within the threshold, or all lost to nearer pairs
    INVALID_VALUE,  // NaN / infinite position or flux
    FILTERED,       // reference excluded by flux / size cuts
    AMBIGUOUS       // withheld under the reject policy
};

std::string unmatched_reason_to_string(UnmatchedReason reason);

struct Unmatched {
    int index = -1;
    catalog::Detection detection;
    UnmatchedReason reason = UnmatchedReason::NO_MATCH;
};

struct MatchSet {
    std::vector<Match> matches;  // acceptance order (ascending separation)
    std::vector<Unmatched> unmatched_target;
    std::vector<Unmatched> unmatched_reference;
    CoordinateSystem coordinates = CoordinateSystem::CARTESIAN;
    double max_separation = 0.0;
    size_t n_candidates = 0;

    size_t size() const { return matches.size(); }
    bool empty() const { return matches.empty(); }
    int count_ambiguous() const;
};

// Greedy nearest-first one-to-one matching. Candidates are pairs with
// separation <= max_separation; they are accepted in ascending separation
// order (ties by reference index, then target index) while both sides are
// still unassigned.
MatchSet match(const catalog::Catalog& target, const catalog::Catalog& reference,
               const config::MatchingConfig& cfg);

// Cartesian matching with default ambiguity handling and no reference cuts.
MatchSet match(const catalog::Catalog& target, const catalog::Catalog& reference,
               double max_separation);

} // namespace clump_match::match
