#include "clump_match/match/matcher.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/match/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace clump_match::match {

std::string unmatched_reason_to_string(UnmatchedReason reason) {
    switch (reason) {
        case UnmatchedReason::NO_MATCH: return "no_match";
        case UnmatchedReason::INVALID_VALUE: return "invalid_value";
        case UnmatchedReason::FILTERED: return "filtered";
        case UnmatchedReason::AMBIGUOUS: return "ambiguous";
        default: return "unknown";
    }
}

int MatchSet::count_ambiguous() const {
    int n = 0;
    for (const auto& m : matches) {
        if (m.ambiguous) ++n;
    }
    return n;
}

namespace {

struct Candidate {
    double distance;
    int reference_index;
    int target_index;
};

enum class SlotState {
    AVAILABLE,
    ASSIGNED,
    WITHHELD,
    INVALID,
    FILTERED
};

bool reference_passes_filters(const catalog::Detection& d, const config::MatchingConfig& cfg) {
    if (cfg.min_reference_flux && d.flux < *cfg.min_reference_flux) {
        return false;
    }
    if (cfg.max_reference_size) {
        if (!std::isfinite(d.size) || d.size > *cfg.max_reference_size) return false;
    }
    return true;
}

UnmatchedReason reason_for(SlotState state) {
    switch (state) {
        case SlotState::INVALID: return UnmatchedReason::INVALID_VALUE;
        case SlotState::FILTERED: return UnmatchedReason::FILTERED;
        case SlotState::WITHHELD: return UnmatchedReason::AMBIGUOUS;
        default: return UnmatchedReason::NO_MATCH;
    }
}

} // namespace

MatchSet match(const catalog::Catalog& target, const catalog::Catalog& reference,
               const config::MatchingConfig& cfg) {
    const CoordinateSystem cs = string_to_coordinate_system(cfg.coordinates);
    if (cs == CoordinateSystem::UNKNOWN) {
        throw ValidationError("matching.coordinates must be cartesian or spherical, got '" +
                              cfg.coordinates + "'");
    }
    const AmbiguityPolicy policy = string_to_ambiguity_policy(cfg.ambiguity_policy);
    if (policy == AmbiguityPolicy::UNKNOWN) {
        throw ValidationError("matching.ambiguity_policy must be nearest or reject, got '" +
                              cfg.ambiguity_policy + "'");
    }
    if (!(cfg.max_separation >= 0.0)) {
        throw ValidationError("max_separation must be >= 0, got " +
                              std::to_string(cfg.max_separation));
    }
    if (!(cfg.ambiguity_margin >= 0.0)) {
        throw ValidationError("matching.ambiguity_margin must be >= 0");
    }

    const int n_target = static_cast<int>(target.size());
    const int n_reference = static_cast<int>(reference.size());

    std::vector<SlotState> target_state(static_cast<size_t>(n_target), SlotState::AVAILABLE);
    std::vector<SlotState> reference_state(static_cast<size_t>(n_reference), SlotState::AVAILABLE);

    for (int t = 0; t < n_target; ++t) {
        const auto& d = target[static_cast<size_t>(t)];
        if (!d.has_valid_position() || !d.has_valid_flux()) {
            target_state[static_cast<size_t>(t)] = SlotState::INVALID;
        }
    }
    for (int r = 0; r < n_reference; ++r) {
        const auto& d = reference[static_cast<size_t>(r)];
        if (!d.has_valid_position() || !d.has_valid_flux()) {
            reference_state[static_cast<size_t>(r)] = SlotState::INVALID;
        } else if (!reference_passes_filters(d, cfg)) {
            reference_state[static_cast<size_t>(r)] = SlotState::FILTERED;
        }
    }

    // Candidate generation in reference-major order; the stable sort keeps
    // that order among equal distances.
    std::vector<Candidate> candidates;
    for (int r = 0; r < n_reference; ++r) {
        if (reference_state[static_cast<size_t>(r)] != SlotState::AVAILABLE) continue;
        const auto& ref = reference[static_cast<size_t>(r)];
        for (int t = 0; t < n_target; ++t) {
            if (target_state[static_cast<size_t>(t)] != SlotState::AVAILABLE) continue;
            const double d = separation(target[static_cast<size_t>(t)], ref, cs);
            if (d <= cfg.max_separation) {
                candidates.push_back({d, r, t});
            }
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.distance < b.distance;
                     });

    MatchSet result;
    result.coordinates = cs;
    result.max_separation = cfg.max_separation;
    result.n_candidates = candidates.size();

    auto available = [&](const Candidate& c) {
        return target_state[static_cast<size_t>(c.target_index)] == SlotState::AVAILABLE &&
               reference_state[static_cast<size_t>(c.reference_index)] == SlotState::AVAILABLE;
    };

    for (size_t i = 0; i < candidates.size(); ++i) {
        const Candidate& c = candidates[i];
        if (!available(c)) continue;

        // Every earlier candidate is already resolved, so competitors can
        // only follow in the sorted list.
        bool target_contested = false;
        bool reference_contested = false;
        const double limit = c.distance + cfg.ambiguity_margin;
        for (size_t j = i + 1; j < candidates.size() && candidates[j].distance <= limit; ++j) {
            const Candidate& o = candidates[j];
            if (!available(o)) continue;
            if (o.target_index == c.target_index) target_contested = true;
            if (o.reference_index == c.reference_index) reference_contested = true;
        }
        const bool contested = target_contested || reference_contested;

        if (contested && policy == AmbiguityPolicy::REJECT) {
            if (target_contested) {
                target_state[static_cast<size_t>(c.target_index)] = SlotState::WITHHELD;
            }
            if (reference_contested) {
                reference_state[static_cast<size_t>(c.reference_index)] = SlotState::WITHHELD;
            }
            continue;
        }

        target_state[static_cast<size_t>(c.target_index)] = SlotState::ASSIGNED;
        reference_state[static_cast<size_t>(c.reference_index)] = SlotState::ASSIGNED;

        Match m;
        m.target_index = c.target_index;
        m.reference_index = c.reference_index;
        m.target = target[static_cast<size_t>(c.target_index)];
        m.reference = reference[static_cast<size_t>(c.reference_index)];
        m.separation = c.distance;
        m.ambiguous = contested;
        result.matches.push_back(std::move(m));
    }

    for (int t = 0; t < n_target; ++t) {
        const SlotState s = target_state[static_cast<size_t>(t)];
        if (s == SlotState::ASSIGNED) continue;
        result.unmatched_target.push_back({t, target[static_cast<size_t>(t)], reason_for(s)});
    }
    for (int r = 0; r < n_reference; ++r) {
        const SlotState s = reference_state[static_cast<size_t>(r)];
        if (s == SlotState::ASSIGNED) continue;
        result.unmatched_reference.push_back({r, reference[static_cast<size_t>(r)], reason_for(s)});
    }

    std::cerr << "[MATCH] " << result.matches.size() << " matches from "
              << result.n_candidates << " candidates (target " << n_target
              << ", reference " << n_reference << ", max_separation "
              << cfg.max_separation << ", ambiguous " << result.count_ambiguous()
              << ")" << std::endl;

    return result;
}

MatchSet match(const catalog::Catalog& target, const catalog::Catalog& reference,
               double max_separation) {
    config::MatchingConfig cfg;
    cfg.max_separation = max_separation;
    return match(target, reference, cfg);
}

} // namespace clump_match::match
