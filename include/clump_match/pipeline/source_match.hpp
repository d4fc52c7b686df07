#pragma once

#include "clump_match/catalog/catalog.hpp"
#include "clump_match/config/configuration.hpp"
#include "clump_match/core/events.hpp"
#include "clump_match/core/types.hpp"
#include "clump_match/match/matcher.hpp"
#include "clump_match/normalize/normalizer.hpp"

#include <string>

namespace clump_match::pipeline {

struct SourceMatchOutput {
    fs::path target_path;
    fs::path reference_path;
    catalog::Catalog target;
    catalog::Catalog reference;
    match::MatchSet matches;
    normalize::NormalizationResult result;
};

// Match and normalize two loaded catalogs. When `log` is given each
// phase is logged as phase_start, its result record (match_summary or
// normalization_result, plus any warnings) and phase_end. Errors propagate
// after an error event and a failed phase_end.
SourceMatchOutput match_catalogs(const catalog::Catalog& target,
                                 const catalog::Catalog& reference,
                                 const config::Config& cfg,
                                 core::EventLog* log = nullptr);

// Load both catalogs, logging a catalog_loaded record for each, then
// match_catalogs. The configuration is validated first. No retries.
SourceMatchOutput source_match(const fs::path& target_path,
                               const fs::path& reference_path,
                               const config::Config& cfg,
                               core::EventLog* log = nullptr);

} // namespace clump_match::pipeline
