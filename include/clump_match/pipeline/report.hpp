#pragma once

#include "clump_match/config/configuration.hpp"
#include "clump_match/io/catalog_io.hpp"
#include "clump_match/match/matcher.hpp"
#include "clump_match/normalize/normalizer.hpp"
#include "clump_match/pipeline/source_match.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace clump_match::pipeline {

using json = nlohmann::json;

json normalization_to_json(const normalize::NormalizationResult& result);
// Counts per outcome; list_detections adds the id and reason of every
// unmatched detection.
json match_summary_to_json(const match::MatchSet& matches, bool list_detections = true);
json catalog_summary_to_json(const catalog::Catalog& catalog, const fs::path& path);

// Diagnostic table: one row per match with residuals and inlier flags.
io::Table build_match_table(const match::MatchSet& matches,
                            const normalize::NormalizationResult& result);

// Writes normalization.json, matches.csv and/or matches.fits, config.yaml
// and, if configured, normalized_catalog.csv into out_dir. Returns the
// written paths.
std::vector<fs::path> write_outputs(const fs::path& out_dir,
                                    const SourceMatchOutput& output,
                                    const config::Config& cfg,
                                    const std::string& run_id);

} // namespace clump_match::pipeline
