#include "clump_match/pipeline/source_match.hpp"
#include "clump_match/core/events.hpp"
#include "clump_match/pipeline/report.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace clump_match::pipeline {

using core::json;

namespace {

json elapsed_since(std::chrono::steady_clock::time_point t0) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0);
    return {{"elapsed_ms", ms.count()}};
}

// One phase between phase_start and phase_end. `record` writes the phase's
// result event before the phase closes. On failure an error event and a
// failed phase_end are written and the exception is rethrown.
template <typename Fn, typename Record>
auto run_phase(core::EventLog& log, Phase phase, Fn&& fn, Record&& record) -> decltype(fn()) {
    log.phase_start(phase);
    const auto t0 = std::chrono::steady_clock::now();
    try {
        auto value = fn();
        record(value);
        log.phase_end(phase, "ok", elapsed_since(t0));
        return value;
    } catch (const std::exception& e) {
        log.error(e);
        json payload = elapsed_since(t0);
        payload["error"] = e.what();
        log.phase_end(phase, "error", payload);
        throw;
    }
}

catalog::Catalog load_phase(core::EventLog& log, Phase phase, const char* role,
                            const fs::path& path, const config::CatalogConfig& cfg) {
    return run_phase(
        log, phase, [&] { return catalog::load_catalog(path, cfg); },
        [&](const catalog::Catalog& cat) {
            log.write("catalog_loaded",
                      {{"role", role}, {"catalog", catalog_summary_to_json(cat, path)}});
        });
}

SourceMatchOutput match_and_normalize(core::EventLog& log, const catalog::Catalog& target,
                                      const catalog::Catalog& reference,
                                      const config::Config& cfg) {
    SourceMatchOutput output;
    output.target = target;
    output.reference = reference;

    output.matches = run_phase(
        log, Phase::MATCH, [&] { return match::match(target, reference, cfg.matching); },
        [&](const match::MatchSet& ms) {
            log.write("match_summary", match_summary_to_json(ms, false));
        });

    output.result = run_phase(
        log, Phase::NORMALIZE, [&] { return normalize::normalize(output.matches, cfg); },
        [&](const normalize::NormalizationResult& result) {
            for (const auto& w : result.warnings) log.warning(w);
            log.write("normalization_result", normalization_to_json(result));
        });
    return output;
}

} // namespace

SourceMatchOutput match_catalogs(const catalog::Catalog& target,
                                 const catalog::Catalog& reference,
                                 const config::Config& cfg,
                                 core::EventLog* log) {
    core::EventLog silent;
    return match_and_normalize(log ? *log : silent, target, reference, cfg);
}

SourceMatchOutput source_match(const fs::path& target_path,
                               const fs::path& reference_path,
                               const config::Config& cfg,
                               core::EventLog* events) {
    core::EventLog silent;
    core::EventLog& log = events ? *events : silent;

    try {
        cfg.validate();
    } catch (const std::exception& e) {
        log.error(e);
        throw;
    }

    std::cerr << "[LOAD] target=" << target_path.string()
              << " reference=" << reference_path.string() << std::endl;

    catalog::Catalog target =
        load_phase(log, Phase::LOAD_TARGET, "target", target_path, cfg.catalog);
    catalog::Catalog reference =
        load_phase(log, Phase::LOAD_REFERENCE, "reference", reference_path, cfg.catalog);

    SourceMatchOutput output = match_and_normalize(log, target, reference, cfg);
    output.target_path = target_path;
    output.reference_path = reference_path;
    return output;
}

} // namespace clump_match::pipeline
