#include "clump_match/catalog/catalog.hpp"
#include "clump_match/config/configuration.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/core/events.hpp"
#include "clump_match/core/utils.hpp"
#include "clump_match/io/catalog_io.hpp"
#include "clump_match/pipeline/report.hpp"
#include "clump_match/pipeline/source_match.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace clump_match;
namespace fs = std::filesystem;
using nlohmann::json;

namespace {

const char* kReferenceCsv =
    "# DATE-OBS = 2018-01-01\n"
    "id,x,y,position_error,flux,flux_error,size\n"
    "r0,0,0,0.05,100,2,1.0\n"
    "r1,1,0,0.05,100,2,1.0\n"
    "r2,0,1,0.05,100,2,1.0\n"
    "r3,1,1,0.05,100,2,1.0\n"
    "r4,2,2,0.05,100,2,1.0\n";

const char* kTargetCsv =
    "# DATE-OBS = 2019-01-01\n"
    "id,x,y,position_error,flux,flux_error,size\n"
    "t0,0.1,0.1,0.05,105,2,1.0\n"
    "t1,1.1,0.1,0.05,105,2,1.0\n"
    "t2,0.1,1.1,0.05,105,2,1.0\n"
    "t3,1.1,1.1,0.05,105,2,1.0\n"
    "t4,2.1,2.1,0.05,105,2,1.0\n"
    "t5,10,10,0.05,500,2,1.0\n";

struct Workspace {
    fs::path dir;
    fs::path target;
    fs::path reference;
};

Workspace make_workspace(const std::string& name) {
    Workspace ws;
    ws.dir = fs::temp_directory_path() / ("clump_match_test_" + name);
    fs::remove_all(ws.dir);
    fs::create_directories(ws.dir);
    ws.target = ws.dir / "target.csv";
    ws.reference = ws.dir / "reference.csv";
    core::write_text(ws.target, kTargetCsv);
    core::write_text(ws.reference, kReferenceCsv);
    return ws;
}

std::vector<json> parse_events(const std::string& text) {
    std::vector<json> events;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) events.push_back(json::parse(line));
    }
    return events;
}

} // namespace

TEST_CASE("source_match_end_to_end_emits_phase_events") {
    const auto ws = make_workspace("source_match_e2e");
    config::Config cfg;
    cfg.matching.max_separation = 0.5;

    std::ostringstream events;
    core::EventLog log(&events, "run-1");
    const auto out = pipeline::source_match(ws.target, ws.reference, cfg, &log);

    REQUIRE(out.target.size() == 6);
    REQUIRE(out.reference.size() == 5);
    REQUIRE(out.target.epoch() == "2019-01-01");
    REQUIRE(out.matches.size() == 5);
    REQUIRE(out.matches.unmatched_target.size() == 1);
    REQUIRE(out.result.offset_x == Catch::Approx(0.1));
    REQUIRE(out.result.offset_y == Catch::Approx(0.1));
    REQUIRE(out.result.flux_scale == Catch::Approx(1.05));
    REQUIRE(out.result.n_used == 5);
    REQUIRE(out.result.n_rejected == 0);

    const auto ev = parse_events(events.str());
    const std::vector<std::string> expected = {
        "phase_start", "catalog_loaded", "phase_end",
        "phase_start", "catalog_loaded", "phase_end",
        "phase_start", "match_summary", "phase_end",
        "phase_start", "normalization_result", "phase_end"};
    REQUIRE(ev.size() == expected.size());
    for (size_t i = 0; i < ev.size(); ++i) {
        REQUIRE(ev[i]["type"] == expected[i]);
        REQUIRE(ev[i]["run_id"] == "run-1");
        REQUIRE(ev[i]["seq"] == static_cast<int>(i) + 1);
        if (ev[i]["type"] == "phase_end") {
            REQUIRE(ev[i]["status"] == "ok");
            REQUIRE(ev[i].contains("elapsed_ms"));
        }
    }
    REQUIRE(ev.front()["phase_name"] == "LOAD_TARGET");
    REQUIRE(ev[1]["role"] == "target");
    REQUIRE(ev[1]["catalog"]["n_detections"] == 6);
    REQUIRE(ev[4]["role"] == "reference");
    REQUIRE(ev[4]["catalog"]["epoch"] == "2018-01-01");

    REQUIRE(ev[7]["n_matches"] == 5);
    REQUIRE(ev[7]["unmatched_target"]["by_reason"]["no_match"] == 1);
    REQUIRE_FALSE(ev[7]["unmatched_target"].contains("detections"));

    REQUIRE(ev[10]["n_used"] == 5);
    REQUIRE(ev[10]["flux_model"] == "ratio");
    REQUIRE(ev[10]["flux_scale"]["value"].get<double>() == Catch::Approx(1.05));
    REQUIRE(ev.back()["phase_name"] == "NORMALIZE");

    fs::remove_all(ws.dir);
}

TEST_CASE("write_outputs_writes_result_files") {
    const auto ws = make_workspace("source_match_outputs");
    config::Config cfg;
    cfg.matching.max_separation = 0.5;
    cfg.output.write_normalized_catalog = true;

    const auto out = pipeline::source_match(ws.target, ws.reference, cfg);
    const fs::path out_dir = ws.dir / "out";
    const auto written = pipeline::write_outputs(out_dir, out, cfg, "run-2");

    REQUIRE(written.size() == 4);
    for (const auto& p : written) {
        REQUIRE(fs::exists(p));
    }

    const json doc = json::parse(core::read_text(out_dir / "normalization.json"));
    REQUIRE(doc["normalization"]["flux_scale"]["value"].get<double>() == Catch::Approx(1.05));
    REQUIRE(doc["normalization"]["flux_model"] == "ratio");
    REQUIRE(doc["normalization"]["n_used"] == 5);
    REQUIRE(doc["normalization"]["position_scale"].is_null());
    REQUIRE(doc["matching"]["n_matches"] == 5);
    REQUIRE(doc["matching"]["unmatched_target"]["by_reason"]["no_match"] == 1);
    REQUIRE(doc["provenance"]["run_id"] == "run-2");
    REQUIRE(doc["provenance"]["target"]["sha256"] == core::sha256_file(ws.target));

    const io::Table matches = io::read_delimited_table(out_dir / "matches.csv", ",");
    REQUIRE(matches.n_rows == 5);
    REQUIRE(matches.find("status") != nullptr);
    for (const auto& s : matches.find("status")->text) {
        REQUIRE(s == "used");
    }

    const auto saved = config::Config::load(out_dir / "config.yaml");
    REQUIRE(saved.matching.max_separation == Catch::Approx(0.5));

    const auto normalized =
        catalog::load_catalog(out_dir / "normalized_catalog.csv", config::CatalogConfig());
    REQUIRE(normalized.size() == 6);
    REQUIRE(normalized[0].id == "t0");
    REQUIRE(normalized[0].x == Catch::Approx(0.0).margin(1e-9));
    REQUIRE(normalized[0].flux == Catch::Approx(100.0));
    REQUIRE(normalized[5].flux == Catch::Approx(500.0 / 1.05));

    fs::remove_all(ws.dir);
}

TEST_CASE("source_match_missing_file_reports_error_event") {
    const auto ws = make_workspace("source_match_missing");
    config::Config cfg;

    std::ostringstream events;
    core::EventLog log(&events, "run-3");
    REQUIRE_THROWS_AS(pipeline::source_match(ws.dir / "absent.csv", ws.reference, cfg, &log),
                      IOError);

    const auto ev = parse_events(events.str());
    REQUIRE(ev.size() == 3);
    REQUIRE(ev[1]["type"] == "error");
    REQUIRE(ev[1]["error_type"] == "io");
    REQUIRE(ev[2]["type"] == "phase_end");
    REQUIRE(ev[2]["phase_name"] == "LOAD_TARGET");
    REQUIRE(ev[2]["status"] == "error");

    fs::remove_all(ws.dir);
}

TEST_CASE("source_match_rejects_invalid_config_before_loading") {
    const auto ws = make_workspace("source_match_bad_config");
    config::Config cfg;
    cfg.matching.max_separation = -1.0;

    std::ostringstream events;
    core::EventLog log(&events);
    REQUIRE_THROWS_AS(pipeline::source_match(ws.target, ws.reference, cfg, &log),
                      ValidationError);
    const auto ev = parse_events(events.str());
    REQUIRE(ev.size() == 1);
    REQUIRE(ev[0]["type"] == "error");
    REQUIRE(ev[0]["error_type"] == "validation");

    fs::remove_all(ws.dir);
}

TEST_CASE("match_catalogs_propagates_insufficient_samples") {
    std::vector<catalog::Detection> ref(2), tgt(2);
    for (int i = 0; i < 2; ++i) {
        ref[i].id = "r" + std::to_string(i);
        ref[i].x = 5.0 * i;
        ref[i].flux = 10.0;
        tgt[i].id = "t" + std::to_string(i);
        tgt[i].x = 5.0 * i + 0.2;
        tgt[i].flux = 20.0;
    }

    config::Config cfg;
    cfg.matching.max_separation = 1.0;
    std::ostringstream events;
    core::EventLog log(&events);
    REQUIRE_THROWS_AS(pipeline::match_catalogs(catalog::Catalog(tgt), catalog::Catalog(ref), cfg,
                                               &log),
                      InsufficientSamplesError);

    const auto ev = parse_events(events.str());
    REQUIRE_FALSE(ev.empty());
    REQUIRE(ev.back()["type"] == "phase_end");
    REQUIRE(ev.back()["phase_name"] == "NORMALIZE");
    REQUIRE(ev.back()["status"] == "error");
    REQUIRE(ev[ev.size() - 2]["error_type"] == "insufficient_samples");
}
