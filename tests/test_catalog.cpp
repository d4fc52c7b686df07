#include "clump_match/catalog/catalog.hpp"
#include "clump_match/config/configuration.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/core/utils.hpp"
#include "clump_match/io/catalog_io.hpp"

#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace clump_match;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir(const std::string& name) {
    const fs::path dir = fs::temp_directory_path() / ("clump_match_test_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

const char* kGoodCsv =
    "# DATE-OBS = 2019-03-04\n"
    "# RADESYS: ICRS\n"
    "id,x,y,position_error,flux,flux_error,size\n"
    "a,1.0,2.0,0.1,100,5,3.0\n"
    "b,4.5,-2.0,0.2,-3.5,1,\n"
    "c,nan,0,0.1,10,1,2.0\n";

} // namespace

TEST_CASE("load_catalog_reads_csv_with_metadata") {
    const fs::path dir = scratch_dir("catalog_csv");
    const fs::path p = dir / "epoch_07.csv";
    core::write_text(p, kGoodCsv);

    const auto cat = catalog::load_catalog(p, config::CatalogConfig());
    REQUIRE(cat.size() == 3);
    REQUIRE(cat.epoch() == "2019-03-04");
    REQUIRE(cat.frame() == "ICRS");
    REQUIRE(cat[0].id == "a");
    REQUIRE(cat[0].x == Catch::Approx(1.0));
    REQUIRE(cat[0].flux_error == Catch::Approx(5.0));
    REQUIRE(cat[1].flux == Catch::Approx(-3.5));
    REQUIRE(std::isnan(cat[1].size));
    REQUIRE(std::isnan(cat[2].x));
    REQUIRE_FALSE(cat[2].has_valid_position());
    REQUIRE(cat.index_of("b") == 1);
    REQUIRE(cat.index_of("zzz") == -1);

    fs::remove_all(dir);
}

TEST_CASE("load_catalog_uses_file_stem_as_epoch_without_header") {
    const fs::path dir = scratch_dir("catalog_stem");
    const fs::path p = dir / "night_42.csv";
    core::write_text(p, "id,x,y,position_error,flux,flux_error,size\n1,0,0,0.1,1,1,1\n");

    const auto cat = catalog::load_catalog(p, config::CatalogConfig());
    REQUIRE(cat.epoch() == "night_42");
    REQUIRE(cat.frame().empty());

    fs::remove_all(dir);
}

TEST_CASE("load_catalog_missing_column_is_malformed") {
    const fs::path dir = scratch_dir("catalog_missing");
    const fs::path p = dir / "cat.csv";
    core::write_text(p, "id,x,y,position_error,flux_error,size\na,1,2,0.1,1,1\n");

    REQUIRE_THROWS_AS(catalog::load_catalog(p, config::CatalogConfig()), MalformedCatalogError);

    fs::remove_all(dir);
}

TEST_CASE("load_catalog_non_numeric_value_is_malformed") {
    const fs::path dir = scratch_dir("catalog_text");
    const fs::path p = dir / "cat.csv";
    core::write_text(p, "id,x,y,position_error,flux,flux_error,size\na,1,2,0.1,bright,1,1\n");

    try {
        catalog::load_catalog(p, config::CatalogConfig());
        FAIL("expected MalformedCatalogError");
    } catch (const MalformedCatalogError& e) {
        const std::string msg = e.what();
        REQUIRE(msg.find("bright") != std::string::npos);
        REQUIRE(msg.find("flux") != std::string::npos);
        REQUIRE(msg.find("row 1") != std::string::npos);
    }

    fs::remove_all(dir);
}

TEST_CASE("load_catalog_duplicate_id_is_malformed") {
    const fs::path dir = scratch_dir("catalog_dup");
    const fs::path p = dir / "cat.csv";
    core::write_text(p,
                     "id,x,y,position_error,flux,flux_error,size\n"
                     "a,1,2,0.1,1,1,1\n"
                     "a,3,4,0.1,1,1,1\n");

    REQUIRE_THROWS_AS(catalog::load_catalog(p, config::CatalogConfig()), MalformedCatalogError);

    fs::remove_all(dir);
}

TEST_CASE("load_catalog_ragged_row_is_malformed") {
    const fs::path dir = scratch_dir("catalog_ragged");
    const fs::path p = dir / "cat.csv";
    core::write_text(p, "id,x,y,position_error,flux,flux_error,size\na,1,2,0.1,1,1\n");

    REQUIRE_THROWS_AS(catalog::load_catalog(p, config::CatalogConfig()), MalformedCatalogError);

    fs::remove_all(dir);
}

TEST_CASE("load_catalog_missing_file_is_io_error") {
    REQUIRE_THROWS_AS(catalog::load_catalog("/nonexistent/cat.csv", config::CatalogConfig()),
                      IOError);
}

TEST_CASE("catalog_rejects_empty_identifier") {
    std::vector<catalog::Detection> dets(1);
    REQUIRE_THROWS_AS(catalog::Catalog(dets), MalformedCatalogError);
}

TEST_CASE("catalog_from_table_maps_columns_and_effective_size") {
    io::Table table;
    table.add_numeric("Index", {1.0, 2.0});
    table.add_numeric("Cen1", {10.0, 20.0});
    table.add_numeric("Cen2", {-5.0, 5.0});
    table.add_numeric("Peak", {0.5, 1.5});
    table.add_numeric("GCFWHM1", {2.0, 4.0});
    table.add_numeric("GCFWHM2", {8.0, 1.0});

    config::CatalogConfig cfg;
    cfg.columns.id = "Index";
    cfg.columns.x = "cen1";  // lookup is case-insensitive
    cfg.columns.y = "Cen2";
    cfg.columns.flux = "Peak";
    cfg.columns.size = "GCFWHM1";
    cfg.columns.size_minor = "GCFWHM2";
    cfg.columns.position_error = "";
    cfg.columns.flux_error = "";
    cfg.size_factor = 1.5;

    const auto cat = catalog::catalog_from_table(table, cfg, "clumps.fits");
    REQUIRE(cat.size() == 2);
    REQUIRE(cat[0].id == "1");
    REQUIRE(cat[1].id == "2");
    REQUIRE(cat[0].x == Catch::Approx(10.0));
    REQUIRE(cat[0].size == Catch::Approx(6.0));  // sqrt(2*8) * 1.5
    REQUIRE(cat[1].size == Catch::Approx(3.0));  // sqrt(4*1) * 1.5
    REQUIRE(std::isnan(cat[0].position_error));
    REQUIRE(std::isnan(cat[1].flux_error));
    REQUIRE(cat.epoch() == "clumps");
}

TEST_CASE("write_catalog_csv_round_trip") {
    const fs::path dir = scratch_dir("catalog_roundtrip");
    const fs::path p = dir / "out.csv";

    std::vector<catalog::Detection> dets(2);
    dets[0].id = "s1";
    dets[0].x = 0.1234567890123;
    dets[0].y = 2.0;
    dets[0].position_error = 0.05;
    dets[0].flux = 1.0e5;
    dets[0].flux_error = 12.5;
    dets[0].size = 3.0;
    dets[1].id = "s2";
    dets[1].x = -1.0;
    dets[1].y = -2.0;
    dets[1].flux = 7.0;
    const catalog::Catalog cat(dets, "e1", "ICRS", {{"DATE-OBS", "e1"}, {"RADESYS", "ICRS"}});

    catalog::write_catalog(p, cat);
    const auto back = catalog::load_catalog(p, config::CatalogConfig());

    REQUIRE(back.size() == 2);
    REQUIRE(back.epoch() == "e1");
    REQUIRE(back.frame() == "ICRS");
    REQUIRE(back[0].id == "s1");
    REQUIRE(back[0].x == dets[0].x);
    REQUIRE(back[0].flux == Catch::Approx(1.0e5));
    REQUIRE(std::isnan(back[1].position_error));
    REQUIRE(std::isnan(back[1].size));

    fs::remove_all(dir);
}

TEST_CASE("write_catalog_csv_quotes_cells_holding_the_delimiter") {
    const fs::path dir = scratch_dir("catalog_quoting");
    const fs::path p = dir / "out.csv";

    std::vector<catalog::Detection> dets(3);
    dets[0].id = "G1,north";
    dets[1].id = "core \"B\"";
    dets[2].id = "plain";
    for (size_t i = 0; i < dets.size(); ++i) {
        dets[i].x = static_cast<double>(i);
        dets[i].y = 1.0;
        dets[i].flux = 10.0;
    }
    const catalog::Catalog cat(dets, "e1", "", {{"DATE-OBS", "e1"}, {"OBJECT", "Orion, KL"}});

    catalog::write_catalog(p, cat);
    const auto back = catalog::load_catalog(p, config::CatalogConfig());

    REQUIRE(back.size() == 3);
    REQUIRE(back[0].id == "G1,north");
    REQUIRE(back[1].id == "core \"B\"");
    REQUIRE(back[2].id == "plain");
    REQUIRE(back[2].x == Catch::Approx(2.0));
    REQUIRE(back.metadata().at("OBJECT") == "Orion, KL");

    fs::remove_all(dir);
}

TEST_CASE("read_delimited_table_unbalanced_quote_is_malformed") {
    const fs::path dir = scratch_dir("catalog_bad_quote");
    const fs::path p = dir / "cat.csv";
    core::write_text(p, "id,x,y,flux\n\"a,1,2,10\n");

    REQUIRE_THROWS_AS(io::read_delimited_table(p, ","), MalformedCatalogError);

    fs::remove_all(dir);
}

TEST_CASE("write_delimited_table_rejects_line_breaks") {
    const fs::path dir = scratch_dir("catalog_line_break");
    io::Table table;
    table.add_text("id", {"two\nlines"});

    REQUIRE_THROWS_AS(io::write_delimited_table(dir / "out.csv", table, ','), ValidationError);

    fs::remove_all(dir);
}

TEST_CASE("read_delimited_table_supports_whitespace_delimiter") {
    const fs::path dir = scratch_dir("catalog_ws");
    const fs::path p = dir / "cat.txt";
    core::write_text(p, "id  x y flux\n1   0 0 10\n2   1 1 20\n");

    const auto table = io::read_delimited_table(p, "whitespace");
    REQUIRE(table.n_rows == 2);
    REQUIRE(table.columns.size() == 4);
    REQUIRE(table.find("FLUX") != nullptr);
    REQUIRE(table.find("FLUX")->text[1] == "20");

    fs::remove_all(dir);
}
