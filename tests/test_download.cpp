#include "sar_compose/catalog/http_client.hpp"
#include "sar_compose/config/configuration.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/events.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/pipeline/product_source.hpp"

#include <filesystem>
#include <sstream>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
namespace catalog = sar_compose::catalog;
namespace core = sar_compose::core;
namespace pipeline = sar_compose::pipeline;

TEST_CASE("download_with_checkpoint_renames_part_file") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "download");
    const fs::path src = tmp.path() / "remote.zip";
    core::write_text(src, "PK-not-really-a-zip");

    catalog::HttpClient http(10);
    std::ostringstream log;
    core::EventEmitter events("run-dl", log);
    const fs::path dest = tmp.path() / "cache" / "product.zip";

    pipeline::download_with_checkpoint(http, "file://" + src.string(), dest, catalog::HttpAuth{}, 0,
                                       events, sar_compose::Phase::DOWNLOAD);
    REQUIRE(core::read_text(dest) == "PK-not-really-a-zip");
    REQUIRE_FALSE(fs::exists(tmp.path() / "cache" / "product.zip.part"));
}

TEST_CASE("failed_download_leaves_no_partial_file") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "download");
    catalog::HttpClient http(10);
    std::ostringstream log;
    core::EventEmitter events("run-dl", log);
    const fs::path dest = tmp.path() / "product.zip";

    REQUIRE_THROWS_AS(pipeline::download_with_checkpoint(http, "file://" + (tmp.path() / "missing.zip").string(),
                                                         dest, catalog::HttpAuth{}, 0, events,
                                                         sar_compose::Phase::DOWNLOAD),
                      sar_compose::NetworkError);
    REQUIRE_FALSE(fs::exists(dest));
    REQUIRE_FALSE(fs::exists(tmp.path() / "product.zip.part"));
}

TEST_CASE("asf_source_reuses_cached_archive") {
    core::ScopedTempDir tmp(fs::temp_directory_path(), "download");
    core::write_text(tmp.path() / "S1A_scene.zip", "cached");

    sar_compose::config::Config cfg;
    catalog::HttpClient http(10);
    pipeline::AsfProductSource source(cfg, http, tmp.path());

    sar_compose::DiscoveredScene scene;
    scene.pointer.id = "S1A_scene";
    scene.assets["url"] = "https://datapool.example.test/S1A_scene.zip";
    scene.assets["file_name"] = "S1A_scene.zip";

    std::ostringstream log;
    core::EventEmitter events("run-dl", log);
    const fs::path zip = source.fetch(scene, sar_compose::AreaOfInterest(0.0, 0.0, 1.0, 1.0), events);

    REQUIRE(zip == tmp.path() / "S1A_scene.zip");
    REQUIRE(log.str().find("\"skipped\"") != std::string::npos);
    REQUIRE_FALSE(source.last_match().has_value());
}

TEST_CASE("asf_source_requires_download_url") {
    sar_compose::config::Config cfg;
    catalog::HttpClient http(10);
    pipeline::AsfProductSource source(cfg, http, fs::temp_directory_path());

    sar_compose::DiscoveredScene scene;
    scene.pointer.id = "S1A_scene";
    std::ostringstream log;
    core::EventEmitter events("run-dl", log);
    REQUIRE_THROWS_AS(source.fetch(scene, sar_compose::AreaOfInterest(0.0, 0.0, 1.0, 1.0), events),
                      sar_compose::ProductError);
}
