#include "sar_compose/catalog/matcher.hpp"
#include "sar_compose/catalog/product_catalog.hpp"
#include "sar_compose/catalog/scene_pointer.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using sar_compose::AreaOfInterest;
using sar_compose::MatchPolicy;
using sar_compose::ProductCandidate;
namespace catalog = sar_compose::catalog;
namespace core = sar_compose::core;

namespace {

class FakeCatalog : public catalog::ProductCatalog {
public:
    explicit FakeCatalog(std::vector<ProductCandidate> products) : products_(std::move(products)) {}

    std::vector<ProductCandidate> query(const catalog::ProductQuery& q) override {
        last_query = q;
        ++queries;
        return products_;
    }

    std::optional<ProductCandidate> find_by_name(const std::string& name) override {
        for (const auto& p : products_) {
            if (p.name == name) return p;
        }
        return std::nullopt;
    }

    catalog::ProductQuery last_query;
    int queries = 0;

private:
    std::vector<ProductCandidate> products_;
};

const char* kSceneId = "S1A_IW_GRDH_1SDV_20240105T163012_20240105T163037_051978_064775_1234_COG";

} // namespace

TEST_CASE("select_candidate_prefers_prefix_match_over_newer_products") {
    std::vector<ProductCandidate> cands = {
        {"id-new", "S1B_IW_GRDH_1SDV_20240105T163013_20240105T163038_OTHER.SAFE", "2024-02-01T00:00:00Z", ""},
        {"id-match", "S1A_IW_GRDH_1SDV_20240105T163012_20240105T163037_051978_064775_9F0E.SAFE",
         "2024-01-05T18:00:00Z", ""},
    };

    auto r = catalog::select_candidate(
        cands, "S1A_IW_GRDH_1SDV_20240105T163012_20240105T163037_051978_064775");
    REQUIRE(r.product.id == "id-match");
    REQUIRE(r.policy == MatchPolicy::PREFIX);
    REQUIRE(r.candidates_seen == 2);
}

TEST_CASE("select_candidate_falls_back_to_first_candidate") {
    std::vector<ProductCandidate> cands = {
        {"id-1", "S1A_A.SAFE", "", ""},
        {"id-2", "S1A_B.SAFE", "", ""},
    };

    auto r = catalog::select_candidate(cands, "S1B_NOTHING");
    REQUIRE(r.product.id == "id-1");
    REQUIRE(r.policy == MatchPolicy::FALLBACK);
}

TEST_CASE("select_candidate_prefers_newest_publication_among_prefix_matches") {
    const std::string prefix = "S1A_IW_GRDH_1SDV_20250101T000000";
    std::vector<ProductCandidate> cands = {
        {"id-0001", prefix + "_20250101T000025_057000_070000_0001.SAFE", "2025-01-01T06:00:00.000Z", ""},
        {"id-0002", prefix + "_20250101T000025_057000_070000_0002.SAFE", "2025-01-02T06:00:00.000Z", ""},
    };

    auto r = catalog::select_candidate(cands, prefix);
    REQUIRE(r.product.id == "id-0002");
    REQUIRE(r.policy == MatchPolicy::PREFIX);

    std::reverse(cands.begin(), cands.end());
    REQUIRE(catalog::select_candidate(cands, prefix).product.id == "id-0002");
}

TEST_CASE("select_candidate_fallback_is_newest_publication") {
    std::vector<ProductCandidate> cands = {
        {"id-undated", "S1A_X.SAFE", "not-a-date", ""},
        {"id-old", "S1A_Y.SAFE", "2024-01-01T00:00:00Z", ""},
        {"id-new", "S1A_Z.SAFE", "2024-03-01T00:00:00Z", ""},
    };

    auto r = catalog::select_candidate(cands, "S1B_NOTHING");
    REQUIRE(r.product.id == "id-new");
    REQUIRE(r.policy == MatchPolicy::FALLBACK);

    catalog::sort_by_publication(cands);
    REQUIRE(cands[0].id == "id-new");
    REQUIRE(cands[1].id == "id-old");
    REQUIRE(cands[2].id == "id-undated");
}

TEST_CASE("select_candidate_throws_on_empty_list") {
    REQUIRE_THROWS_AS(catalog::select_candidate({}, "S1A"), sar_compose::NoMatchError);
}

TEST_CASE("build_product_query_brackets_sensing_start") {
    auto ptr = catalog::parse_scene_pointer(kSceneId);
    auto q = catalog::build_product_query(AreaOfInterest(21.65, 40.67, 21.75, 40.76), ptr, 10, 5);

    REQUIRE(q.top == 10);
    REQUIRE(core::format_iso_ms(q.content_start_min) == "2024-01-05T16:30:07.000Z");
    REQUIRE(core::format_iso_ms(q.content_start_max) == "2024-01-05T16:30:17.000Z");
    REQUIRE(q.area_literal.find("SRID=4326;POLYGON((21.65 40.67,") != std::string::npos);
}

TEST_CASE("match_product_resolves_cog_scene_to_safe_product") {
    FakeCatalog fake({
        {"id-c", "S1A_IW_GRDH_1SDV_20240105T163012_20240105T163037_051978_064775_AAAA.SAFE",
         "2024-01-06T10:00:00Z", "2024-01-05T16:30:12.000Z"},
        {"id-a", "S1A_IW_GRDH_1SDV_20240105T163012_20240105T163037_051978_064775_1234.SAFE",
         "2024-01-05T20:00:00Z", "2024-01-05T16:30:12.000Z"},
        {"id-b", "S1A_IW_GRDH_1SDV_20240105T163037_20240105T163102_051978_064775_5678.SAFE",
         "2024-01-05T19:00:00Z", "2024-01-05T16:30:37.000Z"},
    });

    auto ptr = catalog::parse_scene_pointer(kSceneId);
    auto r = catalog::match_product(fake, AreaOfInterest(21.65, 40.67, 21.75, 40.76), ptr, 10, 5);

    // Newest publication that carries the prefix
    REQUIRE(r.product.id == "id-c");
    REQUIRE(r.policy == MatchPolicy::PREFIX);
    REQUIRE(r.candidates_seen == 3);
    REQUIRE(fake.queries == 1);
    REQUIRE(fake.last_query.top == 10);
}

TEST_CASE("match_product_reports_no_match_when_catalog_is_empty") {
    FakeCatalog fake({});
    auto ptr = catalog::parse_scene_pointer(kSceneId);
    REQUIRE_THROWS_AS(
        catalog::match_product(fake, AreaOfInterest(21.65, 40.67, 21.75, 40.76), ptr, 10, 5),
        sar_compose::NoMatchError);
}

TEST_CASE("no_match_error_is_a_no_results_error") {
    FakeCatalog fake({});
    auto ptr = catalog::parse_scene_pointer(kSceneId);
    REQUIRE_THROWS_AS(
        catalog::match_product(fake, AreaOfInterest(21.65, 40.67, 21.75, 40.76), ptr, 3, 0),
        sar_compose::NoResultsError);
}
