#include "sar_compose/catalog/cdse_auth.hpp"
#include "sar_compose/catalog/http_client.hpp"
#include "sar_compose/catalog/product_catalog.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

namespace catalog = sar_compose::catalog;
namespace core = sar_compose::core;

TEST_CASE("odata_filter_restricts_to_dual_pol_safe_products") {
    catalog::ProductQuery q;
    q.area_literal = "geography'SRID=4326;POLYGON((0 0,1 0,1 1,0 1,0 0))'";
    q.content_start_min = core::parse_iso_utc("2024-01-05T16:30:07Z");
    q.content_start_max = core::parse_iso_utc("2024-01-05T16:30:17Z");

    const std::string f = catalog::build_odata_filter(q);
    REQUIRE(f ==
            "Collection/Name eq 'SENTINEL-1' and contains(Name,'IW_GRDH') "
            "and (endswith(Name,'.SAFE') or endswith(Name,'.safe')) "
            "and not contains(Name,'_COG') "
            "and OData.CSC.Intersects(area=geography'SRID=4326;POLYGON((0 0,1 0,1 1,0 1,0 0))') "
            "and ContentDate/Start ge 2024-01-05T16:30:07.000Z "
            "and ContentDate/Start le 2024-01-05T16:30:17.000Z");
}

TEST_CASE("odata_name_filter_escapes_quotes") {
    REQUIRE(catalog::build_odata_name_filter("a'b.SAFE") ==
            "Collection/Name eq 'SENTINEL-1' and Name eq 'a''b.SAFE'");
}

TEST_CASE("odata_url_orders_by_publication_date") {
    const std::string url = catalog::build_odata_url("https://example.test/odata/v1/", "Name eq 'x'", 10);

    REQUIRE(core::starts_with(url, "https://example.test/odata/v1/Products?"));
    REQUIRE(url.find("%24filter=") != std::string::npos);
    REQUIRE(url.find("%24orderby=PublicationDate%20desc") != std::string::npos);
    REQUIRE(url.find("%24top=10") != std::string::npos);

    const std::string bare = catalog::build_odata_url("https://example.test/odata/v1", "x", 0);
    REQUIRE(bare.find("top") == std::string::npos);
}

TEST_CASE("parse_odata_products_reads_value_array") {
    const std::string body = R"({
        "@odata.context": "$metadata#Products",
        "value": [
            {"Id": "a1", "Name": "S1A_ONE.SAFE", "PublicationDate": "2024-01-06T00:00:00Z",
             "ContentDate": {"Start": "2024-01-05T16:30:12.000Z", "End": "2024-01-05T16:30:37.000Z"}},
            {"Id": "b2", "Name": "S1A_TWO.SAFE"}
        ]
    })";

    auto products = catalog::parse_odata_products(body);
    REQUIRE(products.size() == 2);
    REQUIRE(products[0].id == "a1");
    REQUIRE(products[0].name == "S1A_ONE.SAFE");
    REQUIRE(products[0].content_start == "2024-01-05T16:30:12.000Z");
    REQUIRE(products[1].publication_date.empty());
}

TEST_CASE("parse_odata_products_handles_empty_and_malformed_bodies") {
    REQUIRE(catalog::parse_odata_products(R"({"value": []})").empty());
    REQUIRE(catalog::parse_odata_products(R"({})").empty());
    REQUIRE_THROWS_AS(catalog::parse_odata_products("<html>"), sar_compose::ParseError);
    REQUIRE_THROWS_AS(catalog::parse_odata_products(R"({"value": [{"Name": "x"}]})"),
                      sar_compose::ParseError);
}

TEST_CASE("access_token_and_download_url") {
    REQUIRE(catalog::parse_access_token(R"({"access_token": "tok", "expires_in": 600})") == "tok");
    REQUIRE_THROWS_AS(catalog::parse_access_token(R"({"error": "invalid_grant"})"),
                      sar_compose::NetworkError);
    REQUIRE(catalog::cdse_product_download_url("https://zipper.test/odata/v1", "abc") ==
            "https://zipper.test/odata/v1/Products(abc)/$value");
}
