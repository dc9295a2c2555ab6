#pragma once

#include "sar_compose/catalog/http_client.hpp"
#include "sar_compose/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sar_compose::catalog {

// Combined spatial + sensing-time + name filter against the authoritative catalog.
struct ProductQuery {
    std::string area_literal;   // geography'SRID=4326;POLYGON((...))'
    UtcTime content_start_min;  // inclusive
    UtcTime content_start_max;  // inclusive
    int top = 10;
};

// Authoritative product catalog (catalog B).
class ProductCatalog {
public:
    virtual ~ProductCatalog() = default;

    // Candidates ordered by publication date, newest first.
    virtual std::vector<ProductCandidate> query(const ProductQuery& q) = 0;

    virtual std::optional<ProductCandidate> find_by_name(const std::string& name) = 0;
};

// Filter for dual-pol IW GRD-HD SAFE products, excluding cloud-optimized variants.
std::string build_odata_filter(const ProductQuery& q);

std::string build_odata_name_filter(const std::string& name);

// Full Products request URL for `filter`. `top` <= 0 omits $top/$orderby.
std::string build_odata_url(const std::string& odata_url, const std::string& filter, int top);

// Parses the "value" array of an OData Products response. Throws ParseError.
std::vector<ProductCandidate> parse_odata_products(const std::string& body);

class ODataProductCatalog : public ProductCatalog {
public:
    ODataProductCatalog(std::string odata_url, const HttpClient& http)
        : odata_url_(std::move(odata_url)), http_(http) {}

    std::vector<ProductCandidate> query(const ProductQuery& q) override;
    std::optional<ProductCandidate> find_by_name(const std::string& name) override;

private:
    std::string odata_url_;
    const HttpClient& http_;
};

} // namespace sar_compose::catalog
