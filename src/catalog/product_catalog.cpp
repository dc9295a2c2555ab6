#include "sar_compose/catalog/product_catalog.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"

#include <nlohmann/json.hpp>

namespace sar_compose::catalog {

namespace {

constexpr const char* kTimeFormat = "%Y-%m-%dT%H:%M:%S.000Z";

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string quote_literal(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace

std::string build_odata_filter(const ProductQuery& q) {
    const std::string t_start = core::format_utc(q.content_start_min, kTimeFormat);
    const std::string t_end = core::format_utc(q.content_start_max, kTimeFormat);

    return "Collection/Name eq 'SENTINEL-1' "
           "and contains(Name,'IW_GRDH') "
           "and (endswith(Name,'.SAFE') or endswith(Name,'.safe')) "
           "and not contains(Name,'_COG') "
           "and OData.CSC.Intersects(area=" + q.area_literal + ") "
           "and ContentDate/Start ge " + t_start +
           " and ContentDate/Start le " + t_end;
}

std::string build_odata_name_filter(const std::string& name) {
    return "Collection/Name eq 'SENTINEL-1' and Name eq " + quote_literal(name);
}

std::string build_odata_url(const std::string& odata_url, const std::string& filter, int top) {
    std::string base = odata_url;
    while (!base.empty() && base.back() == '/') base.pop_back();

    QueryParams params{{"$filter", filter}};
    if (top > 0) {
        params.emplace_back("$select", "Id,Name,ContentDate,PublicationDate");
        params.emplace_back("$orderby", "PublicationDate desc");
        params.emplace_back("$top", std::to_string(top));
    }
    return base + "/Products?" + build_query(params);
}

std::vector<ProductCandidate> parse_odata_products(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("OData response is not JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ParseError("OData response is not an object");
    }

    std::vector<ProductCandidate> out;
    auto it = j.find("value");
    if (it == j.end()) return out;
    if (!it->is_array()) {
        throw ParseError("OData 'value' is not an array");
    }

    for (const auto& v : *it) {
        ProductCandidate c;
        c.id = string_field(v, "Id");
        c.name = string_field(v, "Name");
        c.publication_date = string_field(v, "PublicationDate");
        auto cd = v.find("ContentDate");
        if (cd != v.end() && cd->is_object()) {
            c.content_start = string_field(*cd, "Start");
        }
        if (c.id.empty() || c.name.empty()) {
            throw ParseError("OData product without Id/Name");
        }
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<ProductCandidate> ODataProductCatalog::query(const ProductQuery& q) {
    const std::string url = build_odata_url(odata_url_, build_odata_filter(q), q.top);
    return parse_odata_products(http_.get(url).body);
}

std::optional<ProductCandidate> ODataProductCatalog::find_by_name(const std::string& name) {
    const std::string url = build_odata_url(odata_url_, build_odata_name_filter(name), 0);
    auto products = parse_odata_products(http_.get(url).body);
    if (products.empty()) return std::nullopt;
    return products.front();
}

} // namespace sar_compose::catalog
