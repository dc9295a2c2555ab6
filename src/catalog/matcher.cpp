#include "sar_compose/catalog/matcher.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/geo/geometry.hpp"

#include <algorithm>
#include <chrono>

namespace sar_compose::catalog {

namespace {

bool try_parse_publication(const std::string& text, UtcTime& out) {
    if (text.empty()) return false;
    try {
        out = core::parse_iso_utc(text);
        return true;
    } catch (const ParseError&) {
        return false;
    }
}

} // namespace

void sort_by_publication(std::vector<ProductCandidate>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const ProductCandidate& a, const ProductCandidate& b) {
                         UtcTime ta;
                         UtcTime tb;
                         const bool ha = try_parse_publication(a.publication_date, ta);
                         const bool hb = try_parse_publication(b.publication_date, tb);
                         if (ha != hb) return ha;
                         if (!ha) return false;
                         return ta > tb;
                     });
}

ProductQuery build_product_query(const AreaOfInterest& aoi, const ScenePointer& pointer,
                                 int top_k, int tolerance_s) {
    ProductQuery q;
    q.area_literal = geo::aoi_as_catalog_polygon_literal(aoi);
    q.content_start_min = pointer.sensing.start - std::chrono::seconds(tolerance_s);
    q.content_start_max = pointer.sensing.start + std::chrono::seconds(tolerance_s);
    q.top = top_k;
    return q;
}

MatchResult select_candidate(const std::vector<ProductCandidate>& candidates,
                             const std::string& prefix) {
    if (candidates.empty()) {
        throw NoMatchError("catalog returned no products for '" + prefix + "'");
    }

    std::vector<ProductCandidate> ordered = candidates;
    sort_by_publication(ordered);

    MatchResult result;
    result.candidates_seen = static_cast<int>(ordered.size());
    for (const auto& c : ordered) {
        if (core::starts_with(c.name, prefix)) {
            result.product = c;
            result.policy = MatchPolicy::PREFIX;
            return result;
        }
    }

    result.product = ordered.front();
    result.policy = MatchPolicy::FALLBACK;
    return result;
}

MatchResult match_product(ProductCatalog& catalog, const AreaOfInterest& aoi,
                          const ScenePointer& pointer, int top_k, int tolerance_s) {
    const ProductQuery q = build_product_query(aoi, pointer, top_k, tolerance_s);
    const auto candidates = catalog.query(q);
    if (candidates.empty()) {
        throw NoMatchError("no products for scene '" + pointer.id + "' within +/-" +
                           std::to_string(tolerance_s) + " s of " +
                           core::format_iso_ms(pointer.sensing.start));
    }
    return select_candidate(candidates, pointer.prefix);
}

} // namespace sar_compose::catalog
