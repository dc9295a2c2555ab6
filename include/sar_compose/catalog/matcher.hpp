#pragma once

#include "sar_compose/catalog/product_catalog.hpp"
#include "sar_compose/core/types.hpp"

#include <string>
#include <vector>

namespace sar_compose::catalog {

// Window is [start - tolerance, start + tolerance] around the sensing start
// (catalog B indexes acquisition start, not the midpoint).
ProductQuery build_product_query(const AreaOfInterest& aoi, const ScenePointer& pointer,
                                 int top_k = 10, int tolerance_s = 5);

// Newest publication date first; unparseable dates sort last and ties keep
// catalog order.
void sort_by_publication(std::vector<ProductCandidate>& candidates);

// After sort_by_publication, the first candidate whose name starts with
// `prefix`, else the newest candidate (policy FALLBACK). Throws NoMatchError
// when `candidates` is empty.
MatchResult select_candidate(const std::vector<ProductCandidate>& candidates,
                             const std::string& prefix);

// One catalog query, then select_candidate.
MatchResult match_product(ProductCatalog& catalog, const AreaOfInterest& aoi,
                          const ScenePointer& pointer, int top_k = 10,
                          int tolerance_s = 5);

} // namespace sar_compose::catalog
