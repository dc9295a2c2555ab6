#pragma once

#include "sar_compose/catalog/http_client.hpp"
#include "sar_compose/core/types.hpp"

#include <string>
#include <vector>

namespace sar_compose::catalog {

// Scene search catalog (catalog A).
class Discovery {
public:
    virtual ~Discovery() = default;

    virtual std::string name() const = 0;

    // Latest scene intersecting `aoi` within `window`. Throws NoResultsError.
    virtual DiscoveredScene discover(const AreaOfInterest& aoi, const TimeInterval& window) = 0;
};

// Newest first by acquisition time; items without a parseable time sort last.
void sort_newest_first(std::vector<DiscoveredScene>& scenes);

// STAC item-search request body.
std::string build_stac_search_body(const std::string& collection, const AreaOfInterest& aoi,
                                   const TimeInterval& window, int limit);

// Features of a STAC ItemCollection, sorted newest first. The newest item's id
// must carry sensing times (ParseError otherwise); older items whose id does not
// parse keep only `pointer.id`.
std::vector<DiscoveredScene> parse_stac_items(const std::string& body);

class StacDiscovery : public Discovery {
public:
    StacDiscovery(std::string stac_url, std::string collection, int limit, const HttpClient& http)
        : stac_url_(std::move(stac_url)), collection_(std::move(collection)),
          limit_(limit), http_(http) {}

    std::string name() const override { return "stac"; }
    DiscoveredScene discover(const AreaOfInterest& aoi, const TimeInterval& window) override;

private:
    std::string stac_url_;
    std::string collection_;
    int limit_;
    const HttpClient& http_;
};

std::string build_asf_search_url(const std::string& search_url, const AreaOfInterest& aoi,
                                 const TimeInterval& window);

// ASF search GeoJSON; "sceneName" becomes the id and "url" the asset. Sorted
// newest first by "startTime", ids resolved as in parse_stac_items.
std::vector<DiscoveredScene> parse_asf_results(const std::string& body);

class AsfDiscovery : public Discovery {
public:
    AsfDiscovery(std::string search_url, const HttpClient& http)
        : search_url_(std::move(search_url)), http_(http) {}

    std::string name() const override { return "asf"; }
    DiscoveredScene discover(const AreaOfInterest& aoi, const TimeInterval& window) override;

private:
    std::string search_url_;
    const HttpClient& http_;
};

} // namespace sar_compose::catalog
