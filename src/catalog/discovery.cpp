#include "sar_compose/catalog/discovery.hpp"
#include "sar_compose/catalog/scene_pointer.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/geo/geometry.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace sar_compose::catalog {

namespace {

using json = nlohmann::json;

json parse_body(const std::string& body, const char* what) {
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        throw ParseError(std::string(what) + " response is not JSON: " + e.what());
    }
}

std::string string_at(const json& obj, const char* key) {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool try_parse_time(const std::string& text, UtcTime& out) {
    if (text.empty()) return false;
    try {
        out = core::parse_iso_utc(text);
        return true;
    } catch (const ParseError&) {
        return false;
    }
}

std::string window_param(UtcTime t) {
    return core::format_utc(t, "%Y-%m-%dT%H:%M:%SZ");
}

// Items carry only their raw id until sorted. The selected item must parse;
// the others keep the raw id when they do not.
void resolve_pointers(std::vector<DiscoveredScene>& scenes) {
    sort_newest_first(scenes);
    for (size_t i = 0; i < scenes.size(); ++i) {
        const std::string id = scenes[i].pointer.id;
        if (i == 0) {
            scenes[i].pointer = parse_scene_pointer(id);
            continue;
        }
        try {
            scenes[i].pointer = parse_scene_pointer(id);
        } catch (const ParseError&) {
            scenes[i].pointer = ScenePointer{};
            scenes[i].pointer.id = id;
        }
    }
}

} // namespace

void sort_newest_first(std::vector<DiscoveredScene>& scenes) {
    std::stable_sort(scenes.begin(), scenes.end(),
                     [](const DiscoveredScene& a, const DiscoveredScene& b) {
                         UtcTime ta;
                         UtcTime tb;
                         const bool ha = try_parse_time(a.acquired_at, ta);
                         const bool hb = try_parse_time(b.acquired_at, tb);
                         if (ha != hb) return ha;
                         if (!ha) return false;
                         return ta > tb;
                     });
}

std::string build_stac_search_body(const std::string& collection, const AreaOfInterest& aoi,
                                   const TimeInterval& window, int limit) {
    json body = {
        {"collections", json::array({collection})},
        {"bbox", json::array({aoi.min_lon(), aoi.min_lat(), aoi.max_lon(), aoi.max_lat()})},
        {"datetime", window_param(window.start) + "/" + window_param(window.end)},
        {"limit", limit},
    };
    return body.dump();
}

std::vector<DiscoveredScene> parse_stac_items(const std::string& body) {
    const json j = parse_body(body, "STAC");
    std::vector<DiscoveredScene> out;

    auto features = j.find("features");
    if (features == j.end() || !features->is_array()) return out;

    for (const auto& f : *features) {
        const std::string id = string_at(f, "id");
        if (id.empty()) {
            throw ParseError("STAC item without id");
        }

        DiscoveredScene scene;
        scene.pointer.id = id;
        if (f.contains("properties")) {
            scene.acquired_at = string_at(f["properties"], "datetime");
        }
        auto assets = f.find("assets");
        if (assets != f.end() && assets->is_object()) {
            for (auto it = assets->begin(); it != assets->end(); ++it) {
                const std::string href = string_at(it.value(), "href");
                if (!href.empty()) scene.assets[core::to_lower(it.key())] = href;
            }
        }
        out.push_back(std::move(scene));
    }

    resolve_pointers(out);
    return out;
}

DiscoveredScene StacDiscovery::discover(const AreaOfInterest& aoi, const TimeInterval& window) {
    std::string url = stac_url_;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += "/search";

    auto scenes = parse_stac_items(
        http_.post_json(url, build_stac_search_body(collection_, aoi, window, limit_)).body);
    if (scenes.empty()) {
        throw NoResultsError("no STAC items in '" + collection_ + "' for the AOI/date range");
    }
    return scenes.front();
}

std::string build_asf_search_url(const std::string& search_url, const AreaOfInterest& aoi,
                                 const TimeInterval& window) {
    const QueryParams params{
        {"platform", "Sentinel-1"},
        {"processingLevel", "GRD_HD"},
        {"beamMode", "IW"},
        {"polarization", "VV+VH"},
        {"start", window_param(window.start)},
        {"end", window_param(window.end)},
        {"intersectsWith", geo::aoi_to_wkt(aoi)},
        {"output", "geojson"},
    };
    return search_url + "?" + build_query(params);
}

std::vector<DiscoveredScene> parse_asf_results(const std::string& body) {
    const json j = parse_body(body, "ASF search");
    std::vector<DiscoveredScene> out;

    auto features = j.find("features");
    if (features == j.end() || !features->is_array()) return out;

    for (const auto& f : *features) {
        const json props = f.value("properties", json::object());
        const std::string scene_name = string_at(props, "sceneName");
        if (scene_name.empty()) {
            throw ParseError("ASF result without sceneName");
        }

        DiscoveredScene scene;
        scene.pointer.id = scene_name;
        scene.acquired_at = string_at(props, "startTime");
        const std::string url = string_at(props, "url");
        if (!url.empty()) scene.assets["url"] = url;
        const std::string file_name = string_at(props, "fileName");
        if (!file_name.empty()) scene.assets["file_name"] = file_name;
        out.push_back(std::move(scene));
    }

    resolve_pointers(out);
    return out;
}

DiscoveredScene AsfDiscovery::discover(const AreaOfInterest& aoi, const TimeInterval& window) {
    auto scenes = parse_asf_results(http_.get(build_asf_search_url(search_url_, aoi, window)).body);
    if (scenes.empty()) {
        throw NoResultsError("no ASF scenes for the AOI/date range");
    }
    return scenes.front();
}

} // namespace sar_compose::catalog
