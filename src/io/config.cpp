#include "sar_compose/config/configuration.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sar_compose::config {

// Reads `key`, or the environment variable named by `key_env`.
static void read_secret(const YAML::Node& n, const std::string& key, std::string& out) {
    if (n[key]) {
        out = n[key].as<std::string>();
        return;
    }
    const std::string env_key = key + "_env";
    if (n[env_key]) {
        const std::string var = n[env_key].as<std::string>();
        const char* value = std::getenv(var.c_str());
        if (!value) {
            throw ConfigError("environment variable '" + var + "' named by credentials." +
                              env_key + " is not set");
        }
        out = value;
    }
}

AreaOfInterest AoiConfig::to_area() const {
    return AreaOfInterest(bbox[0], bbox[1], bbox[2], bbox[3]);
}

InputScale CompositeConfig::scale() const {
    return input_scale == "db" ? InputScale::DB : InputScale::LINEAR;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["pipeline"]) {
            auto p = node["pipeline"];
            if (p["variant"]) cfg.pipeline.variant = p["variant"].as<std::string>();
            if (p["label"]) cfg.pipeline.label = p["label"].as<std::string>();
        }

        if (node["aoi"]) {
            auto a = node["aoi"];
            auto b = a["bbox"];
            if (b) {
                if (!b.IsSequence() || b.size() != 4) {
                    throw ConfigError("aoi.bbox must be [min_lon, min_lat, max_lon, max_lat]");
                }
                for (size_t i = 0; i < 4; ++i) {
                    cfg.aoi.bbox[i] = b[i].as<double>();
                }
            }
        }

        if (node["time"]) {
            auto t = node["time"];
            if (t["start"]) cfg.time.start = t["start"].as<std::string>();
            if (t["end"]) cfg.time.end = t["end"].as<std::string>();
        }

        if (node["catalog"]) {
            auto c = node["catalog"];
            if (c["stac_url"]) cfg.catalog.stac_url = c["stac_url"].as<std::string>();
            if (c["stac_collection"]) cfg.catalog.stac_collection = c["stac_collection"].as<std::string>();
            if (c["stac_limit"]) cfg.catalog.stac_limit = c["stac_limit"].as<int>();
            if (c["odata_url"]) cfg.catalog.odata_url = c["odata_url"].as<std::string>();
            if (c["download_url"]) cfg.catalog.download_url = c["download_url"].as<std::string>();
            if (c["identity_url"]) cfg.catalog.identity_url = c["identity_url"].as<std::string>();
            if (c["asf_search_url"]) cfg.catalog.asf_search_url = c["asf_search_url"].as<std::string>();
            if (c["top_k"]) cfg.catalog.top_k = c["top_k"].as<int>();
            if (c["time_tolerance_s"]) cfg.catalog.time_tolerance_s = c["time_tolerance_s"].as<int>();
            if (c["timeout_s"]) cfg.catalog.timeout_s = c["timeout_s"].as<int>();
            if (c["download_timeout_s"]) cfg.catalog.download_timeout_s = c["download_timeout_s"].as<int>();
        }

        if (node["credentials"]) {
            auto c = node["credentials"];
            read_secret(c, "cdse_username", cfg.credentials.cdse_username);
            read_secret(c, "cdse_password", cfg.credentials.cdse_password);
            read_secret(c, "earthdata_username", cfg.credentials.earthdata_username);
            read_secret(c, "earthdata_password", cfg.credentials.earthdata_password);
            read_secret(c, "s3_access_key", cfg.credentials.s3_access_key);
            read_secret(c, "s3_secret_key", cfg.credentials.s3_secret_key);
            if (c["s3_endpoint"]) cfg.credentials.s3_endpoint = c["s3_endpoint"].as<std::string>();
        }

        if (node["download"]) {
            auto d = node["download"];
            if (d["cache_dir"]) cfg.download.cache_dir = d["cache_dir"].as<std::string>();
            if (d["skip_existing"]) cfg.download.skip_existing = d["skip_existing"].as<bool>();
        }

        if (node["archive"]) {
            auto a = node["archive"];
            if (a["extract"]) cfg.archive.extract = a["extract"].as<bool>();
            if (a["keep_extracted"]) cfg.archive.keep_extracted = a["keep_extracted"].as<bool>();
        }

        if (node["geocode"]) {
            auto g = node["geocode"];
            if (g["command"]) cfg.geocode.command = g["command"].as<std::string>();
            if (g["t_srs"]) cfg.geocode.t_srs = g["t_srs"].as<std::string>();
            if (g["spacing"]) cfg.geocode.spacing = g["spacing"].as<double>();
            if (g["scaling"]) cfg.geocode.scaling = g["scaling"].as<std::string>();
            if (g["dem"]) cfg.geocode.dem = g["dem"].as<std::string>();
        }

        if (node["clip"]) {
            auto c = node["clip"];
            if (c["warp_threads"]) cfg.clip.warp_threads = c["warp_threads"].as<int>();
            if (c["mask_outside_polygon"]) cfg.clip.mask_outside_polygon = c["mask_outside_polygon"].as<bool>();
        }

        if (node["composite"]) {
            auto c = node["composite"];
            if (c["input_scale"]) cfg.composite.input_scale = core::to_lower(c["input_scale"].as<std::string>());
            if (c["p_low"]) cfg.composite.p_low = c["p_low"].as<float>();
            if (c["p_high"]) cfg.composite.p_high = c["p_high"].as<float>();
            if (c["write_preview"]) cfg.composite.write_preview = c["write_preview"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["variant"] = pipeline.variant;
    if (!pipeline.label.empty()) node["pipeline"]["label"] = pipeline.label;

    for (double v : aoi.bbox) node["aoi"]["bbox"].push_back(v);

    node["time"]["start"] = time.start;
    node["time"]["end"] = time.end;

    node["catalog"]["stac_url"] = catalog.stac_url;
    node["catalog"]["stac_collection"] = catalog.stac_collection;
    node["catalog"]["stac_limit"] = catalog.stac_limit;
    node["catalog"]["odata_url"] = catalog.odata_url;
    node["catalog"]["download_url"] = catalog.download_url;
    node["catalog"]["identity_url"] = catalog.identity_url;
    node["catalog"]["asf_search_url"] = catalog.asf_search_url;
    node["catalog"]["top_k"] = catalog.top_k;
    node["catalog"]["time_tolerance_s"] = catalog.time_tolerance_s;
    node["catalog"]["timeout_s"] = catalog.timeout_s;
    node["catalog"]["download_timeout_s"] = catalog.download_timeout_s;

    // Secrets are never written back
    node["credentials"]["s3_endpoint"] = credentials.s3_endpoint;

    node["download"]["cache_dir"] = download.cache_dir;
    node["download"]["skip_existing"] = download.skip_existing;

    node["archive"]["extract"] = archive.extract;
    node["archive"]["keep_extracted"] = archive.keep_extracted;

    node["geocode"]["command"] = geocode.command;
    node["geocode"]["t_srs"] = geocode.t_srs;
    node["geocode"]["spacing"] = geocode.spacing;
    node["geocode"]["scaling"] = geocode.scaling;
    node["geocode"]["dem"] = geocode.dem;

    node["clip"]["warp_threads"] = clip.warp_threads;
    node["clip"]["mask_outside_polygon"] = clip.mask_outside_polygon;

    node["composite"]["input_scale"] = composite.input_scale;
    node["composite"]["p_low"] = composite.p_low;
    node["composite"]["p_high"] = composite.p_high;
    node["composite"]["write_preview"] = composite.write_preview;

    return node;
}

void Config::validate() const {
    if (pipeline.variant != "cdse_gcp" && pipeline.variant != "cdse_geocode" &&
        pipeline.variant != "asf_geocode" && pipeline.variant != "cog_s3") {
        throw ValidationError("pipeline.variant must be one of cdse_gcp, cdse_geocode, asf_geocode, cog_s3");
    }

    // Throws ValidationError on inverted or out-of-range bounds
    (void)aoi.to_area();

    if (time.start.empty() || time.end.empty()) {
        throw ValidationError("time.start and time.end are required");
    }
    UtcTime start;
    UtcTime end;
    try {
        start = core::parse_iso_utc(time.start);
        end = core::parse_iso_utc(time.end);
    } catch (const ParseError& e) {
        throw ValidationError(std::string("time.start/time.end: ") + e.what());
    }
    if (end < start) {
        throw ValidationError("time.end must not precede time.start");
    }

    if (catalog.top_k < 1 || catalog.top_k > 1000) {
        throw ValidationError("catalog.top_k must be in [1,1000]");
    }
    if (catalog.time_tolerance_s < 0) {
        throw ValidationError("catalog.time_tolerance_s must be >= 0");
    }
    if (catalog.stac_limit < 1) {
        throw ValidationError("catalog.stac_limit must be >= 1");
    }
    if (catalog.timeout_s < 1) {
        throw ValidationError("catalog.timeout_s must be >= 1");
    }
    if (catalog.download_timeout_s < 0) {
        throw ValidationError("catalog.download_timeout_s must be >= 0");
    }

    const bool geocoded = pipeline.variant == "cdse_geocode" || pipeline.variant == "asf_geocode";
    if (geocoded && geocode.command.empty()) {
        throw ValidationError("geocode.command is required for variant " + pipeline.variant);
    }
    if (geocoded && geocode.spacing <= 0.0) {
        throw ValidationError("geocode.spacing must be > 0");
    }
    if (geocoded && core::to_lower(geocode.scaling) == "db" && composite.input_scale != "db") {
        throw ValidationError("geocode.scaling is 'dB' but composite.input_scale is '" +
                              composite.input_scale +
                              "'; set composite.input_scale: db for variant " + pipeline.variant);
    }
    if ((pipeline.variant == "cdse_gcp" || pipeline.variant == "cdse_geocode") &&
        (credentials.cdse_username.empty() || credentials.cdse_password.empty())) {
        throw ValidationError("credentials.cdse_username/cdse_password are required for variant " +
                              pipeline.variant);
    }
    if (pipeline.variant == "asf_geocode" &&
        (credentials.earthdata_username.empty() || credentials.earthdata_password.empty())) {
        throw ValidationError("credentials.earthdata_username/earthdata_password are required for variant asf_geocode");
    }
    if (pipeline.variant == "cog_s3" &&
        (credentials.s3_access_key.empty() || credentials.s3_secret_key.empty())) {
        throw ValidationError("credentials.s3_access_key/s3_secret_key are required for variant cog_s3");
    }

    if (clip.warp_threads < 0) {
        throw ValidationError("clip.warp_threads must be >= 0");
    }

    if (composite.input_scale != "linear" && composite.input_scale != "db") {
        throw ValidationError("composite.input_scale must be 'linear' or 'db'");
    }
    if (composite.p_low < 0.0f || composite.p_high > 100.0f || composite.p_low >= composite.p_high) {
        throw ValidationError("composite.p_low/p_high must satisfy 0 <= p_low < p_high <= 100");
    }
}

} // namespace sar_compose::config
