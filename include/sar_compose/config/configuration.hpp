#pragma once

#include "sar_compose/core/types.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace sar_compose::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  std::string variant = "cdse_gcp"; // cdse_gcp | cdse_geocode | asf_geocode | cog_s3
  std::string label;                // appended to the run id when non-empty
};

struct AoiConfig {
  std::array<double, 4> bbox{0.0, 0.0, 0.0, 0.0}; // min_lon, min_lat, max_lon, max_lat

  AreaOfInterest to_area() const;
};

struct TimeConfig {
  std::string start; // YYYY-MM-DD or ISO-8601 UTC
  std::string end;
};

struct CatalogConfig {
  std::string stac_url = "https://stac.dataspace.copernicus.eu/v1";
  std::string stac_collection = "sentinel-1-grd";
  int stac_limit = 100;
  std::string odata_url = "https://catalogue.dataspace.copernicus.eu/odata/v1";
  std::string download_url = "https://zipper.dataspace.copernicus.eu/odata/v1";
  std::string identity_url =
      "https://identity.dataspace.copernicus.eu/auth/realms/CDSE/protocol/openid-connect/token";
  std::string asf_search_url = "https://api.daac.asf.alaska.edu/services/search/param";
  int top_k = 10;
  int time_tolerance_s = 5;
  int timeout_s = 60;
  int download_timeout_s = 0; // 0 = no overall limit
};

struct CredentialsConfig {
  std::string cdse_username;
  std::string cdse_password;
  std::string earthdata_username;
  std::string earthdata_password;
  std::string s3_access_key;
  std::string s3_secret_key;
  std::string s3_endpoint = "eodata.dataspace.copernicus.eu";
};

struct DownloadConfig {
  std::string cache_dir; // empty = <run_dir>/downloads
  bool skip_existing = true;
};

struct ArchiveConfig {
  bool extract = true;
  bool keep_extracted = false;
};

struct GeocodeConfig {
  std::string command; // template with {input} {outdir} {aoi} {t_srs} {spacing} {scaling} {dem}
  std::string t_srs = "EPSG:4326";
  double spacing = 10.0;
  std::string scaling = "dB";
  std::string dem = "Copernicus 30m Global DEM";
};

struct ClipConfig {
  int warp_threads = 0; // 0 = all CPUs
  bool mask_outside_polygon = true;
};

struct CompositeConfig {
  std::string input_scale = "linear"; // linear | db
  float p_low = 2.0f;
  float p_high = 98.0f;
  bool write_preview = true;

  InputScale scale() const;
};

struct Config {
  PipelineConfig pipeline;
  AoiConfig aoi;
  TimeConfig time;
  CatalogConfig catalog;
  CredentialsConfig credentials;
  DownloadConfig download;
  ArchiveConfig archive;
  GeocodeConfig geocode;
  ClipConfig clip;
  CompositeConfig composite;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace sar_compose::config
