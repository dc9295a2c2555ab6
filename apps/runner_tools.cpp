#include "runner_tools.hpp"
#include "runner_shared.hpp"

#include "sar_compose/catalog/http_client.hpp"
#include "sar_compose/catalog/matcher.hpp"
#include "sar_compose/catalog/product_catalog.hpp"
#include "sar_compose/catalog/scene_pointer.hpp"
#include "sar_compose/composite/composite.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/raster/alignment.hpp"
#include "sar_compose/raster/clipper.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

using json = nlohmann::json;

namespace catalog = sar_compose::catalog;
namespace composite = sar_compose::composite;
namespace core = sar_compose::core;
namespace raster = sar_compose::raster;
namespace runner = sar_compose::runner;

json candidate_to_json(const sar_compose::ProductCandidate &c) {
  return {{"id", c.id},
          {"name", c.name},
          {"publication_date", c.publication_date},
          {"content_start", c.content_start}};
}

} // namespace

int match_command(const std::string &config_path, const std::string &scene_id) {
  using namespace sar_compose;
  try {
    const auto cfg = runner::load_config(config_path, false);
    const ScenePointer pointer = catalog::parse_scene_pointer(scene_id);

    catalog::HttpClient http(cfg.catalog.timeout_s);
    catalog::ODataProductCatalog products(cfg.catalog.odata_url, http);
    const MatchResult m =
        catalog::match_product(products, cfg.aoi.to_area(), pointer,
                               cfg.catalog.top_k, cfg.catalog.time_tolerance_s);

    json out = candidate_to_json(m.product);
    out["policy"] = match_policy_to_string(m.policy);
    out["candidates"] = m.candidates_seen;
    out["prefix"] = pointer.prefix;
    std::cout << out.dump(2) << std::endl;
    if (m.policy == MatchPolicy::FALLBACK) {
      std::cerr << "Warning: no candidate starts with " << pointer.prefix
                << "; fell back to the most recently published product"
                << std::endl;
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

int lookup_command(const std::string &config_path, const std::string &name) {
  using namespace sar_compose;
  try {
    const auto cfg = runner::load_config(config_path, false);
    catalog::HttpClient http(cfg.catalog.timeout_s);
    catalog::ODataProductCatalog products(cfg.catalog.odata_url, http);

    const auto found = products.find_by_name(name);
    if (!found) {
      std::cerr << "Not found: " << name << std::endl;
      return 1;
    }
    std::cout << candidate_to_json(*found).dump(2) << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

int clip_command(const std::string &input, const std::string &output,
                 const std::vector<double> &bbox, int threads) {
  using namespace sar_compose;
  try {
    if (bbox.size() != 4) {
      throw ValidationError("--bbox needs min_lon min_lat max_lon max_lat");
    }
    const AreaOfInterest aoi(bbox[0], bbox[1], bbox[2], bbox[3]);
    raster::ClipOptions opts;
    opts.warp_threads = threads;

    const auto mode = raster::detect_geolocation_mode(input);
    std::cerr << "[CLIP] " << input << " ("
              << raster::geolocation_mode_to_string(mode) << " mode)" << std::endl;
    const RasterGrid grid = raster::clip_to_aoi(input, output, aoi, opts);

    json out = runner::grid_to_json(grid);
    out["output"] = output;
    out["mode"] = raster::geolocation_mode_to_string(mode);
    std::cout << out.dump(2) << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

int verify_command(const std::string &a, const std::string &b) {
  using namespace sar_compose;
  try {
    raster::verify_alignment(fs::path(a), fs::path(b));
    std::cout << json{{"aligned", true}}.dump() << std::endl;
    return 0;
  } catch (const AlignmentError &e) {
    std::cout << json{{"aligned", false}, {"fields", e.fields()}}.dump()
              << std::endl;
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

int composite_command(const std::string &vv, const std::string &vh,
                      const std::string &output, const std::string &input_scale,
                      const std::string &preview) {
  using namespace sar_compose;
  try {
    const std::string scale_l = core::to_lower(input_scale);
    if (scale_l != "linear" && scale_l != "db") {
      throw ValidationError("--input-scale must be 'linear' or 'db'");
    }
    const InputScale scale = scale_l == "db" ? InputScale::DB : InputScale::LINEAR;

    raster::verify_alignment(fs::path(vv), fs::path(vh));
    const auto product = composite::compose_from_files(vv, vh, scale);
    composite::write_composite_geotiff(output, product);
    if (!preview.empty()) {
      composite::write_composite_preview(preview, product.rgb);
    }

    json out = runner::grid_to_json(product.grid);
    out["output"] = output;
    if (!preview.empty()) out["preview"] = preview;
    std::cout << out.dump(2) << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
