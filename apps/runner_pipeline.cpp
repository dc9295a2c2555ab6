#include "runner_pipeline.hpp"
#include "runner_shared.hpp"

#include "sar_compose/config/configuration.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/events.hpp"
#include "sar_compose/core/types.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/geo/geometry.hpp"
#include "sar_compose/pipeline/pipeline.hpp"

#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace {

using sar_compose::Phase;

namespace core = sar_compose::core;
namespace config = sar_compose::config;
namespace pipeline = sar_compose::pipeline;
namespace runner = sar_compose::runner;

void fail_run(core::EventEmitter &emitter, const std::string &message,
              const core::json &extra) {
  core::json detail = extra;
  detail["error"] = message;
  if (auto phase = emitter.open_phase()) {
    emitter.phase_end(*phase, "error", detail);
  }
  emitter.error(message);
  emitter.run_end(false, "error", extra);
}

} // namespace

int run_pipeline_command(const std::string &config_path,
                         const std::string &runs_dir, bool dry_run,
                         bool config_from_stdin) {
  using namespace sar_compose;

  config::Config cfg;
  try {
    cfg = runner::load_config(config_path, config_from_stdin);
  } catch (const SarComposeError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::string run_id = core::get_run_id();
  if (!cfg.pipeline.label.empty()) {
    run_id += "_" + cfg.pipeline.label;
  }
  const auto paths = pipeline::RunPaths::under(fs::path(runs_dir) / run_id);
  paths.create();

  // Effective config, secrets omitted
  {
    YAML::Emitter yaml;
    yaml << cfg.to_yaml();
    std::ofstream out(paths.run_dir / "config.yaml", std::ios::out);
    out << yaml.c_str() << "\n";
  }

  std::ofstream event_log_file(paths.logs_dir / "run_events.jsonl");
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter(run_id, log_file);
  emitter.run_start({{"config_path", config_path},
                     {"variant", cfg.pipeline.variant},
                     {"run_dir", paths.run_dir.string()},
                     {"aoi", cfg.aoi.bbox},
                     {"time_start", cfg.time.start},
                     {"time_end", cfg.time.end},
                     {"dry_run", dry_run}});

  std::cerr << "Run ID: " << run_id << std::endl;
  std::cerr << "Variant: " << cfg.pipeline.variant << std::endl;
  std::cerr << "Output: " << paths.run_dir.string() << std::endl;

  if (dry_run) {
    geo::write_aoi_geojson(cfg.aoi.to_area(), paths.aoi_geojson);
    emitter.phase_start(Phase::DISCOVERY);
    emitter.phase_end(Phase::DISCOVERY, "skipped", {{"reason", "dry_run"}});
    std::cerr << "Dry run - no processing" << std::endl;
    emitter.run_end(true, "ok");
    return 0;
  }

  try {
    auto bundle = pipeline::make_pipeline(cfg, paths);
    const auto result = bundle.pipeline->run(emitter);

    const fs::path manifest = paths.artifacts_dir / "manifest.json";
    pipeline::write_manifest(manifest, run_id, cfg, result);

    core::json extra = {{"vv_clip", result.vv_clip.string()},
                        {"vh_clip", result.vh_clip.string()},
                        {"rgb", result.rgb.string()},
                        {"manifest", manifest.string()}};
    if (result.match) {
      extra["match_policy"] = match_policy_to_string(result.match->policy);
    }
    emitter.phase_start(Phase::DONE);
    emitter.phase_end(Phase::DONE, "ok");
    emitter.run_end(true, "ok", extra);

    std::cerr << "RGB saved: " << result.rgb.string() << std::endl;
    std::cerr << "DONE. Outputs in: " << paths.outputs_dir.string() << std::endl;
    return 0;
  } catch (const AlignmentError &e) {
    fail_run(emitter, e.what(), {{"fields", e.fields()}});
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const SarComposeError &e) {
    fail_run(emitter, e.what(), core::json::object());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    fail_run(emitter, e.what(), core::json::object());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
