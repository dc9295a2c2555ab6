#include "runner_pipeline.hpp"
#include "runner_tools.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
  CLI::App app{"Sentinel-1 VV/VH composite runner"};
  app.require_subcommand(1);

  std::string config_path;
  std::string runs_dir = "runs";
  bool dry_run = false;
  bool config_from_stdin = false;

  auto run_cmd = app.add_subcommand("run", "Run the full pipeline");
  run_cmd->add_option("--config", config_path, "Path to config.yaml (- for stdin)")
      ->required();
  run_cmd->add_option("--runs-dir", runs_dir, "Runs directory")
      ->default_val("runs");
  run_cmd->add_flag("--dry-run", dry_run, "Validate config and create the run directory only");
  run_cmd->add_flag("--stdin", config_from_stdin,
                    "Read config YAML from stdin (use with --config -)");

  std::string scene_id;
  auto match_cmd = app.add_subcommand("match", "Resolve a discovered scene id in the product catalog");
  match_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  match_cmd->add_option("--scene-id", scene_id, "Discovery catalog scene id")->required();

  std::string product_name;
  auto lookup_cmd = app.add_subcommand("lookup", "Find a product by exact name");
  lookup_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  lookup_cmd->add_option("--name", product_name, "Product name")->required();

  std::string input, output;
  std::vector<double> bbox;
  int threads = 0;
  auto clip_cmd = app.add_subcommand("clip", "Clip a single-band raster to a WGS84 bbox");
  clip_cmd->add_option("--input", input, "Source raster")->required()->check(CLI::ExistingFile);
  clip_cmd->add_option("--output", output, "Output GeoTIFF")->required();
  clip_cmd->add_option("--bbox", bbox, "min_lon min_lat max_lon max_lat")
      ->required()
      ->expected(4);
  clip_cmd->add_option("--threads", threads, "Warp threads (0 = all CPUs)");

  std::string path_a, path_b;
  auto verify_cmd = app.add_subcommand("verify", "Check that two rasters share one grid");
  verify_cmd->add_option("--a", path_a, "First raster")->required()->check(CLI::ExistingFile);
  verify_cmd->add_option("--b", path_b, "Second raster")->required()->check(CLI::ExistingFile);

  std::string vv, vh, input_scale = "linear", preview;
  auto composite_cmd = app.add_subcommand("composite", "Build the RGB composite from clipped VV/VH");
  composite_cmd->add_option("--vv", vv, "Clipped VV raster")->required()->check(CLI::ExistingFile);
  composite_cmd->add_option("--vh", vh, "Clipped VH raster")->required()->check(CLI::ExistingFile);
  composite_cmd->add_option("--output", output, "Output RGB GeoTIFF")->required();
  composite_cmd->add_option("--input-scale", input_scale, "linear|db")
      ->default_val("linear");
  composite_cmd->add_option("--preview", preview, "Optional PNG quicklook path");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_pipeline_command(config_path, runs_dir, dry_run, config_from_stdin);
  }
  if (match_cmd->parsed()) {
    return match_command(config_path, scene_id);
  }
  if (lookup_cmd->parsed()) {
    return lookup_command(config_path, product_name);
  }
  if (clip_cmd->parsed()) {
    return clip_command(input, output, bbox, threads);
  }
  if (verify_cmd->parsed()) {
    return verify_command(path_a, path_b);
  }
  if (composite_cmd->parsed()) {
    return composite_command(vv, vh, output, input_scale, preview);
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
