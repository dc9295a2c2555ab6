#pragma once

#include "sar_compose/config/configuration.hpp"
#include "sar_compose/core/types.hpp"

#include <map>
#include <string>

namespace sar_compose::pipeline {

// Replaces {input} {outdir} {aoi} {t_srs} {spacing} {scaling} {dem} with the
// shell-quoted values. Unknown placeholders raise ConfigError.
std::string render_command(const std::string& templ, const std::map<std::string, std::string>& values);

// First match (by path) of *VV*.tif and *VH*.tif anywhere under `outdir`.
// Throws ExternalToolError naming `log_path` when either is missing.
RawBands find_geocoded_outputs(const fs::path& outdir, const fs::path& log_path);

// External terrain-correction engine run as a shell command.
class GeocodingEngine {
public:
    GeocodingEngine(config::GeocodeConfig cfg, fs::path log_path)
        : cfg_(std::move(cfg)), log_path_(std::move(log_path)) {}

    std::string command_for(const fs::path& input, const fs::path& outdir,
                            const fs::path& aoi_geojson) const;

    // Runs the engine and globs its outputs. Throws ExternalToolError.
    RawBands run(const fs::path& input, const fs::path& outdir, const fs::path& aoi_geojson) const;

    const fs::path& log_path() const { return log_path_; }

private:
    config::GeocodeConfig cfg_;
    fs::path log_path_;
};

} // namespace sar_compose::pipeline
