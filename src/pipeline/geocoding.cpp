#include "sar_compose/pipeline/geocoding.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <sys/wait.h>

namespace sar_compose::pipeline {

std::string render_command(const std::string& templ, const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(templ.size());
    size_t i = 0;
    while (i < templ.size()) {
        if (templ[i] != '{') {
            out.push_back(templ[i++]);
            continue;
        }
        const size_t close = templ.find('}', i);
        if (close == std::string::npos) {
            throw ConfigError("unterminated placeholder in geocode.command: " + templ.substr(i));
        }
        const std::string key = templ.substr(i + 1, close - i - 1);
        auto it = values.find(key);
        if (it == values.end()) {
            throw ConfigError("unknown placeholder {" + key + "} in geocode.command");
        }
        out += core::shell_quote(it->second);
        i = close + 1;
    }
    return out;
}

RawBands find_geocoded_outputs(const fs::path& outdir, const fs::path& log_path) {
    const auto vv = core::glob_recursive(outdir, "*VV*.tif");
    const auto vh = core::glob_recursive(outdir, "*VH*.tif");
    if (vv.empty() || vh.empty()) {
        throw ExternalToolError("geocoding produced no VV/VH GeoTIFFs under " + outdir.string() +
                                "; see " + log_path.string());
    }
    return {vv.front(), vh.front()};
}

std::string GeocodingEngine::command_for(const fs::path& input, const fs::path& outdir,
                                         const fs::path& aoi_geojson) const {
    std::ostringstream spacing;
    spacing << cfg_.spacing;
    const std::map<std::string, std::string> values{
        {"input", input.string()},
        {"outdir", outdir.string()},
        {"aoi", aoi_geojson.string()},
        {"t_srs", cfg_.t_srs},
        {"spacing", spacing.str()},
        {"scaling", cfg_.scaling},
        {"dem", cfg_.dem},
    };
    return render_command(cfg_.command, values);
}

RawBands GeocodingEngine::run(const fs::path& input, const fs::path& outdir,
                              const fs::path& aoi_geojson) const {
    fs::create_directories(outdir);
    if (!log_path_.parent_path().empty()) {
        fs::create_directories(log_path_.parent_path());
    }

    const std::string cmd = command_for(input, outdir, aoi_geojson);
    std::cerr << "[GEOCODE] Running: " << cmd << std::endl;

    const std::string full = "(" + cmd + ") > " + core::shell_quote(log_path_.string()) + " 2>&1";
    const int ret = std::system(full.c_str());
    if (ret == -1) {
        throw ExternalToolError("cannot start geocoding engine");
    }
    if (!WIFEXITED(ret) || WEXITSTATUS(ret) != 0) {
        const int code = WIFEXITED(ret) ? WEXITSTATUS(ret) : -1;
        throw ExternalToolError("geocoding engine exited with status " + std::to_string(code) +
                                "; see " + log_path_.string());
    }

    return find_geocoded_outputs(outdir, log_path_);
}

} // namespace sar_compose::pipeline
