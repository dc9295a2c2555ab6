#include "sar_compose/pipeline/safe_archive.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/raster/raster_io.hpp"

#include <cpl_string.h>
#include <cpl_vsi.h>

#include <algorithm>

namespace sar_compose::pipeline {

namespace {

std::string pol_pattern(Polarization pol) {
    return "*-" + core::to_lower(polarization_to_string(pol)) + "-*.tiff";
}

std::string member_name(const std::string& vsi_path) {
    const auto pos = vsi_path.find_last_of('/');
    return pos == std::string::npos ? vsi_path : vsi_path.substr(pos + 1);
}

} // namespace

std::string vsizip_path(const fs::path& zip) {
    return "/vsizip/" + fs::absolute(zip).string();
}

std::vector<std::string> select_measurements(const std::vector<std::string>& entries,
                                             Polarization pol) {
    const std::string pattern = pol_pattern(pol);
    std::vector<std::string> out;
    for (const auto& e : entries) {
        const auto parts = core::split(e, '/');
        if (parts.size() < 2) continue;
        if (core::to_lower(parts[parts.size() - 2]) != "measurement") continue;
        if (core::glob_match(pattern, parts.back())) out.push_back(e);
    }
    std::sort(out.begin(), out.end());
    return out;
}

RawBands locate_measurement_bands(const fs::path& zip) {
    if (!fs::exists(zip)) {
        throw IOError("SAFE archive not found: " + zip.string());
    }
    raster::ensure_gdal_registered();

    const std::string root = vsizip_path(zip);
    CPLStringList listing(VSIReadDirRecursive(root.c_str()));
    if (listing.Count() == 0) {
        throw ProductError("cannot list " + zip.string() + ": " + raster::last_gdal_error());
    }

    std::vector<std::string> entries;
    entries.reserve(static_cast<size_t>(listing.Count()));
    for (int i = 0; i < listing.Count(); ++i) {
        entries.emplace_back(listing[i]);
    }

    const auto vv = select_measurements(entries, Polarization::VV);
    const auto vh = select_measurements(entries, Polarization::VH);
    if (vv.empty() || vh.empty()) {
        throw ProductError("VV or VH measurement TIFF not found in " + zip.filename().string());
    }

    RawBands bands;
    bands.vv = root + "/" + vv.front();
    bands.vh = root + "/" + vh.front();
    return bands;
}

RawBands extract_bands(const RawBands& bands, const fs::path& dir) {
    fs::create_directories(dir);
    RawBands out;
    out.vv = dir / member_name(bands.vv.string());
    out.vh = dir / member_name(bands.vh.string());
    raster::copy_vsi_file(bands.vv.string(), out.vv);
    raster::copy_vsi_file(bands.vh.string(), out.vh);
    return out;
}

} // namespace sar_compose::pipeline
