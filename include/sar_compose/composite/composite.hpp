#pragma once

#include "sar_compose/core/types.hpp"

#include <optional>

namespace sar_compose::composite {

constexpr float kDecibelFloor = 1e-10f;
constexpr double kStretchEps = 1e-12;

// 10 * log10(max(x, 1e-10)); NaN stays NaN.
float to_decibel(float x);
Matrix2Df to_decibel(const Matrix2Df& linear);

// Pixels equal to `nodata` become NaN. No-op without a nodata value.
Matrix2Df mask_nodata(const Matrix2Df& band, std::optional<double> nodata);

// Maps the [p_low, p_high] percentiles of the finite values to [0,1] and
// clips. NaN stays NaN. Constant bands map to 0.
Matrix2Df percentile_stretch(const Matrix2Df& band, float p_low = 2.0f, float p_high = 98.0f);

// R = stretch(vv), G = stretch(vh), B = stretch(vv - vh). Inputs in dB.
Composite build_composite(const Matrix2Df& vv_db, const Matrix2Df& vh_db,
                          float p_low = 2.0f, float p_high = 98.0f);

// round(clip01(x) * 255); NaN -> 0
Matrix2Du8 to_u8(const Matrix2Df& channel);

struct CompositeProduct {
    Composite rgb;
    RasterGrid grid;
};

// Reads both clipped bands, masks nodata, converts to dB when `scale` is
// LINEAR and builds the composite on the VV grid.
CompositeProduct compose_from_files(const fs::path& vv_path, const fs::path& vh_path,
                                    InputScale scale, float p_low = 2.0f, float p_high = 98.0f);

void write_composite_geotiff(const fs::path& path, const CompositeProduct& product);

// 8-bit quicklook (PNG or any format cv::imwrite understands).
void write_composite_preview(const fs::path& path, const Composite& rgb);

} // namespace sar_compose::composite
