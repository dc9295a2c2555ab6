#include "sar_compose/composite/composite.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"
#include "sar_compose/raster/raster_io.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace sar_compose::composite {

float to_decibel(float x) {
    if (std::isnan(x)) return x;
    return 10.0f * std::log10(std::max(x, kDecibelFloor));
}

Matrix2Df to_decibel(const Matrix2Df& linear) {
    return linear.unaryExpr([](float v) { return to_decibel(v); });
}

Matrix2Df mask_nodata(const Matrix2Df& band, std::optional<double> nodata) {
    if (!nodata) return band;
    const float nd = static_cast<float>(*nodata);
    const float nan = std::numeric_limits<float>::quiet_NaN();
    if (std::isnan(nd)) return band;
    return band.unaryExpr([nd, nan](float v) { return v == nd ? nan : v; });
}

Matrix2Df percentile_stretch(const Matrix2Df& band, float p_low, float p_high) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const double lo = core::nan_percentile(band, p_low);
    const double hi = core::nan_percentile(band, p_high);
    if (std::isnan(lo) || std::isnan(hi)) {
        // Nothing finite to stretch
        return Matrix2Df::Constant(band.rows(), band.cols(), nan);
    }

    const double denom = hi - lo + kStretchEps;
    return band.unaryExpr([lo, denom](float v) {
        if (std::isnan(v)) return v;
        const double y = (static_cast<double>(v) - lo) / denom;
        return static_cast<float>(std::min(1.0, std::max(0.0, y)));
    });
}

Composite build_composite(const Matrix2Df& vv_db, const Matrix2Df& vh_db,
                          float p_low, float p_high) {
    if (vv_db.rows() != vh_db.rows() || vv_db.cols() != vh_db.cols()) {
        throw ValidationError("VV and VH bands differ in size");
    }

    Composite out;
    out.red = percentile_stretch(vv_db, p_low, p_high);
    out.green = percentile_stretch(vh_db, p_low, p_high);
    const Matrix2Df ratio = vv_db - vh_db;
    out.blue = percentile_stretch(ratio, p_low, p_high);
    return out;
}

Matrix2Du8 to_u8(const Matrix2Df& channel) {
    return channel.unaryExpr([](float v) -> uint8_t {
        if (std::isnan(v)) return 0;
        const float c = std::min(1.0f, std::max(0.0f, v));
        return static_cast<uint8_t>(std::lround(c * 255.0f));
    });
}

CompositeProduct compose_from_files(const fs::path& vv_path, const fs::path& vh_path,
                                    InputScale scale, float p_low, float p_high) {
    RasterBand vv = raster::read_band(vv_path);
    RasterBand vh = raster::read_band(vh_path);

    Matrix2Df vv_db = mask_nodata(vv.data, vv.nodata);
    Matrix2Df vh_db = mask_nodata(vh.data, vh.nodata);
    if (scale == InputScale::LINEAR) {
        vv_db = to_decibel(vv_db);
        vh_db = to_decibel(vh_db);
    }

    CompositeProduct product;
    product.rgb = build_composite(vv_db, vh_db, p_low, p_high);
    product.grid = vv.grid;
    return product;
}

void write_composite_geotiff(const fs::path& path, const CompositeProduct& product) {
    raster::write_rgb_geotiff(path, to_u8(product.rgb.red), to_u8(product.rgb.green),
                              to_u8(product.rgb.blue), product.grid);
}

void write_composite_preview(const fs::path& path, const Composite& rgb) {
    const Matrix2Du8 r = to_u8(rgb.red);
    const Matrix2Du8 g = to_u8(rgb.green);
    const Matrix2Du8 b = to_u8(rgb.blue);
    const int rows = static_cast<int>(r.rows());
    const int cols = static_cast<int>(r.cols());

    // OpenCV stores colour images as BGR
    cv::Mat img(rows, cols, CV_8UC3);
    for (int y = 0; y < rows; ++y) {
        auto* row = img.ptr<cv::Vec3b>(y);
        for (int x = 0; x < cols; ++x) {
            row[x] = cv::Vec3b(b(y, x), g(y, x), r(y, x));
        }
    }

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), img);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write preview " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write preview " + path.string());
    }
}

} // namespace sar_compose::composite
