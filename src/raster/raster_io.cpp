#include "sar_compose/raster/raster_io.hpp"
#include "sar_compose/core/errors.hpp"

#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <gdal_priv.h>

#include <mutex>

namespace sar_compose::raster {

namespace {

GDALDatasetUniquePtr open_readonly(const fs::path& path) {
    ensure_gdal_registered();
    GDALDatasetUniquePtr ds(GDALDataset::Open(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!ds) {
        throw RasterError("cannot open " + path.string() + ": " + last_gdal_error());
    }
    return ds;
}

RasterGrid grid_of(GDALDataset& ds) {
    RasterGrid grid;
    const char* wkt = ds.GetProjectionRef();
    grid.crs_wkt = wkt ? wkt : "";
    grid.width = ds.GetRasterXSize();
    grid.height = ds.GetRasterYSize();

    GeoTransform gt{};
    if (ds.GetGeoTransform(gt.data()) == CE_None) {
        grid.transform = gt;
    }
    return grid;
}

GDALDatasetUniquePtr create_geotiff(const fs::path& path, int width, int height, int bands,
                                    GDALDataType type) {
    ensure_gdal_registered();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver) {
        throw RasterError("GTiff driver not available");
    }

    CPLStringList options;
    options.AddNameValue("TILED", "YES");
    options.AddNameValue("COMPRESS", "DEFLATE");
    options.AddNameValue("BIGTIFF", "IF_SAFER");
    if (bands == 3 && type == GDT_Byte) {
        options.AddNameValue("PHOTOMETRIC", "RGB");
    }

    GDALDatasetUniquePtr ds(driver->Create(path.c_str(), width, height, bands, type, options.List()));
    if (!ds) {
        throw RasterError("cannot create " + path.string() + ": " + last_gdal_error());
    }
    return ds;
}

void apply_grid(GDALDataset& ds, const RasterGrid& grid, const fs::path& path) {
    if (!grid.crs_wkt.empty() && ds.SetProjection(grid.crs_wkt.c_str()) != CE_None) {
        throw RasterError("cannot set CRS on " + path.string() + ": " + last_gdal_error());
    }
    if (grid.transform) {
        GeoTransform gt = *grid.transform;
        if (ds.SetGeoTransform(gt.data()) != CE_None) {
            throw RasterError("cannot set geotransform on " + path.string() + ": " + last_gdal_error());
        }
    }
}

template <typename Matrix>
void write_band_rows(GDALRasterBand* band, const Matrix& data, GDALDataType type,
                     const fs::path& path) {
    auto* ptr = const_cast<typename Matrix::Scalar*>(data.data());
    if (band->RasterIO(GF_Write, 0, 0, static_cast<int>(data.cols()), static_cast<int>(data.rows()),
                       ptr, static_cast<int>(data.cols()), static_cast<int>(data.rows()), type,
                       0, 0) != CE_None) {
        throw RasterError("cannot write " + path.string() + ": " + last_gdal_error());
    }
}

} // namespace

void ensure_gdal_registered() {
    static std::once_flag once;
    std::call_once(once, []() { GDALAllRegister(); });
}

std::string last_gdal_error() {
    const char* msg = CPLGetLastErrorMsg();
    return (msg && *msg) ? std::string(msg) : std::string("unknown GDAL error");
}

RasterGrid read_grid(const fs::path& path) {
    auto ds = open_readonly(path);
    return grid_of(*ds);
}

RasterBand read_band(const fs::path& path) {
    auto ds = open_readonly(path);
    if (ds->GetRasterCount() < 1) {
        throw RasterError(path.string() + " has no raster bands");
    }

    RasterBand out;
    out.grid = grid_of(*ds);

    const int n_gcps = ds->GetGCPCount();
    if (n_gcps > 0) {
        const GDAL_GCP* gcps = ds->GetGCPs();
        out.gcps.reserve(static_cast<size_t>(n_gcps));
        for (int i = 0; i < n_gcps; ++i) {
            GroundControlPoint p;
            p.id = gcps[i].pszId ? gcps[i].pszId : "";
            p.pixel = gcps[i].dfGCPPixel;
            p.line = gcps[i].dfGCPLine;
            p.x = gcps[i].dfGCPX;
            p.y = gcps[i].dfGCPY;
            p.z = gcps[i].dfGCPZ;
            out.gcps.push_back(std::move(p));
        }
        const char* gcp_wkt = ds->GetGCPProjection();
        out.gcp_crs_wkt = gcp_wkt ? gcp_wkt : "";
    }

    GDALRasterBand* band = ds->GetRasterBand(1);
    int has_nodata = FALSE;
    const double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) out.nodata = nodata;

    out.data.resize(out.grid.height, out.grid.width);
    if (band->RasterIO(GF_Read, 0, 0, out.grid.width, out.grid.height, out.data.data(),
                       out.grid.width, out.grid.height, GDT_Float32, 0, 0) != CE_None) {
        throw RasterError("cannot read " + path.string() + ": " + last_gdal_error());
    }
    return out;
}

GeolocationMode detect_geolocation_mode(const fs::path& path) {
    auto ds = open_readonly(path);
    const RasterGrid grid = grid_of(*ds);

    if (grid.transform && !grid.crs_wkt.empty()) {
        return GeolocationMode::AFFINE;
    }
    if (ds->GetGCPCount() > 0) {
        return GeolocationMode::GCP;
    }
    throw NoCRSError(path.string() + " declares neither a CRS with geotransform nor GCPs");
}

void write_float_geotiff(const fs::path& path, const Matrix2Df& data, const RasterGrid& grid,
                         std::optional<double> nodata) {
    auto ds = create_geotiff(path, static_cast<int>(data.cols()), static_cast<int>(data.rows()), 1,
                             GDT_Float32);
    apply_grid(*ds, grid, path);
    GDALRasterBand* band = ds->GetRasterBand(1);
    if (nodata) band->SetNoDataValue(*nodata);
    write_band_rows(band, data, GDT_Float32, path);
}

void write_rgb_geotiff(const fs::path& path, const Matrix2Du8& red, const Matrix2Du8& green,
                       const Matrix2Du8& blue, const RasterGrid& grid) {
    if (red.rows() != green.rows() || red.rows() != blue.rows() ||
        red.cols() != green.cols() || red.cols() != blue.cols()) {
        throw RasterError("RGB channels differ in size for " + path.string());
    }

    auto ds = create_geotiff(path, static_cast<int>(red.cols()), static_cast<int>(red.rows()), 3,
                             GDT_Byte);
    apply_grid(*ds, grid, path);

    const Matrix2Du8* channels[3] = {&red, &green, &blue};
    const GDALColorInterp interp[3] = {GCI_RedBand, GCI_GreenBand, GCI_BlueBand};
    for (int b = 0; b < 3; ++b) {
        GDALRasterBand* band = ds->GetRasterBand(b + 1);
        band->SetColorInterpretation(interp[b]);
        write_band_rows(band, *channels[b], GDT_Byte, path);
    }
}

void copy_vsi_file(const std::string& src, const fs::path& dst) {
    ensure_gdal_registered();
    if (VSICopyFile(src.c_str(), dst.c_str(), nullptr, static_cast<vsi_l_offset>(-1), nullptr,
                    nullptr, nullptr) != 0) {
        throw IOError("cannot copy " + src + " to " + dst.string() + ": " + last_gdal_error());
    }
}

} // namespace sar_compose::raster
