#include "sar_compose/pipeline/product_source.hpp"
#include "sar_compose/catalog/cdse_auth.hpp"
#include "sar_compose/catalog/matcher.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace sar_compose::pipeline {

namespace {

std::string format_mb(uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1e6 << " MB";
    return oss.str();
}

bool is_cached(const fs::path& path, bool skip_existing) {
    if (!skip_existing) return false;
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    return !ec && size > 0;
}

} // namespace

void download_with_checkpoint(const catalog::HttpClient& http, const std::string& url,
                              const fs::path& dest, const catalog::HttpAuth& auth,
                              int timeout_s, core::EventEmitter& events, Phase phase) {
    if (!dest.parent_path().empty()) {
        fs::create_directories(dest.parent_path());
    }
    fs::path part = dest;
    part += ".part";

    int last_step = -1;
    auto progress = [&](uint64_t got, uint64_t total) {
        if (total == 0) return;
        const int step = static_cast<int>(20.0 * static_cast<double>(got) / static_cast<double>(total));
        if (step == last_step) return;
        last_step = step;
        events.phase_progress(phase, static_cast<float>(got) / static_cast<float>(total),
                              format_mb(got) + " / " + format_mb(total));
    };

    try {
        http.download_to_file(url, part, auth, timeout_s, progress);
    } catch (const SarComposeError&) {
        std::error_code ec;
        fs::remove(part, ec);
        throw;
    }

    std::error_code ec;
    fs::rename(part, dest, ec);
    if (ec) {
        throw IOError("Cannot move " + part.string() + " to " + dest.string() + ": " + ec.message());
    }
}

fs::path CdseProductSource::fetch(const DiscoveredScene& scene, const AreaOfInterest& aoi,
                                  core::EventEmitter& events) {
    events.phase_start(Phase::MATCH, {{"scene_id", scene.pointer.id},
                                      {"prefix", scene.pointer.prefix},
                                      {"sensing_start", core::format_iso_ms(scene.pointer.sensing.start)}});

    MatchResult m = catalog::match_product(products_, aoi, scene.pointer, cfg_.catalog.top_k,
                                           cfg_.catalog.time_tolerance_s);
    if (m.policy == MatchPolicy::FALLBACK) {
        events.warning("No candidate shares the scene prefix; using the most recently published product",
                       {{"prefix", scene.pointer.prefix}, {"product_name", m.product.name}});
        std::cerr << "[MATCH] warning: fallback to " << m.product.name << std::endl;
    }
    events.phase_end(Phase::MATCH, "ok", {{"product_id", m.product.id},
                                          {"product_name", m.product.name},
                                          {"policy", match_policy_to_string(m.policy)},
                                          {"candidates", m.candidates_seen}});
    std::cerr << "[MATCH] " << m.product.name << " (" << m.product.id << ")" << std::endl;
    match_ = m;

    events.phase_start(Phase::DOWNLOAD, {{"product_name", m.product.name}});
    const fs::path zip = cache_dir_ / (m.product.name + ".zip");
    if (is_cached(zip, cfg_.download.skip_existing)) {
        events.phase_end(Phase::DOWNLOAD, "skipped", {{"reason", "cached"}, {"path", zip.string()}});
        std::cerr << "[DOWNLOAD] using cached " << zip.string() << std::endl;
        return zip;
    }

    catalog::HttpAuth auth;
    auth.bearer_token = catalog::fetch_cdse_access_token(
        http_, cfg_.catalog.identity_url, cfg_.credentials.cdse_username,
        cfg_.credentials.cdse_password);

    const std::string url = catalog::cdse_product_download_url(cfg_.catalog.download_url, m.product.id);
    std::cerr << "[DOWNLOAD] " << url << std::endl;
    download_with_checkpoint(http_, url, zip, auth, cfg_.catalog.download_timeout_s, events,
                             Phase::DOWNLOAD);

    events.phase_end(Phase::DOWNLOAD, "ok", {{"path", zip.string()},
                                             {"bytes", fs::file_size(zip)}});
    return zip;
}

fs::path AsfProductSource::fetch(const DiscoveredScene& scene, const AreaOfInterest&,
                                 core::EventEmitter& events) {
    auto url_it = scene.assets.find("url");
    if (url_it == scene.assets.end()) {
        throw ProductError("ASF scene " + scene.pointer.id + " has no download url");
    }

    std::string file_name;
    auto fn_it = scene.assets.find("file_name");
    if (fn_it != scene.assets.end()) {
        file_name = fn_it->second;
    } else {
        file_name = fs::path(url_it->second).filename().string();
    }
    if (file_name.empty()) file_name = scene.pointer.id + ".zip";

    events.phase_start(Phase::DOWNLOAD, {{"scene_id", scene.pointer.id}, {"url", url_it->second}});
    const fs::path zip = cache_dir_ / file_name;
    if (is_cached(zip, cfg_.download.skip_existing)) {
        events.phase_end(Phase::DOWNLOAD, "skipped", {{"reason", "cached"}, {"path", zip.string()}});
        std::cerr << "[DOWNLOAD] using cached " << zip.string() << std::endl;
        return zip;
    }

    catalog::HttpAuth auth;
    auth.username = cfg_.credentials.earthdata_username;
    auth.password = cfg_.credentials.earthdata_password;
    std::cerr << "[DOWNLOAD] " << url_it->second << std::endl;
    download_with_checkpoint(http_, url_it->second, zip, auth, cfg_.catalog.download_timeout_s,
                             events, Phase::DOWNLOAD);

    events.phase_end(Phase::DOWNLOAD, "ok", {{"path", zip.string()},
                                             {"bytes", fs::file_size(zip)}});
    return zip;
}

} // namespace sar_compose::pipeline
