#include "sar_compose/catalog/cdse_auth.hpp"
#include "sar_compose/core/errors.hpp"

#include <nlohmann/json.hpp>

namespace sar_compose::catalog {

std::string fetch_cdse_access_token(const HttpClient& http, const std::string& identity_url,
                                    const std::string& username, const std::string& password) {
    if (username.empty() || password.empty()) {
        throw NetworkError("CDSE credentials are empty");
    }
    const QueryParams form{
        {"client_id", "cdse-public"},
        {"grant_type", "password"},
        {"username", username},
        {"password", password},
    };
    return parse_access_token(http.post_form(identity_url, form).body);
}

std::string parse_access_token(const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw NetworkError("token endpoint returned non-JSON response");
    }
    auto it = j.find("access_token");
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        std::string detail = j.value("error_description", j.value("error", std::string()));
        throw NetworkError("token endpoint returned no access_token" +
                           (detail.empty() ? std::string() : ": " + detail));
    }
    return it->get<std::string>();
}

std::string cdse_product_download_url(const std::string& download_url, const std::string& product_id) {
    std::string base = download_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/Products(" + product_id + ")/$value";
}

} // namespace sar_compose::catalog
