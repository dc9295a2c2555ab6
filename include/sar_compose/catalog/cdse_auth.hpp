#pragma once

#include "sar_compose/catalog/http_client.hpp"

#include <string>

namespace sar_compose::catalog {

// OAuth2 password grant with the public CDSE client. Throws NetworkError.
std::string fetch_cdse_access_token(const HttpClient& http, const std::string& identity_url,
                                    const std::string& username, const std::string& password);

// "access_token" of a token endpoint response. Throws NetworkError when absent.
std::string parse_access_token(const std::string& body);

// <download_url>/Products(<id>)/$value
std::string cdse_product_download_url(const std::string& download_url, const std::string& product_id);

} // namespace sar_compose::catalog
