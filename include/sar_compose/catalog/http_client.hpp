#pragma once

#include "sar_compose/core/types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace sar_compose::catalog {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// At most one of bearer token or basic credentials is used (bearer wins).
struct HttpAuth {
    std::string bearer_token;
    std::string username;
    std::string password;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Called with (bytes received, total bytes or 0 when unknown).
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

// Blocking libcurl wrapper. Redirects are followed; HTTP status >= 400 and
// transport failures raise NetworkError.
class HttpClient {
public:
    explicit HttpClient(int timeout_s = 60);

    HttpResponse get(const std::string& url, const HttpAuth& auth = {}) const;
    HttpResponse post_form(const std::string& url, const QueryParams& fields) const;
    HttpResponse post_json(const std::string& url, const std::string& body) const;

    // Streams the body into `path`. `timeout_s` of 0 disables the overall
    // transfer limit (connect timeout still applies).
    void download_to_file(const std::string& url, const fs::path& path,
                          const HttpAuth& auth, int timeout_s,
                          const ProgressCallback& progress = {}) const;

    int timeout_s() const { return timeout_s_; }

private:
    int timeout_s_;
};

// Percent-encodes every character outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& value);

// k1=v1&k2=v2 with keys and values percent-encoded.
std::string build_query(const QueryParams& params);

} // namespace sar_compose::catalog
