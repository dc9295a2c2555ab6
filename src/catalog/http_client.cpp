#include "sar_compose/catalog/http_client.hpp"
#include "sar_compose/core/errors.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <memory>

namespace sar_compose::catalog {

namespace {

constexpr long kConnectTimeoutS = 30;

// curl_global_init once per process, cleaned up at exit
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensure_curl_global() {
    static CurlGlobal global;
    (void)global;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
struct FileCloser {
    void operator()(std::FILE* f) const { std::fclose(f); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

size_t write_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t write_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* f = static_cast<std::FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, f) * size;
}

int progress_cb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    const auto* cb = static_cast<const ProgressCallback*>(userdata);
    if (cb && *cb) {
        (*cb)(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal));
    }
    return 0;
}

CurlPtr make_handle(const std::string& url, long timeout_s) {
    ensure_curl_global();
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        throw NetworkError("curl_easy_init failed");
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, kConnectTimeoutS);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "sar_compose/1.0");
    return curl;
}

SlistPtr apply_auth(CURL* curl, const HttpAuth& auth, SlistPtr headers) {
    if (!auth.bearer_token.empty()) {
        const std::string h = "Authorization: Bearer " + auth.bearer_token;
        headers.reset(curl_slist_append(headers.release(), h.c_str()));
    } else if (!auth.username.empty()) {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERNAME, auth.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, auth.password.c_str());
        // Earthdata redirects to a login host; credentials must follow
        curl_easy_setopt(curl, CURLOPT_UNRESTRICTED_AUTH, 1L);
        curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
    }
    return headers;
}

std::string snippet(const std::string& body) {
    constexpr size_t kMax = 300;
    return body.size() <= kMax ? body : body.substr(0, kMax) + "...";
}

HttpResponse perform(CURL* curl, const std::string& url, std::string& body) {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw NetworkError(url + ": " + curl_easy_strerror(res));
    }

    HttpResponse rsp;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &rsp.status);
    rsp.body = std::move(body);
    if (rsp.status >= 400) {
        throw NetworkError(url + ": HTTP " + std::to_string(rsp.status) + ": " + snippet(rsp.body));
    }
    return rsp;
}

} // namespace

HttpClient::HttpClient(int timeout_s) : timeout_s_(timeout_s) {}

HttpResponse HttpClient::get(const std::string& url, const HttpAuth& auth) const {
    CurlPtr curl = make_handle(url, timeout_s_);
    SlistPtr headers = apply_auth(curl.get(), auth, SlistPtr());
    headers.reset(curl_slist_append(headers.release(), "Accept: application/json"));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    std::string body;
    return perform(curl.get(), url, body);
}

HttpResponse HttpClient::post_form(const std::string& url, const QueryParams& fields) const {
    CurlPtr curl = make_handle(url, timeout_s_);
    const std::string data = build_query(fields);
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, data.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(data.size()));

    std::string body;
    return perform(curl.get(), url, body);
}

HttpResponse HttpClient::post_json(const std::string& url, const std::string& payload) const {
    CurlPtr curl = make_handle(url, timeout_s_);
    SlistPtr headers;
    headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
    headers.reset(curl_slist_append(headers.release(), "Accept: application/geo+json, application/json"));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));

    std::string body;
    return perform(curl.get(), url, body);
}

void HttpClient::download_to_file(const std::string& url, const fs::path& path,
                                  const HttpAuth& auth, int timeout_s,
                                  const ProgressCallback& progress) const {
    FilePtr file(std::fopen(path.c_str(), "wb"));
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }

    CurlPtr curl = make_handle(url, timeout_s);
    SlistPtr headers = apply_auth(curl.get(), auth, SlistPtr());
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_file);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file.get());
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    if (progress) {
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &progress);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        std::string msg = url + ": " + curl_easy_strerror(res);
        if (status > 0) msg += " (HTTP " + std::to_string(status) + ")";
        throw NetworkError(msg);
    }
    if (std::fflush(file.get()) != 0) {
        throw IOError("Cannot write file: " + path.string());
    }
}

std::string url_encode(const std::string& value) {
    ensure_curl_global();
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        throw NetworkError("curl_easy_init failed");
    }
    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw NetworkError("curl_easy_escape failed");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string build_query(const QueryParams& params) {
    std::string out;
    for (const auto& kv : params) {
        if (!out.empty()) out += '&';
        out += url_encode(kv.first);
        out += '=';
        out += url_encode(kv.second);
    }
    return out;
}

} // namespace sar_compose::catalog
