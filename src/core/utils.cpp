#include "sar_compose/core/utils.hpp"
#include "sar_compose/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <regex>
#include <sstream>

#include <openssl/sha.h>

namespace sar_compose::core {

namespace {

std::string random_hex(int n) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        out.push_back(hex[dis(gen)]);
    }
    return out;
}

UtcTime make_utc(int year, int month, int day, int hour, int minute, int second,
                 const std::string& source) {
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 59) {
        throw ParseError("timestamp out of range: '" + source + "'");
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    std::time_t t = timegm(&tm_buf);

    // timegm normalises e.g. Feb 30 into March; reject that
    std::tm check{};
    gmtime_r(&t, &check);
    if (check.tm_mday != day || check.tm_mon != month - 1) {
        throw ParseError("invalid calendar date: '" + source + "'");
    }
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_' << random_hex(8);
    return oss.str();
}

UtcTime parse_compact_utc(const std::string& text) {
    static const std::regex re(R"(^(\d{4})(\d{2})(\d{2})T(\d{2})(\d{2})(\d{2})$)");
    std::smatch m;
    if (!std::regex_match(text, m, re)) {
        throw ParseError("expected YYYYMMDDThhmmss, got '" + text + "'");
    }
    return make_utc(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]),
                    std::stoi(m[4]), std::stoi(m[5]), std::stoi(m[6]), text);
}

UtcTime parse_iso_utc(const std::string& text) {
    static const std::regex re(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?)?(?:Z|\+00:?00)?$)");
    std::smatch m;
    if (!std::regex_match(text, m, re)) {
        throw ParseError("expected ISO-8601 UTC date/time, got '" + text + "'");
    }

    int hour = m[4].matched ? std::stoi(m[4]) : 0;
    int minute = m[5].matched ? std::stoi(m[5]) : 0;
    int second = m[6].matched ? std::stoi(m[6]) : 0;
    UtcTime t = make_utc(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]),
                         hour, minute, second, text);

    if (m[7].matched) {
        std::string frac = m[7].str();
        frac.resize(3, '0');
        t += std::chrono::milliseconds(std::stoi(frac));
    }
    return t;
}

std::string format_utc(UtcTime t, const char* fmt) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm_buf;
    gmtime_r(&tt, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, fmt);
    return oss.str();
}

std::string format_iso_ms(UtcTime t) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << format_utc(t, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

std::vector<fs::path> glob_recursive(const fs::path& dir, const std::string& pattern) {
    std::vector<fs::path> out;
    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        return out;
    }

    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file() &&
            glob_match(pattern, entry.path().filename().string())) {
            out.push_back(entry.path());
        }
    }

    std::sort(out.begin(), out.end());
    return out;
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_file(const fs::path& path) {
    auto data = read_bytes(path);
    return sha256_bytes(data);
}

float compute_percentile(std::vector<float> values, float percentile) {
    if (values.empty()) return std::numeric_limits<float>::quiet_NaN();

    std::sort(values.begin(), values.end());

    float clamped = std::min(std::max(percentile, 0.0f), 100.0f);
    double idx = static_cast<double>(clamped) / 100.0 * static_cast<double>(values.size() - 1);
    size_t lower = static_cast<size_t>(idx);
    size_t upper = std::min(lower + 1, values.size() - 1);
    double frac = idx - static_cast<double>(lower);

    return static_cast<float>(values[lower] * (1.0 - frac) + values[upper] * frac);
}

float nan_percentile(const Matrix2Df& data, float percentile) {
    std::vector<float> finite;
    finite.reserve(static_cast<size_t>(data.size()));
    for (Eigen::Index i = 0; i < data.size(); ++i) {
        const float v = data.data()[i];
        if (std::isfinite(v)) finite.push_back(v);
    }
    return compute_percentile(std::move(finite), percentile);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

std::string shell_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '.': case '+': case '(': case ')': case '^': case '$':
            case '|': case '{': case '}': case '\\':
                regex_pattern += '\\';
                regex_pattern += c;
                break;
            default: regex_pattern += c; break;
        }
    }

    std::regex re(regex_pattern, std::regex::icase);
    return std::regex_match(str, re);
}

ScopedTempDir::ScopedTempDir(const fs::path& parent, const std::string& prefix) {
    fs::create_directories(parent);
    for (int attempt = 0; attempt < 100; ++attempt) {
        fs::path candidate = parent / (prefix + "_" + random_hex(8));
        if (fs::create_directory(candidate)) {
            path_ = candidate;
            return;
        }
    }
    throw IOError("Cannot create temporary directory under " + parent.string());
}

ScopedTempDir::~ScopedTempDir() {
    cleanup();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& o) noexcept
    : path_(std::move(o.path_)) {
    o.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& o) noexcept {
    if (this != &o) {
        cleanup();
        path_ = std::move(o.path_);
        o.path_.clear();
    }
    return *this;
}

void ScopedTempDir::cleanup() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    path_.clear();
}

} // namespace sar_compose::core
