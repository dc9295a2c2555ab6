#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sar_compose::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// "YYYYMMDDThhmmss" (UTC). Throws ParseError.
UtcTime parse_compact_utc(const std::string& text);
// "YYYY-MM-DD" or "YYYY-MM-DDThh:mm:ss[.fff]Z" (UTC). Throws ParseError.
UtcTime parse_iso_utc(const std::string& text);
// strftime-style formatting in UTC
std::string format_utc(UtcTime t, const char* fmt);
// "YYYY-MM-DDThh:mm:ss.000Z"
std::string format_iso_ms(UtcTime t);

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
std::vector<fs::path> glob_recursive(const fs::path& dir, const std::string& pattern);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities
// Linear-interpolated percentile of the finite values; NaN if there are none.
float nan_percentile(const Matrix2Df& data, float percentile);
float compute_percentile(std::vector<float> values, float percentile);

// String utilities
std::string to_lower(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string shell_quote(const std::string& s);

// Glob pattern matching (case-insensitive, '*' and '?')
bool glob_match(const std::string& pattern, const std::string& str);

// Directory removed with its content when the owner goes out of scope.
class ScopedTempDir {
public:
    ScopedTempDir() = default;
    explicit ScopedTempDir(const fs::path& parent, const std::string& prefix = "tmp");
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ScopedTempDir(ScopedTempDir&& o) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& o) noexcept;

    const fs::path& path() const { return path_; }
    void cleanup();

private:
    fs::path path_;
};

} // namespace sar_compose::core
