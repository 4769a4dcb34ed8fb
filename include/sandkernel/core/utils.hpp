#ifndef sandkernel_CORE_UTILS_HPP
#define sandkernel_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace sandkernel {

// ============ Time utilities ============

void sleep_ms(int milliseconds);

// Unix timestamp in seconds
int64_t current_timestamp();

// Monotonic clock in milliseconds, for deadlines and durations
int64_t monotonic_ms();

// ISO 8601 (YYYY-MM-DDTHH:MM:SSZ) from unix seconds
std::string format_timestamp(int64_t timestamp);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
std::vector<std::string> split(const std::string& s, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate without breaking a UTF-8 multi-byte sequence
std::string truncate_safe(const std::string& s, size_t max_len);

// ============ Path utilities ============

// Lexically resolve "." and ".." segments and collapse repeated slashes
std::string normalize_path(const std::string& path);

std::string join_path(const std::string& a, const std::string& b);

// Last path component ("a/b/c.csv" -> "c.csv")
std::string base_name(const std::string& path);

// Lowercased extension without the dot ("Report.XLSX" -> "xlsx")
std::string file_extension(const std::string& path);

// Recursive mkdir, mode 0700
bool ensure_directory(const std::string& path);

bool create_parent_directory(const std::string& filepath);

// Recursively delete a directory tree
bool remove_tree(const std::string& path);

bool read_file(const std::string& path, std::string& out);

// ============ UUID utilities ============

// Random UUID v4
std::string generate_uuid();

// ============ Hashing / encoding utilities ============

std::string sha256_hex(const std::string& data);

std::string base64_encode(const std::string& data);

// False for malformed input
bool base64_decode(const std::string& text, std::string& out);

} // namespace sandkernel

#endif // sandkernel_CORE_UTILS_HPP
