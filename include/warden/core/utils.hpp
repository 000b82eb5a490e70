#ifndef warden_CORE_UTILS_HPP
#define warden_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace warden {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int64_t milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic clock in milliseconds (for deadlines, not for display)
int64_t monotonic_ms();

// Format a millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Split on any of the given delimiter characters; runs of delimiters
// produce no empty parts.
std::vector<std::string> split_any(const std::string& s, const std::string& delimiters);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ Path utilities ============

// Normalize path (resolve . and .., collapse repeated slashes)
std::string normalize_path(const std::string& path);

// Parent of an absolute path ("/a/b" -> "/a", "/a" -> "/")
std::string parent_path(const std::string& path);

// True if path equals root or lies beneath it
bool path_is_under(const std::string& path, const std::string& root);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Hashing utilities ============

// Lowercase hex SHA-256 of the input bytes
std::string sha256_hex(const std::string& data);

// ============ Encoding utilities ============

std::string base64_encode(const std::string& data);

// Returns false on malformed input
bool base64_decode(const std::string& text, std::string& out);

} // namespace warden

#endif // warden_CORE_UTILS_HPP
