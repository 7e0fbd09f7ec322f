// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hostscope {

// String helpers
std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split_whitespace(const std::string& s);
std::vector<std::string> split(const std::string& s, char delim);
std::vector<std::string> split_lines(const std::string& content, bool skip_empty = true);
bool is_all_digits(const std::string& s);

// Numeric parsing; returns false on any trailing garbage or overflow.
bool parse_uint64(const std::string& s, uint64_t& out);
bool parse_int64(const std::string& s, int64_t& out);
bool parse_hex_uint64(const std::string& s, uint64_t& out);
bool parse_seconds(const std::string& s, double& out);

// JSON text helpers
std::string json_escape(const std::string& s);
std::string json_quote(const std::string& s);
std::string json_string_array(const std::vector<std::string>& values);

/**
 * Locate the raw value of a top-level member of a JSON object.
 *
 * Only keys at depth 1 are considered, so nested objects with the same key
 * name are never matched. On success, `value` holds the raw JSON token
 * (string with quotes, number, literal, array or object).
 */
bool find_json_member(const std::string& object, const std::string& key, std::string& value);
bool extract_json_string(const std::string& object, const std::string& key, std::string& out);
bool extract_json_uint64(const std::string& object, const std::string& key, uint64_t& out);

// Split a JSON array of objects into the raw text of each element object.
bool split_json_array_objects(const std::string& array, std::vector<std::string>& objects);

// Environment
std::string env_or_default(const char* name, const std::string& fallback);

// Timestamps
std::string iso_utc_timestamp();
std::string run_timestamp();

} // namespace hostscope
