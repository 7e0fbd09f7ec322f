// cppcheck-suppress-file missingIncludeSystem
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hostscope {

namespace {

void skip_ws(const std::string& s, size_t& pos)
{
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
}

// Advance past a JSON string starting at the opening quote.
bool skip_json_string(const std::string& s, size_t& pos)
{
    if (pos >= s.size() || s[pos] != '"') {
        return false;
    }
    ++pos;
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '\\') {
            ++pos;
        } else if (c == '"') {
            return true;
        }
    }
    return false;
}

// Advance past any JSON value. Containers are skipped by bracket depth.
bool skip_json_value(const std::string& s, size_t& pos)
{
    skip_ws(s, pos);
    if (pos >= s.size()) {
        return false;
    }
    char c = s[pos];
    if (c == '"') {
        return skip_json_string(s, pos);
    }
    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < s.size()) {
            char ch = s[pos];
            if (ch == '"') {
                if (!skip_json_string(s, pos)) {
                    return false;
                }
                continue;
            }
            if (ch == '{' || ch == '[') {
                ++depth;
            } else if (ch == '}' || ch == ']') {
                --depth;
                if (depth == 0) {
                    ++pos;
                    return true;
                }
            }
            ++pos;
        }
        return false;
    }
    while (pos < s.size() && s[pos] != ',' && s[pos] != '}' && s[pos] != ']' &&
           !std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    return true;
}

std::string unescape_json_string(const std::string& raw)
{
    // raw includes the surrounding quotes
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\' || i + 2 >= raw.size()) {
            out.push_back(c);
            continue;
        }
        char esc = raw[++i];
        switch (esc) {
            case 'n':
                out.push_back('\n');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'u': {
                if (i + 4 >= raw.size()) {
                    return out;
                }
                unsigned int code = static_cast<unsigned int>(std::strtoul(raw.substr(i + 1, 4).c_str(), nullptr, 16));
                out.push_back(code <= 0x7f ? static_cast<char>(code) : '?');
                i += 4;
                break;
            }
            default:
                out.push_back(esc);
                break;
        }
    }
    return out;
}

} // namespace

std::string trim(const std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_whitespace(const std::string& s)
{
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        out.push_back(token);
    }
    return out;
}

std::vector<std::string> split(const std::string& s, char delim)
{
    std::vector<std::string> out;
    std::string current;
    for (char c : s) {
        if (c == delim) {
            out.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    out.push_back(current);
    return out;
}

std::vector<std::string> split_lines(const std::string& content, bool skip_empty)
{
    std::vector<std::string> out;
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        std::string t = trim(line);
        if (skip_empty && t.empty()) {
            continue;
        }
        out.push_back(t);
    }
    return out;
}

bool is_all_digits(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool parse_uint64(const std::string& s, uint64_t& out)
{
    if (!is_all_digits(s)) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = static_cast<uint64_t>(v);
    return true;
}

bool parse_int64(const std::string& s, int64_t& out)
{
    if (s.empty()) {
        return false;
    }
    const std::string digits = (s[0] == '-' || s[0] == '+') ? s.substr(1) : s;
    if (!is_all_digits(digits)) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(v);
    return true;
}

bool parse_hex_uint64(const std::string& s, uint64_t& out)
{
    std::string digits = s;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 16) {
        return false;
    }
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    out = static_cast<uint64_t>(std::strtoull(digits.c_str(), nullptr, 16));
    return true;
}

bool parse_seconds(const std::string& s, double& out)
{
    if (s.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == nullptr || *end != '\0' || !std::isfinite(v)) {
        return false;
    }
    out = v;
    return true;
}

namespace {

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 if the
// bytes there are not one (overlong forms and surrogates included).
size_t utf8_sequence_length(const std::string& s, size_t i)
{
    const auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    const unsigned char lead = byte(i);
    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) {
            lo = 0xA0;
        } else if (lead == 0xED) {
            hi = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) {
            lo = 0x90;
        } else if (lead == 0xF4) {
            hi = 0x8F;
        }
    } else {
        return 0;
    }
    if (i + len > s.size()) {
        return 0;
    }
    if (byte(i + 1) < lo || byte(i + 1) > hi) {
        return 0;
    }
    for (size_t k = 2; k < len; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) {
            return 0;
        }
    }
    return len;
}

} // namespace

std::string json_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        if (static_cast<unsigned char>(c) >= 0x80) {
            const size_t len = utf8_sequence_length(s, i);
            if (len == 0) {
                // Not UTF-8 (kernel names are raw bytes): one replacement character per byte.
                out += "\\ufffd";
                ++i;
            } else {
                out.append(s, i, len);
                i += len;
            }
            continue;
        }
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
        ++i;
    }
    return out;
}

std::string json_quote(const std::string& s)
{
    return "\"" + json_escape(s) + "\"";
}

std::string json_string_array(const std::vector<std::string>& values)
{
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += json_quote(values[i]);
    }
    out += "]";
    return out;
}

bool find_json_member(const std::string& object, const std::string& key, std::string& value)
{
    size_t pos = 0;
    skip_ws(object, pos);
    if (pos >= object.size() || object[pos] != '{') {
        return false;
    }
    ++pos;
    while (pos < object.size()) {
        skip_ws(object, pos);
        if (pos < object.size() && object[pos] == '}') {
            return false;
        }
        size_t key_start = pos;
        if (!skip_json_string(object, pos)) {
            return false;
        }
        const std::string member = unescape_json_string(object.substr(key_start, pos - key_start));
        skip_ws(object, pos);
        if (pos >= object.size() || object[pos] != ':') {
            return false;
        }
        ++pos;
        skip_ws(object, pos);
        size_t value_start = pos;
        if (!skip_json_value(object, pos)) {
            return false;
        }
        if (member == key) {
            value = object.substr(value_start, pos - value_start);
            return true;
        }
        skip_ws(object, pos);
        if (pos < object.size() && object[pos] == ',') {
            ++pos;
        }
    }
    return false;
}

bool extract_json_string(const std::string& object, const std::string& key, std::string& out)
{
    std::string raw;
    if (!find_json_member(object, key, raw) || raw.size() < 2 || raw.front() != '"') {
        return false;
    }
    out = unescape_json_string(raw);
    return true;
}

bool extract_json_uint64(const std::string& object, const std::string& key, uint64_t& out)
{
    std::string raw;
    if (!find_json_member(object, key, raw)) {
        return false;
    }
    return parse_uint64(raw, out);
}

bool split_json_array_objects(const std::string& array, std::vector<std::string>& objects)
{
    size_t pos = 0;
    skip_ws(array, pos);
    if (pos >= array.size() || array[pos] != '[') {
        return false;
    }
    ++pos;
    while (true) {
        skip_ws(array, pos);
        if (pos >= array.size()) {
            return false;
        }
        if (array[pos] == ']') {
            return true;
        }
        if (array[pos] != '{') {
            return false;
        }
        size_t start = pos;
        if (!skip_json_value(array, pos)) {
            return false;
        }
        objects.push_back(array.substr(start, pos - start));
        skip_ws(array, pos);
        if (pos < array.size() && array[pos] == ',') {
            ++pos;
        }
    }
}

std::string env_or_default(const char* name, const std::string& fallback)
{
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return fallback;
}

std::string iso_utc_timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return oss.str();
}

std::string run_timestamp()
{
    const std::time_t secs = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace hostscope
