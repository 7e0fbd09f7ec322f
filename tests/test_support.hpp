// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <sys/stat.h>
#include <unistd.h>

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace hostscope {
namespace testing_support {

class ScopedEnvVar {
  public:
    ScopedEnvVar(const char* key, const std::string& value) : key_(key)
    {
        const char* current = std::getenv(key_);
        if (current != nullptr) {
            had_previous_ = true;
            previous_ = current;
        }
        setenv(key_, value.c_str(), 1);
    }

    ~ScopedEnvVar()
    {
        if (had_previous_) {
            setenv(key_, previous_.c_str(), 1);
        } else {
            unsetenv(key_);
        }
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

  private:
    const char* key_;
    bool had_previous_{false};
    std::string previous_;
};

inline std::filesystem::path make_test_dir(const std::string& name)
{
    auto dir = std::filesystem::temp_directory_path() / ("hostscope_" + name + "_" + std::to_string(getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void write_text(const std::filesystem::path& path, const std::string& content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

inline std::string read_text(const std::filesystem::path& path)
{
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void make_executable(const std::filesystem::path& path)
{
    ::chmod(path.c_str(), 0755);
}

inline bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

// Strict JSON well-formedness check: RFC 8259 grammar, raw string bytes must
// be valid UTF-8, no trailing content. Returns false with the failing offset.
class JsonChecker {
  public:
    explicit JsonChecker(const std::string& text) : s_(text) {}

    bool check(std::string& error)
    {
        skip_ws();
        if (!value(0)) {
            error = "invalid JSON at offset " + std::to_string(pos_);
            return false;
        }
        skip_ws();
        if (pos_ != s_.size()) {
            error = "trailing content at offset " + std::to_string(pos_);
            return false;
        }
        return true;
    }

  private:
    static constexpr int kMaxDepth = 64;

    unsigned char at(size_t i) const { return i < s_.size() ? static_cast<unsigned char>(s_[i]) : 0; }

    void skip_ws()
    {
        while (pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\n' || s_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool literal(const char* word)
    {
        const std::string w(word);
        if (s_.compare(pos_, w.size(), w) != 0) {
            return false;
        }
        pos_ += w.size();
        return true;
    }

    bool value(int depth)
    {
        if (depth > kMaxDepth || pos_ >= s_.size()) {
            return false;
        }
        switch (s_[pos_]) {
            case '{':
                return object(depth + 1);
            case '[':
                return array(depth + 1);
            case '"':
                return string();
            case 't':
                return literal("true");
            case 'f':
                return literal("false");
            case 'n':
                return literal("null");
            default:
                return number();
        }
    }

    bool object(int depth)
    {
        ++pos_;
        skip_ws();
        if (at(pos_) == '}') {
            ++pos_;
            return true;
        }
        while (true) {
            skip_ws();
            if (at(pos_) != '"' || !string()) {
                return false;
            }
            skip_ws();
            if (at(pos_) != ':') {
                return false;
            }
            ++pos_;
            skip_ws();
            if (!value(depth)) {
                return false;
            }
            skip_ws();
            if (at(pos_) == ',') {
                ++pos_;
                continue;
            }
            if (at(pos_) == '}') {
                ++pos_;
                return true;
            }
            return false;
        }
    }

    bool array(int depth)
    {
        ++pos_;
        skip_ws();
        if (at(pos_) == ']') {
            ++pos_;
            return true;
        }
        while (true) {
            skip_ws();
            if (!value(depth)) {
                return false;
            }
            skip_ws();
            if (at(pos_) == ',') {
                ++pos_;
                continue;
            }
            if (at(pos_) == ']') {
                ++pos_;
                return true;
            }
            return false;
        }
    }

    static bool is_hex(unsigned char c)
    {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    bool utf8_sequence()
    {
        const unsigned char lead = at(pos_);
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            lo = lead == 0xE0 ? 0xA0 : 0x80;
            hi = lead == 0xED ? 0x9F : 0xBF;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            lo = lead == 0xF0 ? 0x90 : 0x80;
            hi = lead == 0xF4 ? 0x8F : 0xBF;
        } else {
            return false;
        }
        if (pos_ + len > s_.size() || at(pos_ + 1) < lo || at(pos_ + 1) > hi) {
            return false;
        }
        for (size_t k = 2; k < len; ++k) {
            if (at(pos_ + k) < 0x80 || at(pos_ + k) > 0xBF) {
                return false;
            }
        }
        pos_ += len;
        return true;
    }

    bool string()
    {
        ++pos_;
        while (pos_ < s_.size()) {
            const unsigned char c = at(pos_);
            if (c == '"') {
                ++pos_;
                return true;
            }
            if (c < 0x20) {
                return false;
            }
            if (c == '\\') {
                const unsigned char e = at(pos_ + 1);
                if (e == 'u') {
                    for (size_t k = 2; k < 6; ++k) {
                        if (!is_hex(at(pos_ + k))) {
                            return false;
                        }
                    }
                    pos_ += 6;
                } else if (e == '"' || e == '\\' || e == '/' || e == 'b' || e == 'f' || e == 'n' || e == 'r' ||
                           e == 't') {
                    pos_ += 2;
                } else {
                    return false;
                }
                continue;
            }
            if (c >= 0x80) {
                if (!utf8_sequence()) {
                    return false;
                }
                continue;
            }
            ++pos_;
        }
        return false;
    }

    bool digits()
    {
        const size_t start = pos_;
        while (at(pos_) >= '0' && at(pos_) <= '9') {
            ++pos_;
        }
        return pos_ > start;
    }

    bool number()
    {
        if (at(pos_) == '-') {
            ++pos_;
        }
        if (at(pos_) == '0') {
            ++pos_;
        } else if (!digits()) {
            return false;
        }
        if (at(pos_) == '.') {
            ++pos_;
            if (!digits()) {
                return false;
            }
        }
        if (at(pos_) == 'e' || at(pos_) == 'E') {
            ++pos_;
            if (at(pos_) == '+' || at(pos_) == '-') {
                ++pos_;
            }
            if (!digits()) {
                return false;
            }
        }
        return true;
    }

    const std::string& s_;
    size_t pos_{0};
};

inline bool is_valid_json(const std::string& text, std::string& error)
{
    return JsonChecker(text).check(error);
}

} // namespace testing_support
} // namespace hostscope
