// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace hostscope {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

enum class LogSink { Stderr, Journald, StderrAndJournald };

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& value, LogLevel& level);
bool parse_log_sink(const std::string& value, LogSink& sink);

/**
 * A single structured log record.
 *
 * Built fluently through the SLOG_* macros:
 *   logger().log(SLOG_INFO("Run started").field("family", "net"));
 */
class LogEntry {
  public:
    LogEntry(LogLevel level, std::string message, const char* file, int line);

    LogEntry& field(const std::string& key, const std::string& value);
    LogEntry& field(const std::string& key, const char* value);
    LogEntry& field(const std::string& key, int64_t value);
    LogEntry& field(const std::string& key, uint64_t value);
    LogEntry& field(const std::string& key, double value);
    LogEntry& field(const std::string& key, bool value);

    [[nodiscard]] LogLevel level() const { return level_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const char* file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }

    // Fields are stored pre-rendered: value is a JSON token when quoted is false.
    struct Field {
        std::string key;
        std::string value;
        bool quoted;
    };
    [[nodiscard]] const std::vector<Field>& fields() const { return fields_; }

  private:
    LogLevel level_;
    std::string message_;
    const char* file_;
    int line_;
    std::vector<Field> fields_;
};

class Logger {
  public:
    Logger();

    void log(const LogEntry& entry);

    void set_output(std::ostream* out);
    void set_json_format(bool json);
    void set_level(LogLevel level);
    void set_sink(LogSink sink);

    [[nodiscard]] LogLevel level() const;
    [[nodiscard]] bool json_format() const;

    // Apply HOSTSCOPE_LOG_LEVEL / HOSTSCOPE_LOG_FORMAT if set.
    void configure_from_env();

  private:
    std::string format_text(const LogEntry& entry) const;
    std::string format_json(const LogEntry& entry) const;

    mutable std::mutex mu_;
    std::ostream* out_;
    bool json_ = false;
    LogLevel level_ = LogLevel::Info;
    LogSink sink_ = LogSink::Stderr;
};

Logger& logger();

} // namespace hostscope

#define SLOG_DEBUG(msg) ::hostscope::LogEntry(::hostscope::LogLevel::Debug, (msg), __FILE__, __LINE__)
#define SLOG_INFO(msg) ::hostscope::LogEntry(::hostscope::LogLevel::Info, (msg), __FILE__, __LINE__)
#define SLOG_WARN(msg) ::hostscope::LogEntry(::hostscope::LogLevel::Warn, (msg), __FILE__, __LINE__)
#define SLOG_ERROR(msg) ::hostscope::LogEntry(::hostscope::LogLevel::Error, (msg), __FILE__, __LINE__)
