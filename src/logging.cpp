// cppcheck-suppress-file missingIncludeSystem
#include "logging.hpp"

#ifdef HAVE_SYSTEMD
#include <systemd/sd-journal.h>
#endif

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "utils.hpp"

namespace hostscope {

namespace {

std::string log_timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

const char* base_name(const char* path)
{
    const char* base = path;
    for (const char* p = path; *p != '\0'; ++p) {
        if (*p == '/') {
            base = p + 1;
        }
    }
    return base;
}

#ifdef HAVE_SYSTEMD
int journald_priority(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warn:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
    }
    return LOG_INFO;
}

void journal_send(const LogEntry& entry, const std::string& rendered)
{
    sd_journal_send("MESSAGE=%s", entry.message().c_str(), "PRIORITY=%i", journald_priority(entry.level()),
                    "SYSLOG_IDENTIFIER=hostscope", "HOSTSCOPE_FIELDS=%s", rendered.c_str(), "CODE_FILE=%s",
                    entry.file(), "CODE_LINE=%d", entry.line(), nullptr);
}
#endif

} // namespace

const char* log_level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& value, LogLevel& level)
{
    const std::string lowered = to_lower(value);
    if (lowered == "debug") {
        level = LogLevel::Debug;
    } else if (lowered == "info") {
        level = LogLevel::Info;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::Warn;
    } else if (lowered == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

bool parse_log_sink(const std::string& value, LogSink& sink)
{
    if (value == "stderr") {
        sink = LogSink::Stderr;
    } else if (value == "journald") {
        sink = LogSink::Journald;
    } else if (value == "both") {
        sink = LogSink::StderrAndJournald;
    } else {
        return false;
    }
    return true;
}

LogEntry::LogEntry(LogLevel level, std::string message, const char* file, int line)
    : level_(level), message_(std::move(message)), file_(file), line_(line)
{
}

LogEntry& LogEntry::field(const std::string& key, const std::string& value)
{
    fields_.push_back({key, value, true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, const char* value)
{
    fields_.push_back({key, value != nullptr ? std::string(value) : std::string(), true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, int64_t value)
{
    fields_.push_back({key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, uint64_t value)
{
    fields_.push_back({key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, double value)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    fields_.push_back({key, oss.str(), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, bool value)
{
    fields_.push_back({key, value ? "true" : "false", false});
    return *this;
}

Logger::Logger() : out_(&std::cerr) {}

void Logger::log(const LogEntry& entry)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (entry.level() < level_) {
        return;
    }

    const std::string rendered = json_ ? format_json(entry) : format_text(entry);
    if (sink_ != LogSink::Journald && out_ != nullptr) {
        *out_ << rendered << '\n';
        out_->flush();
    }
#ifdef HAVE_SYSTEMD
    if (sink_ != LogSink::Stderr) {
        journal_send(entry, json_ ? rendered : format_json(entry));
    }
#endif
}

void Logger::set_output(std::ostream* out)
{
    std::lock_guard<std::mutex> lock(mu_);
    out_ = out;
}

void Logger::set_json_format(bool json)
{
    std::lock_guard<std::mutex> lock(mu_);
    json_ = json;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

void Logger::set_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mu_);
#ifndef HAVE_SYSTEMD
    // Built without libsystemd; journald output degrades to stderr.
    sink = LogSink::Stderr;
#endif
    sink_ = sink;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

bool Logger::json_format() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return json_;
}

void Logger::configure_from_env()
{
    const char* level_env = std::getenv("HOSTSCOPE_LOG_LEVEL");
    if (level_env != nullptr && *level_env != '\0') {
        LogLevel parsed = LogLevel::Info;
        if (parse_log_level(level_env, parsed)) {
            set_level(parsed);
        }
    }
    const char* format_env = std::getenv("HOSTSCOPE_LOG_FORMAT");
    if (format_env != nullptr && *format_env != '\0') {
        set_json_format(to_lower(format_env) == "json");
    }
}

std::string Logger::format_text(const LogEntry& entry) const
{
    std::ostringstream oss;
    oss << log_timestamp() << " [" << log_level_name(entry.level()) << "] " << entry.message();
    for (const auto& f : entry.fields()) {
        oss << ' ' << f.key << '=';
        if (f.quoted && f.value.find(' ') != std::string::npos) {
            oss << '"' << f.value << '"';
        } else {
            oss << f.value;
        }
    }
    return oss.str();
}

std::string Logger::format_json(const LogEntry& entry) const
{
    std::ostringstream oss;
    oss << "{\"ts\":\"" << log_timestamp() << "\",\"level\":\"" << log_level_name(entry.level())
        << "\",\"message\":\"" << json_escape(entry.message()) << "\",\"src\":\"" << base_name(entry.file()) << ':'
        << entry.line() << "\"";
    for (const auto& f : entry.fields()) {
        oss << ",\"" << json_escape(f.key) << "\":";
        if (f.quoted) {
            oss << '"' << json_escape(f.value) << '"';
        } else {
            oss << f.value;
        }
    }
    oss << "}";
    return oss.str();
}

Logger& logger()
{
    static Logger instance;
    return instance;
}

} // namespace hostscope
