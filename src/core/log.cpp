#include <timber_mcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace timber_mcp {

namespace {

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &time_t_now);
#else
    gmtime_r(&time_t_now, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

// Escape a string for JSON output (handles \, ", and control characters).
void JsonEscape(std::ostream& out, std::string_view s) {
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u"
                        << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
}

void WritePlainLine(std::ostream& out, LogLevel level,
                    std::string_view component, std::string_view message) {
    out << Iso8601Now()
        << " [" << LogLevelName(level) << "] "
        << "[" << component << "] "
        << message << '\n';
}

void WriteJsonLine(std::ostream& out, LogLevel level,
                   std::string_view component, std::string_view message) {
    out << "{\"ts\":\"" << Iso8601Now()
        << "\",\"level\":\"" << LogLevelName(level)
        << "\",\"component\":\"";
    JsonEscape(out, component);
    out << "\",\"message\":\"";
    JsonEscape(out, message);
    out << "\"}\n";
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

Result<LogLevel, std::string> ParseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Result<LogLevel, std::string>::Ok(LogLevel::Debug);
    if (lower == "info") return Result<LogLevel, std::string>::Ok(LogLevel::Info);
    if (lower == "warn" || lower == "warning") {
        return Result<LogLevel, std::string>::Ok(LogLevel::Warn);
    }
    if (lower == "error") return Result<LogLevel, std::string>::Ok(LogLevel::Error);
    return Result<LogLevel, std::string>::Err(
        "Unknown log level '" + std::string(text) +
        "' (expected debug, info, warn or error)");
}

// ---------------------------------------------------------------------------
// ConsoleSink
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    WritePlainLine(out_, level, component, message);
}

void ConsoleSink::Flush() {
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    WriteJsonLine(out_, level, component, message);
}

void JsonSink::Flush() {
    out_.flush();
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
Result<std::unique_ptr<FileSink>, Error> FileSink::Open(const std::string& path,
                                                        bool json) {
    std::ofstream file(path, std::ios::out | std::ios::app);
    if (!file) {
        return Result<std::unique_ptr<FileSink>, Error>::Err(Error{
            "OpenLogFile", path, std::nullopt,
            "Cannot open log file for appending", std::nullopt,
            ErrorCategory::Config});
    }
    return Result<std::unique_ptr<FileSink>, Error>::Ok(
        std::unique_ptr<FileSink>(new FileSink(std::move(file), json)));
}

FileSink::FileSink(std::ofstream file, bool json)
    : file_(std::move(file)), json_(json) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (json_) {
        WriteJsonLine(file_, level, component, message);
    } else {
        WritePlainLine(file_, level, component, message);
    }
}

void FileSink::Flush() {
    file_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

Logger::Logger(Logger&& other) noexcept
    : sink_(std::move(other.sink_)), min_level_(other.min_level_) {}

Logger Logger::Null() {
    return Logger(std::make_unique<NullSink>(), LogLevel::Error);
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) sink_->Flush();
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_ && static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message);
    }
}

} // namespace timber_mcp
