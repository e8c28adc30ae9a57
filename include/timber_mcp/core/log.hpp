#pragma once

#include <timber_mcp/core/result.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace timber_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

const char* LogLevelName(LogLevel level);

// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
Result<LogLevel, std::string> ParseLogLevel(std::string_view text);

// Abstract log sink: implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
    virtual void Flush() {}
};

// Human-readable lines to a stream (stderr by default).
// Stdout carries protocol traffic and must never be used here.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
    void Flush() override;

private:
    std::ostream& out_;
};

// JSON sink: machine-readable JSON lines to a stream.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
    void Flush() override;

private:
    std::ostream& out_;
};

// Appends to a log file, either as plain lines or JSON lines.
class FileSink : public ILogSink {
public:
    static Result<std::unique_ptr<FileSink>, Error> Open(const std::string& path,
                                                         bool json);

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
    void Flush() override;

private:
    FileSink(std::ofstream file, bool json);

    std::ofstream file_;
    bool json_;
};

// Discards everything.
class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

// ---------------------------------------------------------------------------
// Logger: dispatches to a sink above a minimum level.
//
// Constructed once in main() and passed by reference to the components that
// log. Flush() is the teardown step on normal exit.
// ---------------------------------------------------------------------------
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    // A logger that discards everything.
    static Logger Null();

    Logger(Logger&& other) noexcept;
    Logger& operator=(Logger&&) = delete;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void SetLevel(LogLevel level);
    [[nodiscard]] LogLevel Level() const;

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

    void Flush();

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

} // namespace timber_mcp
