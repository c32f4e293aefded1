#include <pocketbase/core/log.hpp>
#include <pocketbase/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pocketbase {

namespace {

constexpr std::string_view kRedacted = "<redacted>";

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

// UTC with milliseconds for files and plain output, local HH:MM:SS for the
// interactive sink.
std::string Timestamp(bool utc) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm tm{};
#ifdef _WIN32
    utc ? gmtime_s(&tm, &seconds) : localtime_s(&tm, &seconds);
#else
    utc ? gmtime_r(&seconds, &tm) : localtime_r(&seconds, &tm);
#endif

    std::ostringstream oss;
    if (!utc) {
        oss << std::put_time(&tm, "%H:%M:%S");
        return oss.str();
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

void WritePlainLine(std::ostream& out, LogLevel level,
                    std::string_view component, std::string_view message) {
    out << Timestamp(true) << " [" << LevelName(level) << "] [" << component
        << "] " << message << '\n';
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

std::string RedactSecrets(std::string_view message) {
    std::string out(message);

    // Authorization header values: "Bearer <token>".
    constexpr std::string_view kBearer = "Bearer ";
    for (auto pos = out.find(kBearer); pos != std::string::npos;
         pos = out.find(kBearer, pos)) {
        const auto start = pos + kBearer.size();
        auto end = start;
        while (end < out.size() && !IsSpace(out[end]) && out[end] != '"') {
            ++end;
        }
        if (end > start) {
            out.replace(start, end - start, kRedacted);
            end = start + kRedacted.size();
        }
        pos = end;
    }

    // Auth response bodies: "token": "<jwt>".
    constexpr std::string_view kTokenKey = "\"token\"";
    for (auto pos = out.find(kTokenKey); pos != std::string::npos;
         pos = out.find(kTokenKey, pos)) {
        auto i = pos + kTokenKey.size();
        while (i < out.size() && IsSpace(out[i])) ++i;
        if (i >= out.size() || out[i] != ':') {
            pos = i;
            continue;
        }
        ++i;
        while (i < out.size() && IsSpace(out[i])) ++i;
        if (i >= out.size() || out[i] != '"') {
            pos = i;
            continue;
        }
        const auto start = i + 1;
        auto end = start;
        while (end < out.size() && out[end] != '"') {
            end += (out[end] == '\\' && end + 1 < out.size()) ? 2 : 1;
        }
        out.replace(start, end - start, kRedacted);
        pos = start + kRedacted.size();
    }
    return out;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    WritePlainLine(std::cerr, level, component, message);
}

ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlainLine(out_, level, component, message);
        return;
    }

    const auto* color = LevelColor(level);
    std::string tag = LevelName(level);
    tag.resize(5, ' ');
    out_ << ansi::kDim << Timestamp(false) << ansi::kReset << ' '
         << color << tag << ansi::kReset << ' '
         << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json line = {
        {"ts", Timestamp(true)},
        {"level", LevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Response bodies may carry invalid UTF-8.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

FileSink::FileSink(const std::string& path)
    : file_(path, std::ios::out | std::ios::app), json_(file_) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    json_.Write(level, component, message);
    file_.flush();
}

TeeSink::TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    first_->Write(level, component, message);
    second_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
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

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    sink_->Write(level, component, RedactSecrets(message));
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
namespace {

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace pocketbase
