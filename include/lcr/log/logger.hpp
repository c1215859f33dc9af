#pragma once

#include <mutex>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

// Human-readable severity names
[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
        case Level::Off:   return "OFF";
    }
    return "?????";
}

// Maps a lowercase level name ("trace", "debug", ...) to a Level.
// Returns false and leaves `out` untouched for unknown names.
[[nodiscard]]
inline bool parse_level(std::string_view name, Level& out) noexcept {
    if (name == "trace")      { out = Level::Trace; return true; }
    if (name == "debug")      { out = Level::Debug; return true; }
    if (name == "info")       { out = Level::Info;  return true; }
    if (name == "warn")       { out = Level::Warn;  return true; }
    if (name == "error")      { out = Level::Error; return true; }
    if (name == "fatal")      { out = Level::Fatal; return true; }
    if (name == "off")        { out = Level::Off;   return true; }
    return false;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
// Writes to std::cerr by default: stdout is reserved for program data
// (bbcat streams raw bytes there).
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }

    [[nodiscard]] Level level() const noexcept { return level_; }

    [[nodiscard]] bool enabled(Level lvl) const noexcept {
        return lvl >= level_ && level_ != Level::Off;
    }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cerr;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << to_string(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << '\n';
        os.flush();
    }

private:
    Logger()
        : out_(&std::cerr),
          level_(Level::Info),
          color_enabled_(false)
    {}

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
            case Level::Off:   break;
        }
        return "\033[0m";
    }

    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros
// ---------------------------------------------------------
// The level check happens before the message is formatted, so disabled
// levels cost one comparison.
#define BB_LOG_LEVEL(lvl, msg)                                              \
    do {                                                                    \
        if (::lcr::log::Logger::instance().enabled((lvl))) {                \
            ::lcr::log::LogStream((lvl)) << msg;                            \
        }                                                                   \
    } while (0)

#define BB_TRACE(msg)  BB_LOG_LEVEL(::lcr::log::Level::Trace, msg)
#define BB_DEBUG(msg)  BB_LOG_LEVEL(::lcr::log::Level::Debug, msg)
#define BB_INFO(msg)   BB_LOG_LEVEL(::lcr::log::Level::Info,  msg)
#define BB_WARN(msg)   BB_LOG_LEVEL(::lcr::log::Level::Warn,  msg)
#define BB_ERROR(msg)  BB_LOG_LEVEL(::lcr::log::Level::Error, msg)
#define BB_FATAL(msg)  BB_LOG_LEVEL(::lcr::log::Level::Fatal, msg)
