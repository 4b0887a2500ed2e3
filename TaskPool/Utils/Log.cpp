#include "Log.h"
#include "ThreadName.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <functional>
#include <thread>
#include <vector>

namespace taskpool::log {

    static std::string fmt_v(const char* fmt, std::va_list ap) {
        std::va_list ap2; va_copy(ap2, ap);
        const int n = std::vsnprintf(nullptr, 0, fmt, ap2);
        va_end(ap2);
        if (n <= 0) return {};
        std::vector<char> buf(static_cast<size_t>(n) + 1);
        std::vsnprintf(buf.data(), buf.size(), fmt, ap);
        return std::string(buf.data(), static_cast<size_t>(n));
    }

    static const char* level_color(Level lv) noexcept {
        switch (lv) {
        case Level::Trace: return "\x1b[90m";
        case Level::Debug: return "\x1b[36m";
        case Level::Info:  return "\x1b[37m";
        case Level::Warn:  return "\x1b[33m";
        case Level::Error: return "\x1b[31m";
        default:           return "\x1b[41;97m";
        }
    }

    const char* level_name(Level lv) noexcept {
        switch (lv) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
        default:           return "     ";
        }
    }

    std::optional<Level> parse_level(std::string_view s) {
        std::string v(s);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        if (v == "trace") return Level::Trace;
        if (v == "debug") return Level::Debug;
        if (v == "info") return Level::Info;
        if (v == "warn" || v == "warning") return Level::Warn;
        if (v == "error") return Level::Error;
        if (v == "fatal") return Level::Fatal;
        if (v == "off" || v == "none") return Level::Off;
        return std::nullopt;
    }

    Logger& Logger::get() {
        static Logger g;
        return g;
    }

    Logger::~Logger() { close_file(); }

    void Logger::set_console_level(Level lv) { console_level_.store(lv); }
    void Logger::set_file_level(Level lv) { file_level_.store(lv); }
    void Logger::set_levels(Level console, Level file) { set_console_level(console); set_file_level(file); }

    void Logger::enable_colors(bool on) {
        std::lock_guard<std::mutex> lk(m_);
        colors_ = on;
    }

    bool Logger::open_file(const char* path, bool append) {
        std::lock_guard<std::mutex> lk(m_);
        if (file_) { std::fclose(file_); file_ = nullptr; }
        file_ = std::fopen(path, append ? "a" : "w");
        file_open_.store(file_ != nullptr);
        return file_ != nullptr;
    }

    void Logger::close_file() {
        std::lock_guard<std::mutex> lk(m_);
        if (file_) { std::fflush(file_); std::fclose(file_); file_ = nullptr; }
        file_open_.store(false);
    }

    void Logger::vlogf(Level lv, const char* file, int line, const char* func,
        const char* fmt, std::va_list ap) noexcept {
        try {
            // Build the message first (so we don't hold the mutex during heavy formatting)
            std::string msg = fmt_v(fmt, ap);

            auto now = std::chrono::system_clock::now();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
            std::time_t t = std::chrono::system_clock::to_time_t(now);
            std::tm tm{};
            localtime_r(&t, &tm);
            char ts[32];
            std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03lld",
                tm.tm_hour, tm.tm_min, tm.tm_sec, (long long)(ms % 1000));

            std::string who = utils::this_thread_name();
            if (who.empty()) {
                auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
                who = "T" + std::to_string(tid % 100000);
            }

            std::lock_guard<std::mutex> lk(m_);
            const char* rel = shorten_path_(file);
            char head[256];
            std::snprintf(head, sizeof(head), "[%s] [%s] [%s] (%s:%d %s) ",
                ts, level_name(lv), who.c_str(), rel, line, func);

            if (lv >= console_level_.load()) {
                if (colors_) std::fputs(level_color(lv), stderr);
                std::fputs(head, stderr);
                std::fputs(msg.c_str(), stderr);
                if (colors_) std::fputs("\x1b[0m", stderr);
                std::fputc('\n', stderr);
                std::fflush(stderr);
            }
            if (file_ && lv >= file_level_.load()) {
                std::fputs(head, file_);
                std::fputs(msg.c_str(), file_);
                std::fputc('\n', file_);
                std::fflush(file_);
            }
        }
        catch (const std::exception&) {
            // allocation failed, drop the line
        }
    }

    void Logger::logf(Level lv, const char* file, int line, const char* func,
        const char* fmt, ...) noexcept {
        if (!enabled_any(lv)) return;
        std::va_list ap; va_start(ap, fmt);
        vlogf(lv, file, line, func, fmt, ap);
        va_end(ap);
    }

    void Logger::set_source_anchor(const char* name) {
        std::lock_guard<std::mutex> lk(m_);
        anchor_ = (name && *name) ? name : "TaskPool";
    }

    // Returns the part after the last "<anchor>/" segment, else the basename.
    const char* Logger::shorten_path_(const char* full) noexcept {
        if (!full) return "";

        const char* last_basename = full;
        const char* best = nullptr;
        const size_t an = anchor_.size();

        auto matches_anchor = [&](const char* q) {
            size_t i = 0;
            while (i < an && q[i] && q[i] == anchor_[i]) ++i;
            return i == an && q[i] == '/';
        };

        if (matches_anchor(full)) best = full + an + 1;
        for (const char* p = full; *p; ++p) {
            if (*p != '/') continue;
            const char* q = p + 1;
            if (*q) last_basename = q;
            if (matches_anchor(q)) best = q + an + 1;
        }
        return best ? best : last_basename;
    }

} // namespace taskpool::log
