#pragma once
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <atomic>

namespace taskpool::log {

    enum class Level : int { Trace = 0, Debug, Info, Warn, Error, Fatal, Off };

    const char* level_name(Level lv) noexcept;

    // Case-insensitive: trace, debug, info, warn/warning, error, fatal, off/none.
    std::optional<Level> parse_level(std::string_view s);

    class Logger {
    public:
        static Logger& get();

        void set_console_level(Level);
        void set_file_level(Level);
        void set_levels(Level console_lv, Level file_lv);
        Level console_level() const noexcept { return console_level_.load(); }
        Level file_level() const noexcept { return file_level_.load(); }

        bool open_file(const char* path, bool append = false);
        void close_file();
        void enable_colors(bool on);

        // printf-style core
        void logf(Level lv, const char* file, int line, const char* func,
            const char* fmt, ...) noexcept;

        // fast checks for macros
        bool enabled_console(Level lv) const noexcept { return lv >= console_level_.load(); }
        bool enabled_file(Level lv) const noexcept { return file_open_.load() && lv >= file_level_.load(); }
        bool enabled_any(Level lv) const noexcept { return enabled_console(lv) || enabled_file(lv); }

        void set_source_anchor(const char* name); // default "TaskPool"

    private:
        Logger() = default;
        ~Logger();
        void vlogf(Level, const char*, int, const char*, const char*, std::va_list) noexcept;
        const char* shorten_path_(const char* full) noexcept;

        // stdout belongs to the status lines, console output goes to stderr
        std::atomic<Level> console_level_{ Level::Warn };
        std::atomic<Level> file_level_{ Level::Off };
        std::atomic<bool> file_open_{ false };
        std::FILE* file_ = nullptr;
        bool colors_ = true;
        std::mutex m_;

        std::string anchor_ = "TaskPool";
    };

    // Internal macros for TaskPool sources
#define TPLOG_AT(lv, fmt, ...) do{ auto& L=::taskpool::log::Logger::get(); \
 if (L.enabled_any(lv)) L.logf(lv, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__); }while(0)

#define TPLOGT(fmt, ...) TPLOG_AT(::taskpool::log::Level::Trace, fmt, ##__VA_ARGS__)
#define TPLOGD(fmt, ...) TPLOG_AT(::taskpool::log::Level::Debug, fmt, ##__VA_ARGS__)
#define TPLOGI(fmt, ...) TPLOG_AT(::taskpool::log::Level::Info , fmt, ##__VA_ARGS__)
#define TPLOGW(fmt, ...) TPLOG_AT(::taskpool::log::Level::Warn , fmt, ##__VA_ARGS__)
#define TPLOGE(fmt, ...) TPLOG_AT(::taskpool::log::Level::Error, fmt, ##__VA_ARGS__)
#define TPLOGF(fmt, ...) TPLOG_AT(::taskpool::log::Level::Fatal, fmt, ##__VA_ARGS__)

} // namespace taskpool::log
