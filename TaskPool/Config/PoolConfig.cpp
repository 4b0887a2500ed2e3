#include "PoolConfig.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "../Utils/SafeEnv.h"

namespace taskpool {
    namespace {

        static inline std::filesystem::path MakeAbsoluteRelativeToFile(
            const std::filesystem::path& file, const std::filesystem::path& maybe_rel) {
            if (maybe_rel.is_absolute()) return maybe_rel;
            return std::filesystem::weakly_canonical(file.parent_path() / maybe_rel);
        }

        static inline std::string Lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
            return s;
        }

        static std::optional<size_t> ParseCount(const std::string& s) {
            if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
                return std::nullopt;
            try {
                const unsigned long v = std::stoul(s);
                if (v == 0) return std::nullopt;
                return static_cast<size_t>(v);
            }
            catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }

        static const char* LevelKey(log::Level lv) {
            switch (lv) {
            case log::Level::Trace: return "trace";
            case log::Level::Debug: return "debug";
            case log::Level::Info:  return "info";
            case log::Level::Warn:  return "warn";
            case log::Level::Error: return "error";
            case log::Level::Fatal: return "fatal";
            default:                return "off";
            }
        }

    } // namespace

    namespace PoolConfigIO {

        std::string TrimAndUnquote(std::string s) {
            auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), [&](unsigned char c) { return !is_space(c); }));
            s.erase(std::find_if(s.rbegin(), s.rend(), [&](unsigned char c) { return !is_space(c); }).base(), s.end());
            if (!s.empty() && (s.front() == '"' || s.front() == '\'')) {
                char q = s.front();
                if (s.size() >= 2 && s.back() == q) {
                    s = s.substr(1, s.size() - 2);
                }
            }
            return s;
        }

        std::optional<bool> ParseBool(const std::string& s) {
            const std::string v = Lower(TrimAndUnquote(s));
            if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
            if (v == "false" || v == "no" || v == "off" || v == "0") return false;
            return std::nullopt;
        }

        std::filesystem::path DefaultConfigPath() {
            const auto home = env::getenv_safe("HOME");
            std::filesystem::path base = (home && !home->empty()) ? std::filesystem::path(*home)
                : std::filesystem::current_path();
            return base / ".config" / "TaskPool" / "taskpool.ini";
        }

        std::optional<PoolConfig> Load(const std::filesystem::path& path, std::string* error_out) {
            std::ifstream ifs(path, std::ios::binary);
            if (!ifs) { if (error_out) *error_out = "Could not open config: " + path.string(); return std::nullopt; }

            std::string line;
            std::string section;
            PoolConfig cfg;
            int lineno = 0;

            auto bad = [&](const std::string& key, const std::string& val) {
                if (error_out) *error_out = path.string() + ":" + std::to_string(lineno) + ": bad value for "
                    + key + ": '" + val + "'";
                return std::nullopt;
            };

            while (std::getline(ifs, line)) {
                ++lineno;
                if (!line.empty() && line.back() == '\r') line.pop_back();

                std::string trimmed = TrimAndUnquote(line);
                if (trimmed.empty()) continue;
                if (trimmed[0] == '#' || trimmed[0] == ';') continue;

                if (trimmed.front() == '[' && trimmed.back() == ']') {
                    section = Lower(trimmed.substr(1, trimmed.size() - 2));
                    continue;
                }

                auto pos = trimmed.find('=');
                if (pos == std::string::npos) continue;
                std::string key = Lower(TrimAndUnquote(trimmed.substr(0, pos)));
                std::string val = TrimAndUnquote(trimmed.substr(pos + 1));

                if (section == "runner") {
                    if (key == "max_at_once") {
                        auto n = ParseCount(val);
                        if (!n) return bad(key, val);
                        cfg.max_at_once = *n;
                    }
                }
                else if (section == "log") {
                    if (key == "level" || key == "file_level") {
                        auto lv = log::parse_level(val);
                        if (!lv) return bad(key, val);
                        (key == "level" ? cfg.console_level : cfg.file_level) = *lv;
                    }
                    else if (key == "file") {
                        cfg.log_file = val.empty() ? std::filesystem::path()
                            : MakeAbsoluteRelativeToFile(path, std::filesystem::path(val));
                    }
                    else if (key == "colors") {
                        auto b = ParseBool(val);
                        if (!b) return bad(key, val);
                        cfg.log_colors = *b;
                    }
                }
            }
            return cfg;
        }

        bool Save(const PoolConfig& cfg, const std::filesystem::path& path, std::string* error_out) {
            try {
                if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
                std::ostringstream os;
                os << "# TaskPool configuration\n"
                    "\n[runner]\n";
                os << "max_at_once=" << cfg.max_at_once << "\n";
                os << "\n[log]\n";
                os << "level=" << LevelKey(cfg.console_level) << "\n";
                os << "file_level=" << LevelKey(cfg.file_level) << "\n";
                if (!cfg.log_file.empty()) os << "file=\"" << cfg.log_file.string() << "\"\n";
                os << "colors=" << (cfg.log_colors ? "true" : "false") << "\n";

                std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
                if (!ofs) { if (error_out) *error_out = "Could not open for write: " + path.string(); return false; }
                ofs << os.str();
                return static_cast<bool>(ofs);
            }
            catch (const std::exception& e) {
                if (error_out) *error_out = e.what();
                return false;
            }
        }

        bool ApplyEnvOverrides(PoolConfig& cfg, std::string* error_out) {
            bool ok = true;
            if (auto v = env::getenv_safe("TASKPOOL_MAX_AT_ONCE")) {
                if (auto n = ParseCount(TrimAndUnquote(*v))) cfg.max_at_once = *n;
                else {
                    ok = false;
                    if (error_out) *error_out = "TASKPOOL_MAX_AT_ONCE is not a positive integer: '" + *v + "'";
                }
            }
            if (auto v = env::getenv_safe("TASKPOOL_LOG_LEVEL")) {
                if (auto lv = log::parse_level(TrimAndUnquote(*v))) cfg.console_level = *lv;
                else {
                    ok = false;
                    if (error_out) *error_out = "TASKPOOL_LOG_LEVEL is not a log level: '" + *v + "'";
                }
            }
            return ok;
        }

    } // namespace PoolConfigIO

    void apply_logging(const PoolConfig& cfg) {
        auto& L = log::Logger::get();
        L.set_levels(cfg.console_level, cfg.file_level);
        L.enable_colors(cfg.log_colors);
        if (!cfg.log_file.empty() && cfg.file_level != log::Level::Off) {
            if (!L.open_file(cfg.log_file.string().c_str(), true))
                TPLOGW("could not open log file %s", cfg.log_file.string().c_str());
        }
        else {
            L.close_file();
        }
    }

} // namespace taskpool
