#include "SandboxConfig.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

using taskpool::PoolConfigIO::TrimAndUnquote;

static bool parse_ulong(const std::string& val, unsigned long lo, unsigned long hi, unsigned long& out) {
    try {
        size_t used = 0;
        const unsigned long v = std::stoul(val, &used);
        if (used != val.size()) return false;
        out = std::clamp(v, lo, hi);
        return true;
    }
    catch (const std::logic_error&) {
        return false;
    }
}

bool load_demo_ini(AppState& s, const std::filesystem::path& ini_path)
{
    if (ini_path.empty()) return false;

    std::ifstream in(ini_path, std::ios::binary);
    if (!in) return false;

    std::string line, section;
    while (std::getline(in, line)) {
        auto t = TrimAndUnquote(line);
        if (t.empty() || t[0] == '#' || t[0] == ';') continue;
        if (t.front() == '[' && t.back() == ']') { section = t.substr(1, t.size() - 2); continue; }
        if (section != "demo") continue;

        auto eq = t.find('=');
        if (eq == std::string::npos) continue;
        auto key = TrimAndUnquote(t.substr(0, eq));
        auto val = TrimAndUnquote(t.substr(eq + 1));

        unsigned long v = 0;
        if (key == "inputs" && parse_ulong(val, 0, 100000, v))            s.inputs = v;
        else if (key == "steps" && parse_ulong(val, 1, 1000, v))          s.steps = static_cast<int>(v);
        else if (key == "max_step_ms" && parse_ulong(val, 0, 60000, v))   s.max_step_ms = static_cast<uint32_t>(v);
        else if (key == "pause_ms" && parse_ulong(val, 0, 600000, v))     s.pause_ms = static_cast<uint32_t>(v);
        else if (key == "rounds" && parse_ulong(val, 1, 100, v))          s.rounds = static_cast<int>(v);
    }
    return true;
}

bool append_demo_ini(const AppState& s, const std::filesystem::path& ini_path)
{
    if (ini_path.empty()) return false;

    std::ofstream out(ini_path, std::ios::binary | std::ios::app);
    if (!out) return false;

    out << "\n[demo]\n";
    out << "inputs=" << s.inputs << "\n";
    out << "steps=" << s.steps << "\n";
    out << "max_step_ms=" << s.max_step_ms << "\n";
    out << "pause_ms=" << s.pause_ms << "\n";
    out << "rounds=" << s.rounds << "\n";
    return static_cast<bool>(out);
}
