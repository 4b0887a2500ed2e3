// TaskPoolSandbox.cpp : renders per-job progress of bounded runs on status lines
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "Config/PoolConfig.h"
#include "Runner/BlockingRun.h"
#include "Utils/Log.h"
#include "Utils/StatusLines.h"
#include "SandboxConfig.h"

namespace fs = std::filesystem;
using namespace taskpool;

// ------------------------- helpers ---------------------------
static fs::path find_exe_dir()
{
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    return ec ? fs::current_path() : exe.parent_path();
}

static bool load_or_create_config(AppState& g)
{
    std::string err;
    if (fs::exists(g.ini_path)) {
        auto cfg = PoolConfigIO::Load(g.ini_path, &err);
        if (!cfg) {
            std::cerr << "[cfg] " << err << "\n";
            return false;
        }
        g.pool = *cfg;
        load_demo_ini(g, g.ini_path);
        std::cout << "[cfg] loaded " << g.ini_path.string() << "\n";
    }
    else if (PoolConfigIO::Save(g.pool, g.ini_path, &err) && append_demo_ini(g, g.ini_path)) {
        std::cout << "[cfg] wrote defaults to " << g.ini_path.string() << "\n";
    }
    else {
        std::cerr << "[cfg] could not write " << g.ini_path.string() << ": " << err << "\n";
    }

    if (!PoolConfigIO::ApplyEnvOverrides(g.pool, &err)) std::cerr << "[cfg] " << err << "\n";
    return true;
}

static void init_logging(AppState& g)
{
    if (g.pool.log_file.empty()) {
        g.pool.log_file = g.exe_dir / "sandbox.log";
        if (g.pool.file_level == log::Level::Off) g.pool.file_level = log::Level::Debug;
    }
    apply_logging(g.pool);
    TPLOGI("[sandbox] Starting: %zu inputs, %zu at once, %d rounds", g.inputs, g.pool.max_at_once, g.rounds);
}

static std::string progress_text(int n, int step, int steps)
{
    const int pct = steps > 0 ? step * 100 / steps : 100;
    const char* color =
        pct < 30 ? nullptr :
        pct < 70 ? "\x1b[34m" :
        pct < 100 ? "\x1b[33m" :
        "\x1b[32m";

    std::string s = std::to_string(n) + ": ";
    if (color) s += color;
    s += std::to_string(pct) + "%";
    if (color) s += "\x1b[0m";
    return s;
}

// One round: every job draws its own line and walks through `steps` random sleeps.
static bool run_round(const AppState& g, utils::StatusLines& lines)
{
    std::vector<int> inputs(g.inputs);
    for (size_t i = 0; i < inputs.size(); ++i) inputs[i] = static_cast<int>(i + 1);

    BlockingJob<int, int> job = [&g, &lines](const int& n, size_t index) {
        const int line = static_cast<int>(index);
        lines.set_line(line, progress_text(n, 0, g.steps));

        std::mt19937 rng(std::random_device{}() ^ static_cast<uint32_t>(index));
        std::uniform_int_distribution<uint32_t> pause(0, g.max_step_ms);
        for (int step = 1; step <= g.steps; ++step) {
            std::this_thread::sleep_for(std::chrono::milliseconds(pause(rng)));
            lines.set_line(line, progress_text(n, step, g.steps));
        }
        return n;
    };

    try {
        auto stream = run_blocking<int, int>(job, g.pool.max_at_once, inputs);
        size_t seen = 0;
        for (auto& r : stream) {
            ++seen;
            TPLOGD("[sandbox] job %zu done (%zu/%zu)", r.index, seen, inputs.size());
        }
    }
    catch (const PoolError& e) {
        TPLOGE("[sandbox] round failed: %s", e.what());
        std::cerr << e.what() << "\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv)
{
    AppState g{};
    g.exe_dir = find_exe_dir();
    g.ini_path = argc > 1 ? fs::path(argv[1]) : PoolConfigIO::DefaultConfigPath();

    if (!load_or_create_config(g)) return 1;
    init_logging(g);

    utils::StatusLines lines;
    for (int round = 1; round <= g.rounds; ++round) {
        if (!run_round(g, lines)) return 2;

        if (round == g.rounds) break;
        std::printf("Round %d of %d completed. Next round starting in %.1f seconds.\n",
            round, g.rounds, g.pause_ms / 1000.0);
        std::fflush(stdout);
        std::this_thread::sleep_for(std::chrono::milliseconds(g.pause_ms));
        lines.reset();
    }

    std::printf("All done!\n");
    TPLOGI("[sandbox] Finished");
    return 0;
}
