#pragma once
#include <filesystem>
#include "SandboxAppState.h"

// Reads the [demo] section; [runner]/[log] go through PoolConfigIO.
bool load_demo_ini(AppState& s, const std::filesystem::path& ini_path);

// Appends a [demo] section, meant to follow PoolConfigIO::Save on the same file.
bool append_demo_ini(const AppState& s, const std::filesystem::path& ini_path);
