#pragma once
#include <cstdint>
#include <filesystem>
#include "Config/PoolConfig.h"

struct AppState {
	std::filesystem::path exe_dir;
	std::filesystem::path ini_path;
	taskpool::PoolConfig pool{ 20 };   // [runner] + [log]

	// [demo]
	size_t inputs{ 50 };
	int steps{ 10 };
	uint32_t max_step_ms{ 1000 };
	uint32_t pause_ms{ 3000 };
	int rounds{ 2 };
};
